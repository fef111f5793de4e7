#pragma once

#include "builder_options.hpp"
#include "transport.hpp"

#include <cpr/cpr.h>

#include <mutex>
#include <optional>
#include <string>

// Transport over cpr/libcurl. Safe to share between threads: every fetch
// runs its own session; only the cookie jar is shared.
class HttpTransport : public Transport {
public:
    explicit HttpTransport(TransportOptions options);

    using Transport::fetch;
    FetchResult fetch(const std::string& url, const std::optional<TimePoint>& ifModifiedSince) override;

    // charset= of a Content-Type value, else a <meta> declaration in the body.
    static std::string detect_charset(const std::string& contentType, const std::string& body);
    // RFC 1123 date in GMT, as sent in If-Modified-Since.
    static std::string http_date(TimePoint when);

private:
    std::string content_location(const std::string& requested, const cpr::Response& r) const;

    TransportOptions options_;
    cpr::Cookies cookies_;
    std::mutex cookies_mtx_;
};
