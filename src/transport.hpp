#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

// What the network hands back for one URL. Decompression and charset
// sniffing have already been applied.
struct FetchResult {
    std::string bytes;
    std::string content_type;
    std::string content_location;   // authoritative server location, empty if none
    std::string charset;            // detected charset name, empty for binary content
    bool is_binary = false;
    long status = 0;
};

class TransportError : public std::runtime_error {
public:
    TransportError(std::string url, long status, const std::string& message)
        : std::runtime_error(message), url_(std::move(url)), status_(status) {}

    const std::string& url() const { return url_; }
    long status() const { return status_; }

private:
    std::string url_;
    long status_;
};

class Transport {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~Transport() = default;

    // Throws TransportError on network failure, non-2xx status, or 304.
    virtual FetchResult fetch(const std::string& url, const std::optional<TimePoint>& ifModifiedSince) = 0;

    FetchResult fetch(const std::string& url) { return fetch(url, std::nullopt); }
};
