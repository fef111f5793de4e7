#include "http_transport.hpp"

#include "content_classifier.hpp"
#include "errors.hpp"
#include "url_resolver.hpp"

#include <ctime>
#include <regex>
#include <utility>

namespace {

// meta declarations live in <head>; no need to scan a whole document
const size_t kMetaScanLength = 8192;

std::string header_value(const cpr::Header& header, const std::string& name) {
    auto it = header.find(name);
    return it == header.end() ? std::string() : it->second;
}

} // namespace

// -------------------- ctor --------------------
HttpTransport::HttpTransport(TransportOptions options) : options_(std::move(options)) {}

// -------------------- small utils --------------------
std::string HttpTransport::http_date(TimePoint when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm gmt{};
    gmtime_r(&t, &gmt);
    char text[64];
    std::strftime(text, sizeof(text), "%a, %d %b %Y %H:%M:%S GMT", &gmt);
    return text;
}

std::string HttpTransport::detect_charset(const std::string& contentType, const std::string& body) {
    static const std::regex headerRe(R"(charset\s*=\s*["']?([^"';\s]+))", std::regex::icase);
    static const std::regex metaRe(R"(<meta[^>]+charset\s*=\s*["']?([^"'\s/>;]+))", std::regex::icase);

    std::smatch m;
    if (std::regex_search(contentType, m, headerRe)) return m[1].str();
    if (!ContentClassifier::is_html(contentType)) return {};

    const std::string head = body.substr(0, kMetaScanLength);
    if (std::regex_search(head, m, metaRe)) return m[1].str();
    return {};
}

// Content-Location header when the server sends one, else the URL a redirect ended on.
std::string HttpTransport::content_location(const std::string& requested, const cpr::Response& r) const {
    std::string location = header_value(r.header, "Content-Location");
    if (!location.empty()) {
        try {
            return UrlResolver::join(requested, location);
        } catch (const InvalidUrlError&) {
            return {};
        }
    }

    const std::string finalUrl = r.url.str();
    if (finalUrl.empty() || finalUrl == requested) return {};
    try {
        std::string resolved = UrlResolver::resolve(finalUrl);
        return resolved == requested ? std::string() : resolved;
    } catch (const InvalidUrlError&) {
        return {};
    }
}

// -------------------- network --------------------
FetchResult HttpTransport::fetch(const std::string& url, const std::optional<TimePoint>& ifModifiedSince) {
    cpr::Session session;
    session.SetUrl(cpr::Url{url});

    cpr::Header hdr{{"User-Agent", options_.user_agent}};
    if (ifModifiedSince) hdr["If-Modified-Since"] = http_date(*ifModifiedSince);
    session.SetHeader(hdr);
    session.SetTimeout(cpr::Timeout{options_.timeout_ms});
    session.SetRedirect(cpr::Redirect{true});
    session.SetAcceptEncoding(cpr::AcceptEncoding{{cpr::AcceptEncodingMethods::gzip, cpr::AcceptEncodingMethods::deflate}});

    if (!options_.proxy_url.empty()) {
        std::string proxy = options_.proxy_url;
        // libcurl takes proxy credentials inside the proxy URL
        if (!options_.proxy_user.empty()) {
            auto scheme = proxy.find("://");
            size_t at = scheme == std::string::npos ? 0 : scheme + 3;
            proxy.insert(at, options_.proxy_user + ":" + options_.proxy_password + "@");
        }
        session.SetProxies(cpr::Proxies{{"http", proxy}, {"https", proxy}});
    }
    if (!options_.auth_user.empty()) {
        session.SetAuth(cpr::Authentication{options_.auth_user, options_.auth_password, cpr::AuthMode::BASIC});
    }
    if (options_.keep_cookies) {
        std::lock_guard<std::mutex> lk(cookies_mtx_);
        session.SetCookies(cookies_);
    }

    cpr::Response r = session.Get();

    if (r.error) throw TransportError(url, 0, r.error.message);
    if (r.status_code == 304) throw TransportError(url, r.status_code, "Not modified since the given date");
    if (r.status_code < 200 || r.status_code >= 300) {
        throw TransportError(url, r.status_code, "HTTP status " + std::to_string(r.status_code));
    }

    if (options_.keep_cookies) {
        std::lock_guard<std::mutex> lk(cookies_mtx_);
        for (const auto& cookie : r.cookies) cookies_.push_back(cookie);
    }

    FetchResult result;
    result.status = r.status_code;
    result.content_type = header_value(r.header, "Content-Type");
    result.content_location = content_location(url, r);
    result.is_binary = ContentClassifier::is_binary(result.content_type);
    if (!result.is_binary) {
        result.charset = detect_charset(result.content_type, r.text);
        if (result.charset.empty()) result.charset = options_.default_charset;
    }
    result.bytes = std::move(r.text);
    return result;
}
