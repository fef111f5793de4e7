#include "url_resolver.hpp"

#include "errors.hpp"
#include "string_util.hpp"

#include <cctype>
#include <regex>
#include <vector>

std::optional<UrlResolver::UrlParts> UrlResolver::parse_url(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/?#]+)([^?#]*)(\?[^#]*)?(#.*)?$)");
    std::smatch m;
    if (!std::regex_match(url, m, re)) return std::nullopt;
    UrlParts p;
    p.scheme = StringUtil::to_lower(m[1].str());
    p.authority = m[2].str();
    p.path = m[3].str();
    p.query = m[4].matched ? m[4].str() : std::string();
    return p;
}

std::string UrlResolver::normalize_authority(const std::string& scheme, const std::string& authority) {
    std::string userinfo;
    std::string hostport = authority;
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        userinfo = authority.substr(0, at + 1);
        hostport = authority.substr(at + 1);
    }

    std::string host = hostport;
    std::string port;
    // skip over IPv6 literals when looking for the port separator
    auto bracket = hostport.rfind(']');
    auto colon = hostport.rfind(':');
    if (colon != std::string::npos && (bracket == std::string::npos || colon > bracket)) {
        host = hostport.substr(0, colon);
        port = hostport.substr(colon + 1);
        for (char c : port) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return {};
        }
    }
    if (host.empty()) return {};
    for (char c : host) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) || uc < 0x20 || c == '<' || c == '>' || c == '"' || c == '\\') return {};
    }

    host = StringUtil::to_lower(host);
    if ((scheme == "http" && port == "80") || (scheme == "https" && port == "443")) port.clear();
    return userinfo + host + (port.empty() ? "" : ":" + port);
}

std::string UrlResolver::remove_dot_segments(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = (!path.empty() && path[0] == '/') ? 1 : 0;
    while (true) {
        auto slash = path.find('/', start);
        segments.push_back(path.substr(start, slash == std::string::npos ? std::string::npos : slash - start));
        if (slash == std::string::npos) break;
        start = slash + 1;
    }

    std::vector<std::string> out;
    bool trailingSlash = false;
    for (size_t i = 0; i < segments.size(); ++i) {
        const std::string& seg = segments[i];
        bool last = (i + 1 == segments.size());
        if (seg == ".") {
            trailingSlash = last;
            continue;
        }
        if (seg == "..") {
            if (!out.empty()) out.pop_back();
            trailingSlash = last;
            continue;
        }
        out.push_back(seg);
    }

    std::string result;
    for (const auto& seg : out) result += "/" + seg;
    if (result.empty() || (trailingSlash && result.back() != '/')) result += "/";
    return result;
}

std::string UrlResolver::resolve(const std::string& raw) {
    auto a = raw.find_first_not_of(" \t\r\n");
    auto b = raw.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) throw InvalidUrlError(raw);
    std::string url = raw.substr(a, b - a + 1);

    std::string escaped;
    escaped.reserve(url.size());
    for (char c : url) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == ' ') {
            escaped += "%20";
        } else if (uc < 0x20 || uc == 0x7f) {
            throw InvalidUrlError(raw);
        } else {
            escaped += c;
        }
    }

    auto parts = parse_url(escaped);
    if (!parts) throw InvalidUrlError(raw);

    std::string authority = normalize_authority(parts->scheme, parts->authority);
    if (authority.empty()) throw InvalidUrlError(raw);

    std::string path = parts->path;
    for (auto& ch : path) {
        if (ch == '\\') ch = '/';
    }
    path = remove_dot_segments(path);

    // fragment (if any) is dropped here: parse_url never puts it in path or query
    return parts->scheme + "://" + authority + path + parts->query;
}

UrlResolver::Parts UrlResolver::decompose(const std::string& url) {
    static const std::regex rootRe(R"(https?://[^/'"]+)", std::regex::icase);
    Parts parts;
    std::smatch m;
    if (std::regex_search(url, m, rootRe)) parts.root = m[0].str();

    std::string beforeQuery = url.substr(0, url.find('?'));
    auto slash = beforeQuery.rfind('/');
    if (slash != std::string::npos && slash > 7) {
        parts.folder = beforeQuery.substr(0, slash);
    } else {
        parts.folder = parts.root;
    }
    return parts;
}

std::string UrlResolver::join(const std::string& base, const std::string& ref) {
    if (ref.empty()) return resolve(base);
    if (parse_url(ref)) return resolve(ref);

    auto baseParts = parse_url(base);
    if (!baseParts) throw InvalidUrlError(base);

    // protocol-relative
    if (ref.size() > 1 && ref[0] == '/' && ref[1] == '/') return resolve(baseParts->scheme + ":" + ref);

    Parts p = decompose(base);
    if (ref[0] == '/') return resolve(p.root + ref);
    return resolve(p.folder + "/" + ref);
}

bool UrlResolver::is_absolute_http(const std::string& url) {
    static const std::regex re(R"(^https?://\w+)", std::regex::icase);
    return std::regex_search(url, re);
}
