#pragma once

#include <optional>
#include <string>

class UrlResolver {
public:
    struct Parts {
        std::string root;     // scheme://host
        std::string folder;   // everything up to the last '/' of the path
    };

    // Canonical absolute form: lowercased scheme and host, default port
    // dropped, dot segments removed, empty path turned into "/", fragment
    // stripped. Throws InvalidUrlError when raw is not a well-formed URI.
    static std::string resolve(const std::string& raw);

    static Parts decompose(const std::string& url);

    // Resolves ref against base the way a browser would for href values.
    static std::string join(const std::string& base, const std::string& ref);

    // True for http:// and https:// URLs with a host, case-insensitive.
    static bool is_absolute_http(const std::string& url);

private:
    struct UrlParts {
        std::string scheme;
        std::string authority;
        std::string path;
        std::string query;
    };

    static std::optional<UrlParts> parse_url(const std::string& url);
    static std::string normalize_authority(const std::string& scheme, const std::string& authority);
    static std::string remove_dot_segments(const std::string& path);
};
