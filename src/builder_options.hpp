#pragma once

#include <optional>
#include <string>

struct TransportOptions {
    // browser identification of vanilla IE6 on XP SP2; many sites serve simpler markup to it
    std::string user_agent = "Mozilla/4.0 (compatible; MSIE 6.0; Windows NT 5.1; SV1)";
    int timeout_ms = 60000;

    // if set, the proxy is always used
    std::string proxy_url;
    std::string proxy_user;
    std::string proxy_password;

    // basic authentication for the target site, sent only when auth_user is set
    std::string auth_user;
    std::string auth_password;

    bool keep_cookies = false;
    std::string default_charset = "windows-1252";
};

struct BuilderOptions {
    // prefix saved HTML with <!-- saved from url=(NNNN)... -->
    bool add_web_mark = true;
    bool strip_scripts = false;
    bool strip_iframes = false;
    // follow references of embedded HTML/CSS (frames, imported stylesheets)
    bool allow_recursion = true;
    // force one charset for every text resource instead of the detected one
    std::optional<std::string> forced_encoding;
    // sibling fetches in flight at once; 1 keeps the crawl strictly sequential
    int max_concurrency = 1;
    bool verbose = false;
    bool write_manifest = false;

    TransportOptions transport;

    // Missing keys keep their defaults. A missing or malformed file is
    // reported on stderr and yields the defaults.
    static BuilderOptions load(const std::string& path);
};
