#include "builder_options.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>

using nlohmann::json;

namespace {

template <typename T>
void read_key(const json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) target = it->get<T>();
}

void read_transport(const json& j, TransportOptions& t) {
    read_key(j, "user_agent", t.user_agent);
    read_key(j, "timeout_ms", t.timeout_ms);
    read_key(j, "proxy_url", t.proxy_url);
    read_key(j, "proxy_user", t.proxy_user);
    read_key(j, "proxy_password", t.proxy_password);
    read_key(j, "auth_user", t.auth_user);
    read_key(j, "auth_password", t.auth_password);
    read_key(j, "keep_cookies", t.keep_cookies);
    read_key(j, "default_charset", t.default_charset);
}

} // namespace

BuilderOptions BuilderOptions::load(const std::string& path) {
    BuilderOptions options;
    if (!std::filesystem::exists(path)) {
        std::cerr << "[BuilderOptions] Settings file not found: " << path << std::endl;
        return options;
    }

    try {
        std::ifstream f(path);
        json j;
        f >> j;

        BuilderOptions loaded;
        read_key(j, "add_web_mark", loaded.add_web_mark);
        read_key(j, "strip_scripts", loaded.strip_scripts);
        read_key(j, "strip_iframes", loaded.strip_iframes);
        read_key(j, "allow_recursion", loaded.allow_recursion);
        read_key(j, "max_concurrency", loaded.max_concurrency);
        read_key(j, "verbose", loaded.verbose);
        read_key(j, "write_manifest", loaded.write_manifest);
        auto enc = j.find("forced_encoding");
        if (enc != j.end() && enc->is_string()) loaded.forced_encoding = enc->get<std::string>();
        auto transport = j.find("transport");
        if (transport != j.end() && transport->is_object()) read_transport(*transport, loaded.transport);

        if (loaded.max_concurrency < 1) loaded.max_concurrency = 1;
        options = loaded;
    } catch (const std::exception& e) {
        std::cerr << "[BuilderOptions] Error reading " << path << ": " << e.what() << std::endl;
    }
    return options;
}
