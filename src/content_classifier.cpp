#include "content_classifier.hpp"

#include "string_util.hpp"

#include <unordered_map>

namespace {

bool contains_icase(const std::string& haystack, const std::string& needle) {
    return StringUtil::to_lower(haystack).find(needle) != std::string::npos;
}

} // namespace

bool ContentClassifier::is_binary(const std::string& contentType) {
    if (contentType.empty()) return false;
    return !contains_icase(contentType, "text");
}

bool ContentClassifier::is_html(const std::string& contentType) {
    return contains_icase(contentType, "text/html");
}

bool ContentClassifier::is_css(const std::string& contentType) {
    return contains_icase(contentType, "text/css");
}

std::string ContentClassifier::media_type(const std::string& contentType) {
    auto end = contentType.find_first_of(" ;");
    return StringUtil::to_lower(contentType.substr(0, end));
}

std::string ContentClassifier::extension_for(const std::string& contentType) {
    static const std::unordered_map<std::string, std::string> kExtensions = {
        {"text/html", ".htm"},
        {"image/gif", ".gif"},
        {"image/jpeg", ".jpg"},
        {"text/javascript", ".js"},
        {"application/x-javascript", ".js"},
        {"application/javascript", ".js"},
        {"image/x-png", ".png"},
        {"image/png", ".png"},
        {"image/svg+xml", ".svg"},
        {"image/x-icon", ".ico"},
        {"text/css", ".css"},
        {"text/plain", ".txt"},
    };
    auto it = kExtensions.find(media_type(contentType));
    if (it == kExtensions.end()) return ".htm";
    return it->second;
}
