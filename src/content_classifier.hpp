#pragma once

#include <string>

class ContentClassifier {
public:
    // Anything whose content type does not mention "text" is binary. An empty
    // content type is treated as text.
    static bool is_binary(const std::string& contentType);
    static bool is_html(const std::string& contentType);
    static bool is_css(const std::string& contentType);

    // File extension (with the dot) for a content type; ".htm" when unknown.
    static std::string extension_for(const std::string& contentType);

    // "text/html; charset=utf-8" -> "text/html"
    static std::string media_type(const std::string& contentType);
};
