#pragma once

#include "text_encoding.hpp"

#include <string>

// Pattern-based helpers over raw HTML text. No parsing, no DOM.
class HtmlText {
public:
    // Removes every <tagName ...> ... </tagName> block, case-insensitive.
    static std::string strip_tag(const std::string& html, const std::string& tagName);

    // Text of the first <title> element, or "" when there is none.
    static std::string title(const std::string& html);

    // Replaces character references; numeric ones are written in enc.
    static std::string decode_entities(const std::string& text, const TextEncoding& enc);

    // Drops scripts, styles and tags, then decodes entities.
    static std::string to_plain_text(const std::string& html, const TextEncoding& enc, bool collapseWhitespace = false);
};
