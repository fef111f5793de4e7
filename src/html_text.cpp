#include "html_text.hpp"

#include "string_util.hpp"

#include <cctype>
#include <cstdlib>
#include <regex>
#include <unordered_map>

namespace {

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == ':';
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Length of the tag opening at s[pos] == '<', or 0 when there is none. A tag
// whose attributes are all quoted may carry '>' inside the quotes; any other
// tag ends at the first '>'.
size_t tag_length(const std::string& s, size_t pos) {
    size_t i = pos + 1;
    if (i < s.size() && is_word_char(s[i])) {
        while (i < s.size() && is_word_char(s[i])) ++i;
        for (;;) {
            size_t j = i;
            while (j < s.size() && is_space(s[j])) ++j;
            if (j == i) break;
            const size_t nameStart = j;
            while (j < s.size() && (is_word_char(s[j]) || s[j] == '-')) ++j;
            if (j == nameStart) break;
            while (j < s.size() && is_space(s[j])) ++j;
            if (j >= s.size() || s[j] != '=') break;
            ++j;
            while (j < s.size() && is_space(s[j])) ++j;
            if (j >= s.size() || (s[j] != '"' && s[j] != '\'')) break;
            const size_t close = s.find(s[j], j + 1);
            if (close == std::string::npos) break;
            i = close + 1;
        }
        while (i < s.size() && is_space(s[i])) ++i;
        while (i < s.size() && s[i] == '/') ++i;
        if (i < s.size() && s[i] == '>') return i + 1 - pos;
    }
    const size_t close = s.find('>', pos + 1);
    if (close == std::string::npos || close == pos + 1) return 0;
    return close + 1 - pos;
}

// Each tag becomes a single space.
std::string replace_tags(const std::string& html) {
    std::string out;
    out.reserve(html.size());
    size_t pos = 0;
    while (pos < html.size()) {
        const size_t lt = html.find('<', pos);
        if (lt == std::string::npos) {
            out.append(html, pos, std::string::npos);
            break;
        }
        out.append(html, pos, lt - pos);
        const size_t len = tag_length(html, lt);
        if (len == 0) {
            out.push_back('<');
            pos = lt + 1;
        } else {
            out.push_back(' ');
            pos = lt + len;
        }
    }
    return out;
}

} // namespace

std::string HtmlText::strip_tag(const std::string& html, const std::string& tagName) {
    const std::string lower = StringUtil::to_lower(html);
    const std::string open = "<" + StringUtil::to_lower(tagName);
    const std::string close = "</" + StringUtil::to_lower(tagName) + ">";

    std::string out;
    out.reserve(html.size());
    size_t pos = 0;
    while (pos < html.size()) {
        size_t start = lower.find(open, pos);
        while (start != std::string::npos && start + open.size() < lower.size() &&
               is_name_char(lower[start + open.size()])) {
            start = lower.find(open, start + open.size());
        }
        if (start == std::string::npos) break;
        size_t openEnd = lower.find('>', start);
        if (openEnd == std::string::npos) break;
        size_t end = lower.find(close, openEnd + 1);
        if (end == std::string::npos) break;
        out.append(html, pos, start - pos);
        pos = end + close.size();
    }
    if (pos < html.size()) out.append(html, pos, std::string::npos);
    return out;
}

std::string HtmlText::title(const std::string& html) {
    static const std::regex re(R"(<title[^>]*?>([^<]+)</title>)", std::regex::icase);
    std::smatch m;
    if (std::regex_search(html, m, re)) return m[1].str();
    return {};
}

std::string HtmlText::decode_entities(const std::string& text, const TextEncoding& enc) {
    static const std::unordered_map<std::string, char32_t> kNamed = {
        {"amp", U'&'}, {"lt", U'<'}, {"gt", U'>'}, {"quot", U'"'}, {"apos", U'\''},
        {"nbsp", 0xA0}, {"copy", 0xA9}, {"reg", 0xAE},
    };

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            out.push_back(text[i++]);
            continue;
        }
        size_t semi = text.find(';', i + 1);
        if (semi == std::string::npos || semi - i > 10 || semi == i + 1) {
            out.push_back(text[i++]);
            continue;
        }
        std::string name = text.substr(i + 1, semi - i - 1);
        bool decoded = false;
        if (name[0] == '#') {
            bool hex = name.size() > 1 && (name[1] == 'x' || name[1] == 'X');
            std::string digits = name.substr(hex ? 2 : 1);
            bool ok = !digits.empty();
            for (char c : digits) {
                if (hex ? !std::isxdigit(static_cast<unsigned char>(c)) : !std::isdigit(static_cast<unsigned char>(c))) {
                    ok = false;
                    break;
                }
            }
            if (ok) {
                unsigned long cp = std::strtoul(digits.c_str(), nullptr, hex ? 16 : 10);
                if (cp > 0 && cp < 0x110000) {
                    out += enc.encode(static_cast<char32_t>(cp));
                    decoded = true;
                }
            }
        } else {
            auto it = kNamed.find(name);
            if (it != kNamed.end()) {
                out += enc.encode(it->second);
                decoded = true;
            }
        }
        if (decoded) {
            i = semi + 1;
        } else {
            out.push_back(text[i++]);
        }
    }
    return out;
}

std::string HtmlText::to_plain_text(const std::string& html, const TextEncoding& enc, bool collapseWhitespace) {
    std::string text = strip_tag(html, "script");
    text = strip_tag(text, "style");
    text = replace_tags(text);
    text = decode_entities(text, enc);

    if (collapseWhitespace) {
        static const std::regex controlRe(R"([\n\r\f\t])");
        static const std::regex spacesRe(" {2,}");
        text = std::regex_replace(text, controlRe, " ");
        text = std::regex_replace(text, spacesRe, " ");
    }
    return text;
}
