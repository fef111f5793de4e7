#include "text_encoding.hpp"

#include <cctype>
#include <unordered_map>

namespace {

// windows-1252 0x80..0x9F; the five unassigned bytes map to themselves
const char32_t kWindows1252High[32] = {
    0x20AC, 0x0081, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x008D, 0x017D, 0x008F,
    0x0090, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x009D, 0x017E, 0x0178,
};

std::u32string decode_utf8(const std::string& bytes) {
    std::u32string out;
    out.reserve(bytes.size());
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        int extra = 0;
        char32_t cp = 0;
        if (c < 0x80) {
            out.push_back(c);
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            out.push_back(c);
            ++i;
            continue;
        }
        if (i + extra >= n) {
            // truncated sequence
            out.push_back(c);
            ++i;
            continue;
        }
        bool valid = true;
        for (int k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!valid) {
            out.push_back(c);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

void encode_utf8(char32_t cp, std::string& out) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x110000) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back('?');
    }
}

} // namespace

std::optional<TextEncoding> TextEncoding::from_charset(const std::string& name) {
    static const std::unordered_map<std::string, Kind> kLabels = {
        {"utf-8", Kind::Utf8},
        {"utf8", Kind::Utf8},
        {"unicode-1-1-utf-8", Kind::Utf8},
        {"windows-1252", Kind::Windows1252},
        {"cp1252", Kind::Windows1252},
        {"x-cp1252", Kind::Windows1252},
        {"iso-8859-1", Kind::Latin1},
        {"iso8859-1", Kind::Latin1},
        {"iso_8859-1", Kind::Latin1},
        {"latin1", Kind::Latin1},
        {"l1", Kind::Latin1},
        {"us-ascii", Kind::Ascii},
        {"ascii", Kind::Ascii},
    };

    std::string key;
    for (char c : name) {
        if (c == '"' || c == '\'' || std::isspace(static_cast<unsigned char>(c))) continue;
        key += static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    auto it = kLabels.find(key);
    if (it == kLabels.end()) return std::nullopt;
    return TextEncoding(it->second);
}

const char* TextEncoding::web_name() const {
    switch (kind_) {
        case Kind::Utf8: return "utf-8";
        case Kind::Windows1252: return "windows-1252";
        case Kind::Latin1: return "iso-8859-1";
        case Kind::Ascii: return "us-ascii";
    }
    return "windows-1252";
}

std::u32string TextEncoding::decode(const std::string& bytes) const {
    if (kind_ == Kind::Utf8) return decode_utf8(bytes);

    std::u32string out;
    out.reserve(bytes.size());
    for (char c : bytes) {
        unsigned char b = static_cast<unsigned char>(c);
        if (kind_ == Kind::Windows1252 && b >= 0x80 && b <= 0x9F) {
            out.push_back(kWindows1252High[b - 0x80]);
        } else {
            out.push_back(b);
        }
    }
    return out;
}

std::string TextEncoding::encode(char32_t codePoint) const {
    std::string out;
    switch (kind_) {
        case Kind::Utf8:
            encode_utf8(codePoint, out);
            break;
        case Kind::Ascii:
            out.push_back(codePoint < 0x80 ? static_cast<char>(codePoint) : '?');
            break;
        case Kind::Latin1:
            out.push_back(codePoint < 0x100 ? static_cast<char>(codePoint) : '?');
            break;
        case Kind::Windows1252:
            if (codePoint < 0x80 || (codePoint >= 0xA0 && codePoint < 0x100)) {
                out.push_back(static_cast<char>(codePoint));
            } else {
                char mapped = '?';
                for (int i = 0; i < 32; ++i) {
                    if (kWindows1252High[i] == codePoint) {
                        mapped = static_cast<char>(0x80 + i);
                        break;
                    }
                }
                out.push_back(mapped);
            }
            break;
    }
    return out;
}

std::string TextEncoding::encode(const std::u32string& text) const {
    std::string out;
    out.reserve(text.size());
    for (char32_t cp : text) out += encode(cp);
    return out;
}
