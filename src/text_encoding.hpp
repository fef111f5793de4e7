#pragma once

#include <optional>
#include <string>

// One of the ASCII-compatible charsets a saved page can be labelled with.
class TextEncoding {
public:
    enum class Kind { Utf8, Windows1252, Latin1, Ascii };

    explicit TextEncoding(Kind kind = Kind::Windows1252) : kind_(kind) {}

    // Accepts the usual charset labels ("UTF-8", "latin1", "cp1252", ...).
    static std::optional<TextEncoding> from_charset(const std::string& name);

    static TextEncoding default_encoding() { return TextEncoding(Kind::Windows1252); }

    Kind kind() const { return kind_; }
    const char* web_name() const;

    // Malformed UTF-8 bytes decode to the code point equal to the byte value.
    std::u32string decode(const std::string& bytes) const;

    // Code points the charset cannot represent become '?'.
    std::string encode(char32_t codePoint) const;
    std::string encode(const std::u32string& text) const;

    bool operator==(const TextEncoding& other) const { return kind_ == other.kind_; }
    bool operator!=(const TextEncoding& other) const { return kind_ != other.kind_; }

private:
    Kind kind_;
};
