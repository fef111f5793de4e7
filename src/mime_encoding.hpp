#pragma once

#include "text_encoding.hpp"

#include <string>
#include <vector>

class MimeEncoding {
public:
    // Raw bytes per base64 line; 57 bytes expand to 76 characters.
    static constexpr size_t kBase64ChunkSize = 57;
    // Visible characters after which a quoted-printable line is broken.
    static constexpr size_t kQuotedPrintableLineLength = 73;

    // `text` holds bytes in `encoding`. Characters '=' and above '~' are
    // escaped as =HH of their code point; code points above 0xFF are escaped
    // byte by byte in `encoding`. Long lines get a soft break (=CRLF) after the
    // last space of the line, or at the current position when there is none.
    static std::string quoted_printable_encode(const std::string& text, const TextEncoding& encoding);
    static std::string quoted_printable_decode(const std::string& encoded);

    static std::string base64_encode(const std::string& data);
    // One entry per kBase64ChunkSize slice of data; the last slice may be shorter.
    static std::vector<std::string> base64_lines(const std::string& data);
};
