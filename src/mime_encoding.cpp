#include "mime_encoding.hpp"

namespace {

const char* const kHexDigits = "0123456789ABCDEF";

void append_escaped(std::string& out, unsigned value) {
    out.push_back('=');
    out.push_back(kHexDigits[(value >> 4) & 0x0F]);
    out.push_back(kHexDigits[value & 0x0F]);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

std::string MimeEncoding::quoted_printable_encode(const std::string& text, const TextEncoding& encoding) {
    if (text.empty()) return {};

    const std::string softBreak = "=\r\n";
    std::string out;
    out.reserve(text.size() + text.size() / 8);
    size_t lineLength = 0;
    size_t lastSpace = 0;   // output position just past the last literal space, 0 = none

    for (char32_t c : encoding.decode(text)) {
        if (c == 61 || c > 126) {
            if (c <= 255) {
                append_escaped(out, static_cast<unsigned>(c));
                lineLength += 3;
            } else {
                for (char b : encoding.encode(c)) {
                    append_escaped(out, static_cast<unsigned char>(b));
                    lineLength += 3;
                }
            }
        } else {
            out.push_back(static_cast<char>(c));
            if (c == '\n') {
                lineLength = 0;
                lastSpace = 0;
                continue;
            }
            if (c != '\r') ++lineLength;
            if (c == ' ') lastSpace = out.size();
        }

        if (lineLength >= kQuotedPrintableLineLength) {
            if (lastSpace == 0) {
                out += softBreak;
                lineLength = 0;
            } else {
                out.insert(lastSpace, softBreak);
                lineLength = out.size() - (lastSpace + softBreak.size());
            }
            lastSpace = 0;
        }
    }

    // trailing whitespace must be escaped
    if (!out.empty() && out.back() == ' ') {
        out.pop_back();
        out += "=20";
    }
    return out;
}

std::string MimeEncoding::quoted_printable_decode(const std::string& encoded) {
    std::string out;
    out.reserve(encoded.size());
    size_t i = 0;
    while (i < encoded.size()) {
        char c = encoded[i];
        if (c != '=') {
            out.push_back(c);
            ++i;
            continue;
        }
        if (i + 2 < encoded.size() && encoded[i + 1] == '\r' && encoded[i + 2] == '\n') {
            i += 3;
            continue;
        }
        if (i + 1 < encoded.size() && encoded[i + 1] == '\n') {
            i += 2;
            continue;
        }
        if (i + 2 < encoded.size()) {
            int hi = hex_value(encoded[i + 1]);
            int lo = hex_value(encoded[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 3;
                continue;
            }
        }
        out.push_back(c);
        ++i;
    }
    return out;
}

std::string MimeEncoding::base64_encode(const std::string& data) {
    static const char* tbl = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    size_t i = 0, n = data.size();
    out.reserve(((n + 2) / 3) * 4);
    auto byte = [&](size_t k) { return static_cast<unsigned>(static_cast<unsigned char>(data[k])); };
    while (i + 2 < n) {
        unsigned v = (byte(i) << 16) | (byte(i + 1) << 8) | byte(i + 2);
        out.push_back(tbl[(v >> 18) & 63]);
        out.push_back(tbl[(v >> 12) & 63]);
        out.push_back(tbl[(v >> 6) & 63]);
        out.push_back(tbl[v & 63]);
        i += 3;
    }
    if (i + 1 == n) {
        unsigned v = (byte(i) << 16);
        out.push_back(tbl[(v >> 18) & 63]);
        out.push_back(tbl[(v >> 12) & 63]);
        out.push_back('=');
        out.push_back('=');
    } else if (i + 2 == n) {
        unsigned v = (byte(i) << 16) | (byte(i + 1) << 8);
        out.push_back(tbl[(v >> 18) & 63]);
        out.push_back(tbl[(v >> 12) & 63]);
        out.push_back(tbl[(v >> 6) & 63]);
        out.push_back('=');
    }
    return out;
}

std::vector<std::string> MimeEncoding::base64_lines(const std::string& data) {
    std::vector<std::string> lines;
    for (size_t pos = 0; pos < data.size(); pos += kBase64ChunkSize) {
        lines.push_back(base64_encode(data.substr(pos, kBase64ChunkSize)));
    }
    return lines;
}
