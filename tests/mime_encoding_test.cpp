#include "mime_encoding.hpp"

#include <gtest/gtest.h>

namespace {

const TextEncoding kLatin1(TextEncoding::Kind::Latin1);

} // namespace

TEST(QuotedPrintableTest, EmptyInput) {
    EXPECT_EQ(MimeEncoding::quoted_printable_encode("", kLatin1), "");
}

TEST(QuotedPrintableTest, EscapesEqualsAndHighCharacters) {
    EXPECT_EQ(MimeEncoding::quoted_printable_encode("a=b", kLatin1), "a=3Db");
    EXPECT_EQ(MimeEncoding::quoted_printable_encode("caf\xE9~", kLatin1), "caf=E9~");
}

TEST(QuotedPrintableTest, CodePointsAboveLatin1AreEscapedPerByte) {
    const TextEncoding utf8(TextEncoding::Kind::Utf8);
    // U+20AC in UTF-8 is E2 82 AC
    EXPECT_EQ(MimeEncoding::quoted_printable_encode("\xE2\x82\xAC", utf8), "=E2=82=AC");
    // U+00E9 is escaped by its own value
    EXPECT_EQ(MimeEncoding::quoted_printable_encode("\xC3\xA9", utf8), "=E9");
}

TEST(QuotedPrintableTest, HardBreakWhenLineHasNoSpace) {
    const std::string text = std::string(73, 'a') + "=";
    const std::string encoded = MimeEncoding::quoted_printable_encode(text, kLatin1);
    EXPECT_EQ(encoded, std::string(73, 'a') + "=\r\n=3D");
    EXPECT_EQ(MimeEncoding::quoted_printable_decode(encoded), text);
}

TEST(QuotedPrintableTest, SoftBreakAfterLastSpace) {
    const std::string text = std::string(70, 'x') + " " + std::string(10, 'y');
    const std::string encoded = MimeEncoding::quoted_printable_encode(text, kLatin1);
    EXPECT_EQ(encoded, std::string(70, 'x') + " =\r\n" + std::string(10, 'y'));
    EXPECT_EQ(MimeEncoding::quoted_printable_decode(encoded), text);
}

TEST(QuotedPrintableTest, NewlinesStartAFreshLine) {
    const std::string text = std::string(60, 'a') + "\r\n" + std::string(60, 'b');
    EXPECT_EQ(MimeEncoding::quoted_printable_encode(text, kLatin1), text);
}

TEST(QuotedPrintableTest, TrailingSpaceIsEscaped) {
    EXPECT_EQ(MimeEncoding::quoted_printable_encode("abc ", kLatin1), "abc=20");
}

TEST(QuotedPrintableTest, DecodeLeavesBrokenEscapesAlone) {
    EXPECT_EQ(MimeEncoding::quoted_printable_decode("a=3Db=ZZ=\nc="), "a=b=ZZc=");
}

TEST(QuotedPrintableTest, RoundTripOfLongAsciiText) {
    std::string text;
    for (int i = 0; i < 40; ++i) text += "word" + std::to_string(i) + " =x ";
    text += "end";
    const std::string encoded = MimeEncoding::quoted_printable_encode(text, kLatin1);
    EXPECT_EQ(MimeEncoding::quoted_printable_decode(encoded), text);

    size_t start = 0;
    while (start < encoded.size()) {
        size_t end = encoded.find("\r\n", start);
        if (end == std::string::npos) end = encoded.size();
        EXPECT_LE(end - start, 76u);
        start = end + 2;
    }
}

TEST(Base64Test, EncodesWithPadding) {
    EXPECT_EQ(MimeEncoding::base64_encode(""), "");
    EXPECT_EQ(MimeEncoding::base64_encode("f"), "Zg==");
    EXPECT_EQ(MimeEncoding::base64_encode("fo"), "Zm8=");
    EXPECT_EQ(MimeEncoding::base64_encode("foo"), "Zm9v");
    EXPECT_EQ(MimeEncoding::base64_encode(std::string("\xFF\x00\x10", 3)), "/wAQ");
}

TEST(Base64Test, HundredBytesMakeTwoLines) {
    std::string data;
    for (int i = 0; i < 100; ++i) data.push_back(static_cast<char>(i));
    auto lines = MimeEncoding::base64_lines(data);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].size(), 76u);
    EXPECT_EQ(lines[1].size(), 60u);
    EXPECT_EQ(lines[0], MimeEncoding::base64_encode(data.substr(0, 57)));
    EXPECT_EQ(lines[1], MimeEncoding::base64_encode(data.substr(57)));
}

TEST(Base64Test, ExactChunkHasNoEmptyTail) {
    EXPECT_EQ(MimeEncoding::base64_lines(std::string(114, 'z')).size(), 2u);
    EXPECT_TRUE(MimeEncoding::base64_lines("").empty());
}
