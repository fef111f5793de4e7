#include "html_text.hpp"

#include <gtest/gtest.h>

TEST(HtmlTextTest, StripTagRemovesWholeBlocksCaseInsensitively) {
    const std::string html = "a<script type='x'>bad()</script>b<SCRIPT>x</SCRIPT>c";
    EXPECT_EQ(HtmlText::strip_tag(html, "script"), "abc");
}

TEST(HtmlTextTest, StripTagLeavesLongerTagNamesAlone) {
    const std::string html = "<scripts>keep</scripts><iframe src='x'></iframe>";
    EXPECT_EQ(HtmlText::strip_tag(html, "script"), html);
    EXPECT_EQ(HtmlText::strip_tag(html, "iframe"), "<scripts>keep</scripts>");
}

TEST(HtmlTextTest, StripTagKeepsUnterminatedBlock) {
    const std::string html = "x<script>never closed";
    EXPECT_EQ(HtmlText::strip_tag(html, "script"), html);
}

TEST(HtmlTextTest, Title) {
    EXPECT_EQ(HtmlText::title("<html><head><TITLE lang=en>Hello</TITLE></head>"), "Hello");
    EXPECT_EQ(HtmlText::title("<html><body>no title</body>"), "");
}

TEST(HtmlTextTest, DecodeEntities) {
    const TextEncoding enc;
    EXPECT_EQ(HtmlText::decode_entities("a &amp; b &lt;c&gt; &#65;&#x42; &bogus; &", enc),
              "a & b <c> AB &bogus; &");
}

TEST(HtmlTextTest, DecodeEntitiesWritesInTargetEncoding) {
    EXPECT_EQ(HtmlText::decode_entities("&nbsp;", TextEncoding(TextEncoding::Kind::Utf8)), "\xC2\xA0");
    EXPECT_EQ(HtmlText::decode_entities("&copy;", TextEncoding(TextEncoding::Kind::Latin1)), "\xA9");
}

TEST(HtmlTextTest, PlainTextDropsMarkupScriptsAndStyles) {
    const std::string html = "<p>Hi <b>there</b></p><script>x()</script><style>p{}</style>";
    const TextEncoding enc;
    EXPECT_EQ(HtmlText::to_plain_text(html, enc), " Hi  there  ");
    EXPECT_EQ(HtmlText::to_plain_text(html, enc, true), " Hi there ");
}

TEST(HtmlTextTest, PlainTextDecodesEntitiesAfterRemovingTags) {
    EXPECT_EQ(HtmlText::to_plain_text("<i>&lt;b&gt;</i>", TextEncoding()), " <b> ");
}

TEST(HtmlTextTest, PlainTextKeepsGreaterThanInsideQuotedAttributes) {
    EXPECT_EQ(HtmlText::to_plain_text(R"html(<a title="1 > 0" href='x'>go</a>)html", TextEncoding()), " go ");
    EXPECT_EQ(HtmlText::to_plain_text("<br/>a<hr noshade>b", TextEncoding()), " a b");
    EXPECT_EQ(HtmlText::to_plain_text("1 <", TextEncoding()), "1 <");
}

TEST(HtmlTextTest, PlainTextSurvivesLargeInlineImages) {
    const std::string html = "<p>x</p><img src=\"data:image/png;base64," + std::string(200000, 'A') + "\">";
    EXPECT_EQ(HtmlText::to_plain_text(html, TextEncoding()), " x  ");
}
