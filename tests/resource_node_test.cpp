#include "resource_node.hpp"

#include "errors.hpp"
#include "fake_transport.hpp"
#include "temp_dir.hpp"

#include <gtest/gtest.h>

#include <optional>

namespace {

class ResourceNodeTest : public ::testing::Test {
protected:
    ResourceNodeTest() { options.add_web_mark = false; }

    CrawlContext ctx() { return CrawlContext{transport, files, options}; }

    FakeTransport transport;
    LocalFileSystem files;
    BuilderOptions options;
};

// Rejects every write and records the watched node's state at that moment.
class RejectingFileSystem : public LocalFileSystem {
public:
    void write_file(const std::string& path, const std::string&) override {
        if (watched) stateAtWrite = watched->state();
        throw FileSystemError(path, "Disk full");
    }

    const ResourceNode* watched = nullptr;
    std::optional<DownloadState> stateAtWrite;
};

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_F(ResourceNodeTest, ConstructorResolvesAndDecomposesUrl) {
    ResourceNode node(ctx(), "HTTP://X.com/dir/page.htm#part", StorageMode::Memory);
    EXPECT_EQ(node.url(), "http://x.com/dir/page.htm");
    EXPECT_EQ(node.original_url(), "HTTP://X.com/dir/page.htm#part");
    EXPECT_EQ(node.url_root(), "http://x.com");
    EXPECT_EQ(node.url_folder(), "http://x.com/dir");
    EXPECT_EQ(node.state(), DownloadState::NotFetched);
}

TEST_F(ResourceNodeTest, InvalidUrlThrows) {
    EXPECT_THROW(ResourceNode(ctx(), "no scheme here", StorageMode::Memory), InvalidUrlError);
}

TEST_F(ResourceNodeTest, FetchHtmlMakesReferencesAbsolute) {
    transport.add("http://x.com/dir/page.htm", "text/html; charset=utf-8",
                  R"(<html><head><title>Page</title></head><body><img src="a.png"></body></html>)");
    ResourceNode node(ctx(), "http://x.com/dir/page.htm", StorageMode::Memory);
    node.fetch();

    ASSERT_TRUE(node.fetched());
    EXPECT_TRUE(node.is_html());
    EXPECT_FALSE(node.is_binary());
    EXPECT_STREQ(node.text_encoding().web_name(), "utf-8");
    EXPECT_TRUE(contains(node.bytes(), R"(src="http://x.com/dir/a.png")"));
    ASSERT_EQ(node.references().size(), 1u);
    EXPECT_EQ(node.references().begin()->url, "http://x.com/dir/a.png");
}

TEST_F(ResourceNodeTest, WebMarkPrefixesHtml) {
    options.add_web_mark = true;
    transport.add("http://x.com/dir/page.htm", "text/html", "<html></html>");
    ResourceNode node(ctx(), "http://x.com/dir/page.htm", StorageMode::Memory);
    node.fetch();
    EXPECT_EQ(node.bytes(), "<!-- saved from url=(0025)http://x.com/dir/page.htm --> \r\n<html></html>");
}

TEST_F(ResourceNodeTest, FailedFetchIsRecordedAndNeverRetried) {
    transport.fail("http://x.com/gone.png", 500);
    ResourceNode node(ctx(), "http://x.com/gone.png", StorageMode::Memory);
    EXPECT_NO_THROW(node.fetch());
    EXPECT_EQ(node.state(), DownloadState::Failed);
    EXPECT_FALSE(node.error().empty());

    node.fetch();
    EXPECT_EQ(transport.fetch_count("http://x.com/gone.png"), 1);
}

TEST_F(ResourceNodeTest, FetchHappensOnce) {
    transport.add("http://x.com/a.css", "text/css", "p {}");
    ResourceNode node(ctx(), "http://x.com/a.css", StorageMode::Memory);
    node.fetch();
    node.fetch();
    EXPECT_EQ(transport.fetch_count("http://x.com/a.css"), 1);
}

TEST_F(ResourceNodeTest, ContentLocationRelocatesNode) {
    transport.add("http://site.com/", "text/html", R"(<img src="i.gif">)", "http://site.com/sub/default.htm");
    ResourceNode node(ctx(), "http://site.com/", StorageMode::Memory);
    node.fetch();

    EXPECT_EQ(node.url(), "http://site.com/sub/default.htm");
    EXPECT_EQ(node.content_location(), "http://site.com/sub/default.htm");
    EXPECT_EQ(node.original_url(), "http://site.com/");
    EXPECT_EQ(node.url_folder(), "http://site.com/sub");
    EXPECT_EQ(node.bytes(), R"(<img src="http://site.com/sub/i.gif">)");
}

TEST_F(ResourceNodeTest, BaseTagOverridesFolderAndIsRemoved) {
    transport.add("http://x.com/p.htm", "text/html", R"(<base href="http://cdn.x.com/assets/"><img src="a.png">)");
    ResourceNode node(ctx(), "http://x.com/p.htm", StorageMode::Memory);
    node.fetch();

    EXPECT_EQ(node.url_folder(), "http://cdn.x.com/assets");
    EXPECT_EQ(node.bytes(), R"(<img src="http://cdn.x.com/assets/a.png">)");
}

TEST_F(ResourceNodeTest, StripsScriptsAndIframesWhenAsked) {
    options.strip_scripts = true;
    options.strip_iframes = true;
    transport.add("http://x.com/p.htm", "text/html",
                  "a<script>evil()</script>b<iframe src=\"http://x.com/f.htm\"></iframe>c");
    ResourceNode node(ctx(), "http://x.com/p.htm", StorageMode::Memory);
    node.fetch();
    EXPECT_EQ(node.bytes(), "abc");
    EXPECT_TRUE(node.references().empty());
}

TEST_F(ResourceNodeTest, EncodingSelection) {
    transport.add("http://x.com/latin.htm", "text/html; charset=iso-8859-1", "<p>");
    transport.add("http://x.com/plain.css", "text/css", "p {}");

    ResourceNode latin(ctx(), "http://x.com/latin.htm", StorageMode::Memory);
    latin.fetch();
    EXPECT_STREQ(latin.text_encoding().web_name(), "iso-8859-1");

    ResourceNode css(ctx(), "http://x.com/plain.css", StorageMode::Memory);
    css.fetch();
    EXPECT_STREQ(css.text_encoding().web_name(), "windows-1252");

    options.forced_encoding = std::string("utf-8");
    ResourceNode forced(ctx(), "http://x.com/latin.htm", StorageMode::Memory);
    forced.fetch();
    EXPECT_STREQ(forced.text_encoding().web_name(), "utf-8");
}

TEST_F(ResourceNodeTest, BinaryContentIsKeptVerbatim) {
    const std::string png("\x89PNG\r\n\x1a\n\0\0", 10);
    transport.add("http://x.com/i.png", "image/png", png);
    ResourceNode node(ctx(), "http://x.com/i.png", StorageMode::Memory);
    node.fetch();

    EXPECT_TRUE(node.is_binary());
    EXPECT_FALSE(node.is_html());
    EXPECT_EQ(node.bytes(), png);
    EXPECT_TRUE(node.references().empty());
    EXPECT_THROW(node.html_title(), NotHtmlError);
}

TEST_F(ResourceNodeTest, TitleIsTruncatedToFiftyCharacters) {
    transport.add("http://x.com/t.htm", "text/html", "<title>" + std::string(60, 'a') + "</title>");
    ResourceNode node(ctx(), "http://x.com/t.htm", StorageMode::Memory);
    node.fetch();
    EXPECT_EQ(node.html_title(), std::string(50, 'a'));
}

TEST_F(ResourceNodeTest, QueryStringsGiveDistinctFilenames) {
    transport.add("http://x.com/page?id=1", "text/html", "<p>one</p>");
    transport.add("http://x.com/page?id=2", "text/html", "<p>two</p>");
    ResourceNode one(ctx(), "http://x.com/page?id=1", StorageMode::Memory);
    ResourceNode two(ctx(), "http://x.com/page?id=2", StorageMode::Memory);
    one.fetch();
    two.fetch();

    const std::string a = one.download_filename();
    const std::string b = two.download_filename();
    EXPECT_FALSE(a.empty());
    EXPECT_NE(a, b);
    EXPECT_EQ(a.rfind("page_", 0), 0u);
    EXPECT_EQ(a.substr(a.size() - 4), ".htm");
    EXPECT_EQ(a.find_first_of("\\/:*?\"<>|"), std::string::npos);
}

TEST_F(ResourceNodeTest, FilenameFromLastPathSegment) {
    transport.add("http://x.com/img/logo.gif", "image/gif", "GIF89a");
    transport.add("http://x.com/scripts/app", "application/x-javascript", "var a;");
    ResourceNode gif(ctx(), "http://x.com/img/logo.gif", StorageMode::Memory);
    ResourceNode js(ctx(), "http://x.com/scripts/app", StorageMode::Memory);
    gif.fetch();
    js.fetch();

    EXPECT_EQ(gif.download_filename(), "logo.gif");
    EXPECT_EQ(gif.download_path(), "logo.gif");
    EXPECT_EQ(js.download_filename(), "app");
    EXPECT_EQ(js.download_path(), "app.js");
}

TEST_F(ResourceNodeTest, FilenameFallsBackToTitleThenHash) {
    transport.add("http://example.com/", "text/html", "<title>T</title>");
    ResourceNode titled(ctx(), "http://example.com", StorageMode::Memory);
    titled.fetch();
    EXPECT_EQ(titled.download_filename(), "T.htm");

    transport.add("http://untitled.com/", "text/html", "<p>");
    ResourceNode untitled(ctx(), "http://untitled.com/", StorageMode::Memory);
    untitled.fetch();
    const std::string name = untitled.download_filename();
    EXPECT_EQ(name.substr(name.size() - 4), ".htm");
    EXPECT_GT(name.size(), 4u);
}

TEST_F(ResourceNodeTest, TitleNamesFileWhenAsked) {
    transport.add("http://x.com/index.htm", "text/html", "<title>A: B/C</title>");
    ResourceNode node(ctx(), "http://x.com/index.htm", StorageMode::Memory);
    node.fetch();
    EXPECT_EQ(node.download_filename(), "index.htm");

    node.set_use_title_as_filename(true);
    EXPECT_EQ(node.download_filename(), "A BC.htm");
}

TEST_F(ResourceNodeTest, SanitizeFilename) {
    EXPECT_EQ(ResourceNode::sanitize_filename("  a  b\t?c  "), "a b c");
    EXPECT_EQ(ResourceNode::sanitize_filename("x<y>:z|\"w\"*"), "xyzw");
    EXPECT_EQ(ResourceNode::sanitize_filename(" ?? "), "");
}

TEST_F(ResourceNodeTest, DownloadPathAndExternalFilesFolder) {
    ResourceNode node(ctx(), "http://x.com/", StorageMode::Memory);
    node.set_download_path("out/page.htm");
    EXPECT_EQ(node.download_folder(), "out");
    EXPECT_EQ(node.download_filename(), "page.htm");
    EXPECT_EQ(node.download_path(), "out/page.htm");
    EXPECT_EQ(node.external_files_folder(), "out/page_files");

    node.set_download_path("elsewhere/");
    EXPECT_EQ(node.download_folder(), "elsewhere");
}

TEST_F(ResourceNodeTest, DiskStorageSavesOnFetch) {
    TempDir tmp;
    transport.add("http://x.com/img/logo.gif", "image/gif", "GIF89a\x01\x02");
    ResourceNode node(ctx(), "http://x.com/img/logo.gif", StorageMode::DiskPermanent);
    node.set_download_folder(tmp.str());
    node.fetch();

    ASSERT_TRUE(node.fetched());
    EXPECT_EQ(node.download_path(), tmp.file("logo.gif"));
    EXPECT_EQ(files.read_file(tmp.file("logo.gif")), "GIF89a\x01\x02");
}

TEST_F(ResourceNodeTest, SaveFailureMarksNodeFailed) {
    transport.add("http://x.com/a.gif", "image/gif", "GIF89a");
    ResourceNode node(ctx(), "http://x.com/a.gif", StorageMode::DiskTemporary);
    node.set_download_folder("/nonexistent-page-archiver-dir/sub");
    node.fetch();
    EXPECT_EQ(node.state(), DownloadState::Failed);
}

TEST_F(ResourceNodeTest, SaveFailureNeverPassesThroughFetched) {
    transport.add("http://x.com/a.gif", "image/gif", "GIF89a");
    RejectingFileSystem disk;
    ResourceNode node(CrawlContext{transport, disk, options}, "http://x.com/a.gif", StorageMode::DiskPermanent);
    disk.watched = &node;
    node.fetch();

    ASSERT_TRUE(disk.stateAtWrite.has_value());
    EXPECT_EQ(*disk.stateAtWrite, DownloadState::NotFetched);
    EXPECT_EQ(node.state(), DownloadState::Failed);
    EXPECT_TRUE(contains(node.error(), "Disk full"));

    node.fetch();
    EXPECT_EQ(node.state(), DownloadState::Failed);
    EXPECT_EQ(transport.fetch_count("http://x.com/a.gif"), 1);
}

TEST_F(ResourceNodeTest, SaveAsTextWritesPlainText) {
    TempDir tmp;
    transport.add("http://x.com/p.htm", "text/html", "<p>Fish &amp; chips</p><script>x()</script>");
    ResourceNode node(ctx(), "http://x.com/p.htm", StorageMode::Memory);
    node.fetch();
    node.save_as_text(tmp.file("p.txt"));
    EXPECT_EQ(files.read_file(tmp.file("p.txt")), " Fish & chips ");
}

TEST_F(ResourceNodeTest, LoadHtmlWithoutBaseKeepsMarkup) {
    ResourceNode node(ctx(), StorageMode::Memory);
    node.load_html(R"(<img src="a.png">)", std::nullopt);
    EXPECT_TRUE(node.fetched());
    EXPECT_TRUE(node.is_html());
    EXPECT_EQ(node.bytes(), R"(<img src="a.png">)");
}

TEST_F(ResourceNodeTest, LoadHtmlWithBaseResolvesReferences) {
    ResourceNode node(ctx(), StorageMode::Memory);
    node.load_html(R"(<img src="a.png">)", std::string("http://x.com/dir/index.htm"));
    EXPECT_EQ(node.url(), "http://x.com/dir/index.htm");
    EXPECT_EQ(node.bytes(), R"(<img src="http://x.com/dir/a.png">)");
}
