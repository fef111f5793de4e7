#include "resource_node.hpp"

#include "content_classifier.hpp"
#include "errors.hpp"
#include "html_text.hpp"
#include "resource_graph.hpp"
#include "string_util.hpp"
#include "url_resolver.hpp"

#include <cstdio>
#include <filesystem>
#include <functional>
#include <iostream>
#include <regex>

namespace fs = std::filesystem;

namespace {

const size_t kTitleLength = 50;

std::string web_mark(const std::string& url) {
    char length[16];
    std::snprintf(length, sizeof(length), "%04zu", url.size());
    return "<!-- saved from url=(" + std::string(length) + ")" + url + " --> \r\n";
}

std::string hash_string(const std::string& s) {
    return std::to_string(std::hash<std::string>{}(s));
}

// "out/" -> "out", but "/" stays "/"
std::string trim_trailing_separators(std::string folder) {
    while (folder.size() > 1 && (folder.back() == '/' || folder.back() == '\\')) folder.pop_back();
    return folder;
}

} // namespace

const char* to_string(StorageMode mode) {
    switch (mode) {
        case StorageMode::Memory: return "memory";
        case StorageMode::DiskTemporary: return "disk-temporary";
        case StorageMode::DiskPermanent: return "disk-permanent";
    }
    return "unknown";
}

const char* to_string(DownloadState state) {
    switch (state) {
        case DownloadState::NotFetched: return "not-fetched";
        case DownloadState::Fetched: return "fetched";
        case DownloadState::Failed: return "failed";
    }
    return "unknown";
}

// -------------------- ctor --------------------
ResourceNode::ResourceNode(const CrawlContext& ctx, StorageMode storage)
    : ctx_(ctx), storage_(storage) {}

ResourceNode::ResourceNode(const CrawlContext& ctx, const std::string& url, StorageMode storage)
    : ctx_(ctx), storage_(storage) {
    set_url(url);
}

// -------------------- url --------------------
void ResourceNode::set_url(const std::string& url) {
    std::string resolved = UrlResolver::resolve(url);

    originalUrl_ = url;
    url_ = resolved;
    auto parts = UrlResolver::decompose(url_);
    urlRoot_ = parts.root;
    urlFolder_ = parts.folder;
    contentLocation_.clear();

    state_ = DownloadState::NotFetched;
    error_.clear();
    contentType_.clear();
    binary_ = false;
    bytes_.clear();
    hasBody_ = false;
    encoding_.reset();
    if (!filenameExplicit_) filename_.reset();
    appended_ = false;
    references_.reset();
}

// The server's location is already canonical and is taken as is.
void ResourceNode::relocate(const std::string& location) {
    contentLocation_ = location;
    url_ = location;
    auto parts = UrlResolver::decompose(url_);
    urlRoot_ = parts.root;
    urlFolder_ = parts.folder;
}

// -------------------- fetch --------------------
void ResourceNode::fetch() {
    if (state_ != DownloadState::NotFetched) return;

    const bool verbose = ctx_.options.verbose;
    if (verbose) std::cout << "Downloading: " << url_ << std::endl;

    FetchResult result;
    try {
        result = ctx_.transport.fetch(url_);
    } catch (const TransportError& e) {
        state_ = DownloadState::Failed;
        error_ = e.what();
        std::cerr << "Failed: " << url_ << " (" << error_ << ")" << std::endl;
        return;
    }

    if (!result.content_location.empty() && result.content_location != url_) relocate(result.content_location);

    contentType_ = result.content_type;
    binary_ = ContentClassifier::is_binary(contentType_);
    bytes_ = std::move(result.bytes);
    hasBody_ = true;
    if (!binary_) {
        std::optional<TextEncoding> enc;
        if (ctx_.options.forced_encoding) enc = TextEncoding::from_charset(*ctx_.options.forced_encoding);
        if (!enc && !result.charset.empty()) enc = TextEncoding::from_charset(result.charset);
        if (!enc) enc = TextEncoding::from_charset(ctx_.options.transport.default_charset);
        encoding_ = enc.value_or(TextEncoding::default_encoding());
    }
    if (verbose) {
        std::cout << "  Status: " << result.status << ", type: " << contentType_
                  << ", bytes: " << bytes_.size() << std::endl;
    }

    if (is_html()) {
        process_html();
    } else if (is_css()) {
        process_css();
    }

    // a node only counts as fetched once its disk copy exists
    if (storage_ != StorageMode::Memory) {
        try {
            save();
        } catch (const FileSystemError& e) {
            state_ = DownloadState::Failed;
            error_ = e.what();
            std::cerr << "Failed: " << url_ << " (" << error_ << ")" << std::endl;
            return;
        }
    }
    state_ = DownloadState::Fetched;
}

void ResourceNode::load_html(const std::string& html, const std::optional<std::string>& baseUrl) {
    if (baseUrl) {
        set_url(*baseUrl);
    } else {
        url_.clear();
        originalUrl_.clear();
        urlRoot_.clear();
        urlFolder_.clear();
        references_.reset();
    }
    contentType_ = "text/html";
    binary_ = false;
    bytes_ = html;
    hasBody_ = true;
    std::optional<TextEncoding> enc;
    if (ctx_.options.forced_encoding) enc = TextEncoding::from_charset(*ctx_.options.forced_encoding);
    encoding_ = enc.value_or(TextEncoding::default_encoding());
    state_ = DownloadState::Fetched;
    error_.clear();

    if (baseUrl) process_html();
}

// Text bodies stay in their own ASCII compatible encoding; every pattern
// below only touches ASCII, so no decode/encode round trip is needed.
void ResourceNode::process_html() {
    std::string html = bytes_;
    if (ctx_.options.add_web_mark && !url_.empty()) html = web_mark(url_) + html;
    if (ctx_.options.strip_scripts) html = HtmlText::strip_tag(html, "script");
    if (ctx_.options.strip_iframes) html = HtmlText::strip_tag(html, "iframe");

    // <base href> overrides the folder for this document only
    if (auto base = ReferenceRewriter::base_href(html)) urlFolder_ = *base;
    html = ReferenceRewriter::remove_base_tags(html);

    bytes_ = ReferenceRewriter::to_absolute(html, urlRoot_, urlFolder_);
    references_.reset();
}

void ResourceNode::process_css() {
    bytes_ = ReferenceRewriter::to_absolute(bytes_, urlRoot_, urlFolder_);
    references_.reset();
}

// -------------------- classification --------------------
bool ResourceNode::is_html() const {
    return ContentClassifier::is_html(contentType_);
}

bool ResourceNode::is_css() const {
    return ContentClassifier::is_css(contentType_);
}

TextEncoding ResourceNode::text_encoding() const {
    return encoding_.value_or(TextEncoding::default_encoding());
}

std::string ResourceNode::html_title() const {
    if (!is_html()) throw NotHtmlError(contentType_, "Reading the title tag");
    std::string title = HtmlText::title(bytes_);
    if (title.empty()) return title;
    const TextEncoding enc = text_encoding();
    std::u32string chars = enc.decode(title);
    if (chars.size() <= kTitleLength) return title;
    return enc.encode(chars.substr(0, kTitleLength));
}

std::string ResourceNode::to_plain_text() const {
    if (binary_) return bytes_;
    if (!is_html()) return bytes_;
    return HtmlText::to_plain_text(bytes_, text_encoding());
}

// -------------------- disk placement --------------------
void ResourceNode::set_download_folder(const std::string& folder) {
    downloadFolder_ = trim_trailing_separators(folder);
}

void ResourceNode::set_download_filename(const std::string& name) {
    filename_ = name;
    filenameExplicit_ = !name.empty();
    if (!filenameExplicit_) filename_.reset();
}

void ResourceNode::set_download_extension(const std::string& ext) {
    if (ext.empty()) extension_.reset();
    else extension_ = ext;
}

void ResourceNode::set_use_title_as_filename(bool value) {
    useTitle_ = value;
    if (!filenameExplicit_) filename_.reset();
}

std::string ResourceNode::download_extension() const {
    if (extension_) return *extension_;
    if (!hasBody_) return {};
    return ContentClassifier::extension_for(contentType_);
}

std::string ResourceNode::download_filename() const {
    if (filename_) return *filename_;

    std::string name;
    if (useTitle_ && hasBody_ && is_html()) {
        std::string title = html_title();
        if (!title.empty()) name = sanitize_filename(title) + ".htm";
    }
    if (name.empty()) name = filename_from_url();

    // until the content type is known the extension may still change
    if (hasBody_) filename_ = name;
    return name;
}

std::string ResourceNode::filename_from_url() const {
    static const std::regex lastSegment(R"(/([^/?]+)[^/]*$)");

    std::string name;
    std::smatch m;
    if (std::regex_search(url_, m, lastSegment)) name = m[1].str();

    if (!name.empty()) {
        // the same script with different parameters must not share a file
        auto query = url_.find('?');
        if (query != std::string::npos) {
            name = fs::path(name).stem().string() + "_" + hash_string(url_.substr(query)) + download_extension();
        }
    }

    if (name.empty() && is_html()) {
        name = html_title();
        if (!name.empty()) name += ".htm";
    }

    if (name.empty()) name = hash_string(url_) + download_extension();

    return sanitize_filename(name);
}

std::string ResourceNode::download_path() const {
    std::string name = download_filename();
    if (!fs::path(name).has_extension()) name += download_extension();
    if (downloadFolder_.empty()) return name;
    return (fs::path(downloadFolder_) / name).string();
}

void ResourceNode::set_download_path(const std::string& path) {
    fs::path p(path);
    std::string name = p.filename().string();
    if (name.empty()) {
        set_download_folder(path);
        set_download_filename("");
    } else {
        set_download_folder(p.parent_path().string());
        set_download_filename(name);
    }
}

std::string ResourceNode::external_files_folder() const {
    std::string stem = fs::path(download_filename()).stem().string() + "_files";
    if (downloadFolder_.empty()) return stem;
    return (fs::path(downloadFolder_) / stem).string();
}

std::string ResourceNode::sanitize_filename(const std::string& name) {
    static const std::regex invalid(R"re([\\/:*?"<>|])re");
    return StringUtil::collapse_whitespace(std::regex_replace(name, invalid, ""));
}

// -------------------- references --------------------
const ReferenceMap& ResourceNode::references() const {
    if (!references_) {
        if (fetched() && (is_html() || is_css())) {
            references_ = ReferenceRewriter::extract_references(bytes_);
        } else {
            references_ = ReferenceMap();
        }
    }
    return *references_;
}

std::string ResourceNode::relative_to_folder(const std::string& path) const {
    if (downloadFolder_.empty()) return fs::path(path).generic_string();
    fs::path rel = fs::path(path).lexically_relative(downloadFolder_);
    if (rel.empty()) return fs::path(path).generic_string();
    return rel.generic_string();
}

void ResourceNode::convert_references_to_local(const ResourceGraph& graph) {
    if (!is_html() && !is_css()) throw NotHtmlError(contentType_, "Converting references");

    const ReferenceMap& refs = references();
    if (refs.empty()) return;

    bytes_ = ReferenceRewriter::to_local(bytes_, refs, [&](const std::string& url) -> std::optional<std::string> {
        const ResourceNode* target = graph.find(url);
        if (!target || !target->fetched()) return std::nullopt;
        return relative_to_folder(target->download_path());
    });
}

// -------------------- save --------------------
void ResourceNode::save() {
    save(download_path(), false);
}

void ResourceNode::save(const std::string& path, bool asText) {
    const std::string data = asText ? to_plain_text() : bytes_;
    ctx_.files.write_file(path, data);
    if (ctx_.options.verbose) std::cout << "  Saved: " << url_ << " -> " << path << std::endl;
}
