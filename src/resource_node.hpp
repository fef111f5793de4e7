#pragma once

#include "builder_options.hpp"
#include "file_system.hpp"
#include "reference_rewriter.hpp"
#include "text_encoding.hpp"
#include "transport.hpp"

#include <optional>
#include <string>

class ResourceGraph;

enum class StorageMode { Memory, DiskTemporary, DiskPermanent };

enum class DownloadState { NotFetched, Fetched, Failed };

const char* to_string(StorageMode mode);
const char* to_string(DownloadState state);

// Collaborators shared by every node of one build.
struct CrawlContext {
    Transport& transport;
    FileSystem& files;
    const BuilderOptions& options;
};

// One resource of a saved page: where it came from, what the server sent,
// and where it goes on disk.
class ResourceNode {
public:
    ResourceNode(const CrawlContext& ctx, StorageMode storage);
    // Throws InvalidUrlError.
    ResourceNode(const CrawlContext& ctx, const std::string& url, StorageMode storage);

    // Points the node at a new URL and forgets everything fetched so far.
    // Throws InvalidUrlError.
    void set_url(const std::string& url);

    const std::string& url() const { return url_; }
    const std::string& original_url() const { return originalUrl_; }
    const std::string& url_root() const { return urlRoot_; }
    const std::string& url_folder() const { return urlFolder_; }
    const std::string& content_location() const { return contentLocation_; }

    // Fetches once; transport failures leave the node Failed instead of throwing.
    void fetch();
    // Uses caller supplied markup as the fetched body. References are made
    // absolute only when a base URL is known.
    void load_html(const std::string& html, const std::optional<std::string>& baseUrl);

    DownloadState state() const { return state_; }
    bool fetched() const { return state_ == DownloadState::Fetched; }
    const std::string& error() const { return error_; }

    const std::string& content_type() const { return contentType_; }
    bool is_binary() const { return binary_; }
    bool is_html() const;
    bool is_css() const;

    // Raw body for binary content; text in text_encoding() otherwise.
    const std::string& bytes() const { return bytes_; }
    TextEncoding text_encoding() const;

    // First 50 characters of <title>. Throws NotHtmlError.
    std::string html_title() const;
    std::string to_plain_text() const;

    // -------------------- disk placement --------------------
    const std::string& download_folder() const { return downloadFolder_; }
    void set_download_folder(const std::string& folder);
    std::string download_filename() const;
    void set_download_filename(const std::string& name);
    std::string download_extension() const;
    void set_download_extension(const std::string& ext);
    // folder/filename, with download_extension() appended when the filename has none.
    std::string download_path() const;
    // A path ending in a separator only sets the folder.
    void set_download_path(const std::string& path);
    // <folder>/<filename without extension>_files
    std::string external_files_folder() const;

    bool use_title_as_filename() const { return useTitle_; }
    void set_use_title_as_filename(bool value);

    bool appended() const { return appended_; }
    void set_appended(bool value) { appended_ = value; }

    StorageMode storage() const { return storage_; }
    void set_storage(StorageMode storage) { storage_ = storage; }

    // Absolute http(s) references of an HTML/CSS body; empty for anything else.
    const ReferenceMap& references() const;

    // Rewrites references to fetched graph nodes into paths relative to this
    // node's folder. Throws NotHtmlError for non HTML/CSS content.
    void convert_references_to_local(const ResourceGraph& graph);

    // Writes to download_path(). Throws FileSystemError.
    void save();
    void save(const std::string& path, bool asText = false);
    void save_as_text(const std::string& path) { save(path, true); }

    // Drops characters not allowed in file names and tidies whitespace.
    static std::string sanitize_filename(const std::string& name);

private:
    void relocate(const std::string& location);
    void process_html();
    void process_css();
    std::string filename_from_url() const;
    std::string relative_to_folder(const std::string& path) const;

    CrawlContext ctx_;
    StorageMode storage_;

    std::string url_;
    std::string originalUrl_;
    std::string urlRoot_;
    std::string urlFolder_;
    std::string contentLocation_;

    DownloadState state_ = DownloadState::NotFetched;
    std::string error_;
    std::string contentType_;
    bool binary_ = false;
    std::string bytes_;
    bool hasBody_ = false;
    std::optional<TextEncoding> encoding_;

    std::string downloadFolder_;
    mutable std::optional<std::string> filename_;
    bool filenameExplicit_ = false;
    std::optional<std::string> extension_;
    bool useTitle_ = false;
    bool appended_ = false;

    mutable std::optional<ReferenceMap> references_;
};
