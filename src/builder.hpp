#pragma once

#include "builder_options.hpp"
#include "file_system.hpp"
#include "resource_graph.hpp"
#include "resource_node.hpp"
#include "transport.hpp"

#include <memory>
#include <optional>
#include <string>

// Entry points for saving a web page. Each call works on the page set with
// set_url() or passed as `url`; a failed page download raises
// DownloadFailedError and a bad output name raises InvalidFileNameError
// before anything is fetched.
class Builder {
public:
    // MIME type to serve saved archives with.
    static const char* const kArchiveContentType;

    explicit Builder(BuilderOptions options = BuilderOptions());
    Builder(std::shared_ptr<Transport> transport, std::shared_ptr<FileSystem> files,
            BuilderOptions options = BuilderOptions());

    Builder(const Builder&) = delete;
    Builder& operator=(const Builder&) = delete;

    // Forgets every resource collected for the previous page.
    void set_url(const std::string& url);
    const std::string& url() const { return root_.url(); }

    // The page alone, references made absolute. `path` is a .htm/.html file
    // or a folder ending in '/', where the title names the file.
    std::string save_page(const std::string& path, const std::optional<std::string>& url = std::nullopt);

    // The page as plain text (.txt).
    std::string save_page_text(const std::string& path, const std::optional<std::string>& url = std::nullopt);

    // The page plus every resource it uses under <name>_files, all references
    // rewritten to the local copies.
    std::string save_page_complete(const std::string& path, const std::optional<std::string>& url = std::nullopt);

    // The whole archive as a string; nothing touches the disk.
    std::string get_page_archive(const std::optional<std::string>& url = std::nullopt);

    // Writes <path>.mht. DiskPermanent also keeps a .htm copy and the
    // downloaded resources; DiskTemporary removes them afterwards.
    std::string save_page_archive(const std::string& path, StorageMode storage,
                                  const std::optional<std::string>& url = std::nullopt);

    // Same as save_page_archive() for markup the caller already has.
    std::string convert_html_to_archive(const std::string& html, const std::string& path, StorageMode storage,
                                        const std::optional<std::string>& baseUrl = std::nullopt);

    // `allowedExtensions` is a ';' separated list such as ".htm;.html".
    static void validate_filename(const std::string& path, const std::string& allowedExtensions);

    const BuilderOptions& options() const { return options_; }
    const ResourceNode& root() const { return root_; }
    const ResourceGraph& graph() const { return graph_; }

private:
    void fetch_root(const std::optional<std::string>& url);
    void place_root(const std::string& path);
    std::string build_archive(const std::string& path, StorageMode storage);
    void remove_temporary_files();
    void write_manifest(const std::string& folder) const;

    BuilderOptions options_;
    std::shared_ptr<Transport> transport_;
    std::shared_ptr<FileSystem> files_;
    CrawlContext ctx_;
    ResourceNode root_;
    ResourceGraph graph_;
};
