#include "builder.hpp"

#include "archive_encoder.hpp"
#include "errors.hpp"
#include "http_transport.hpp"
#include "string_util.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <set>
#include <sstream>
#include <utility>
#include <vector>

using nlohmann::json;
namespace fs = std::filesystem;

namespace {

bool is_directory_path(const std::string& path) {
    return !path.empty() && (path.back() == '/' || path.back() == '\\');
}

std::string change_extension(const std::string& path, const std::string& ext) {
    return fs::path(path).replace_extension(ext).string();
}

} // namespace

const char* const Builder::kArchiveContentType = "message/rfc822";

// -------------------- ctor --------------------
Builder::Builder(BuilderOptions options)
    : Builder(std::make_shared<HttpTransport>(options.transport), std::make_shared<LocalFileSystem>(),
              options) {}

Builder::Builder(std::shared_ptr<Transport> transport, std::shared_ptr<FileSystem> files, BuilderOptions options)
    : options_(std::move(options)),
      transport_(std::move(transport)),
      files_(std::move(files)),
      ctx_{*transport_, *files_, options_},
      root_(ctx_, StorageMode::Memory),
      graph_(ctx_) {}

void Builder::set_url(const std::string& url) {
    graph_.clear();
    root_.set_url(url);
    root_.set_storage(StorageMode::Memory);
}

// -------------------- validation --------------------
void Builder::validate_filename(const std::string& path, const std::string& allowedExtensions) {
    // a folder gets its file name from the page title later on
    if (is_directory_path(path)) return;

    const std::string name = fs::path(path).filename().string();
    const std::string ext = StringUtil::to_lower(fs::path(path).extension().string());
    if (ext.empty()) throw InvalidFileNameError(ErrorKind::InvalidFileName, name, allowedExtensions);

    std::istringstream list(allowedExtensions);
    std::string allowed;
    while (std::getline(list, allowed, ';')) {
        if (StringUtil::to_lower(allowed) == ext) return;
    }
    throw InvalidFileNameError(ErrorKind::InvalidExtension, name, allowedExtensions);
}

// -------------------- root page --------------------
void Builder::fetch_root(const std::optional<std::string>& url) {
    if (url && !url->empty()) set_url(*url);
    if (root_.url().empty()) throw InvalidUrlError("");

    root_.set_storage(StorageMode::Memory);
    root_.set_appended(false);
    root_.fetch();

    if (!root_.fetched()) throw DownloadFailedError(root_.url(), root_.error());
}

void Builder::place_root(const std::string& path) {
    root_.set_use_title_as_filename(true);
    root_.set_download_path(path);
    if (!root_.download_folder().empty()) files_->create_directories(root_.download_folder());
}

// -------------------- entry points --------------------
std::string Builder::save_page(const std::string& path, const std::optional<std::string>& url) {
    validate_filename(path, ".htm;.html");
    fetch_root(url);

    place_root(path);
    root_.save();
    return root_.download_path();
}

std::string Builder::save_page_text(const std::string& path, const std::optional<std::string>& url) {
    validate_filename(path, ".txt");
    fetch_root(url);

    place_root(path);
    std::string target = change_extension(root_.download_path(), ".txt");
    root_.save_as_text(target);
    return target;
}

std::string Builder::save_page_complete(const std::string& path, const std::optional<std::string>& url) {
    validate_filename(path, ".htm;.html");
    fetch_root(url);

    place_root(path);
    graph_.clear();
    graph_.crawl(root_, StorageMode::DiskPermanent, options_.allow_recursion);

    for (const auto& entry : graph_) {
        ResourceNode& node = *entry.second;
        if (!node.fetched() || !(node.is_html() || node.is_css())) continue;
        node.convert_references_to_local(graph_);
        node.save();
    }

    root_.convert_references_to_local(graph_);
    root_.save();

    if (options_.write_manifest) write_manifest(root_.external_files_folder());
    return root_.download_path();
}

std::string Builder::get_page_archive(const std::optional<std::string>& url) {
    fetch_root(url);

    graph_.clear();
    graph_.crawl(root_, StorageMode::Memory, options_.allow_recursion);

    ArchiveEncoder encoder(*files_);
    encoder.write_all(root_, graph_);
    graph_.clear();
    return encoder.finalize();
}

std::string Builder::save_page_archive(const std::string& path, StorageMode storage,
                                       const std::optional<std::string>& url) {
    validate_filename(path, ".mht");
    fetch_root(url);
    return build_archive(path, storage);
}

std::string Builder::convert_html_to_archive(const std::string& html, const std::string& path, StorageMode storage,
                                             const std::optional<std::string>& baseUrl) {
    validate_filename(path, ".mht");

    graph_.clear();
    root_.set_storage(StorageMode::Memory);
    root_.load_html(html, baseUrl);
    root_.set_appended(false);
    return build_archive(path, storage);
}

std::string Builder::build_archive(const std::string& path, StorageMode storage) {
    place_root(path);

    if (storage == StorageMode::DiskPermanent) root_.save(change_extension(root_.download_path(), ".htm"));

    graph_.clear();
    graph_.crawl(root_, storage, options_.allow_recursion);

    ArchiveEncoder encoder(*files_);
    encoder.write_all(root_, graph_);
    const std::string target = change_extension(root_.download_path(), ".mht");
    if (encoder.finalize(target) && options_.verbose) std::cout << "Archive written: " << target << std::endl;

    if (storage == StorageMode::DiskPermanent && options_.write_manifest) {
        write_manifest(root_.external_files_folder());
    }
    if (storage == StorageMode::DiskTemporary) remove_temporary_files();

    graph_.clear();
    return target;
}

// -------------------- cleanup --------------------
void Builder::remove_temporary_files() {
    std::set<std::string> folders;
    for (const auto& entry : graph_) {
        const ResourceNode& node = *entry.second;
        if (node.storage() != StorageMode::DiskTemporary) continue;
        if (!node.download_folder().empty()) folders.insert(node.download_folder());
        if (!node.fetched()) continue;
        try {
            files_->remove_file(node.download_path());
        } catch (const FileSystemError& e) {
            std::cerr << "Cleanup: " << e.what() << std::endl;
        }
    }

    // deepest first, so a parent is only looked at after its children are gone
    std::vector<std::string> ordered(folders.begin(), folders.end());
    std::sort(ordered.begin(), ordered.end(),
              [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
    for (const auto& folder : ordered) {
        try {
            if (files_->exists(folder) && files_->list_directory(folder).empty()) files_->remove_directory(folder);
        } catch (const FileSystemError& e) {
            std::cerr << "Cleanup: " << e.what() << std::endl;
        }
    }
}

// -------------------- manifest --------------------
void Builder::write_manifest(const std::string& folder) const {
    json j = json::array();
    for (const auto& entry : graph_) {
        const ResourceNode& node = *entry.second;
        j.push_back({
            {"url", entry.first},
            {"saved_path", node.fetched() ? node.download_path() : std::string()},
            {"content_type", node.content_type()},
            {"state", to_string(node.state())},
            {"error", node.error()},
            {"bytes", node.bytes().size()}
        });
    }

    const std::string path = (fs::path(folder) / "manifest.json").string();
    files_->create_directories(folder);
    files_->write_file(path, j.dump(2));
    if (options_.verbose) std::cout << "Manifest written: " << path << ", items: " << j.size() << std::endl;
}
