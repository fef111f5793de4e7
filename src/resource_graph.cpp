#include "resource_graph.hpp"

#include "errors.hpp"
#include "url_resolver.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <thread>
#include <utility>

// -------------------- ctor --------------------
ResourceGraph::ResourceGraph(const CrawlContext& ctx) : ctx_(ctx) {}

void ResourceGraph::set_root(const ResourceNode& root) {
    rootUrls_.clear();
    if (!root.original_url().empty()) {
        rootUrls_.insert(root.original_url());
        rootUrls_.insert(UrlResolver::resolve(root.original_url()));
    }
    if (!root.url().empty()) rootUrls_.insert(root.url());
}

bool ResourceGraph::is_root(const std::string& url) const {
    return rootUrls_.count(url) != 0;
}

const ResourceNode* ResourceGraph::find(const std::string& url) const {
    auto it = nodes_.find(url);
    return it == nodes_.end() ? nullptr : it->second.get();
}

ResourceNode* ResourceGraph::find(const std::string& url) {
    auto it = nodes_.find(url);
    return it == nodes_.end() ? nullptr : it->second.get();
}

void ResourceGraph::clear() {
    nodes_.clear();
    rootUrls_.clear();
}

// -------------------- crawl --------------------
void ResourceGraph::crawl(ResourceNode& root, StorageMode mode, bool recursive) {
    set_root(root);
    crawl_references(root, mode, root.external_files_folder(), recursive);
}

std::unique_ptr<ResourceNode> ResourceGraph::make_node(const std::string& url, StorageMode mode,
                                                       const std::string& targetFolder) {
    std::unique_ptr<ResourceNode> node;
    try {
        node = std::make_unique<ResourceNode>(ctx_, url, mode);
    } catch (const InvalidUrlError& e) {
        std::cerr << "Skipping reference: " << e.what() << std::endl;
        return nullptr;
    }
    if (is_root(node->url())) return nullptr;

    // disk storage needs the folder before the fetch saves into it
    if (mode != StorageMode::Memory) {
        ctx_.files.create_directories(targetFolder);
        node->set_download_folder(targetFolder);
    }
    return node;
}

ResourceNode* ResourceGraph::insert(std::unique_ptr<ResourceNode> node, StorageMode mode) {
    // first writer wins; a duplicate's disk copy goes with it
    if (contains(node->original_url())) {
        if (mode != StorageMode::Memory && node->fetched()) {
            try {
                ctx_.files.remove_file(node->download_path());
            } catch (const FileSystemError& e) {
                std::cerr << "Cleanup: " << e.what() << std::endl;
            }
        }
        return nullptr;
    }
    ResourceNode* raw = node.get();
    nodes_.emplace(raw->original_url(), std::move(node));
    return raw;
}

void ResourceGraph::descend(ResourceNode& node, StorageMode mode, bool recursive) {
    if (recursive && node.fetched() && (node.is_html() || node.is_css())) {
        crawl_references(node, mode, node.external_files_folder(), recursive);
    }
}

void ResourceGraph::fetch_all(std::vector<std::unique_ptr<ResourceNode>>& nodes) const {
    const size_t workers = std::min(nodes.size(), static_cast<size_t>(std::max(1, ctx_.options.max_concurrency)));
    if (workers <= 1) {
        for (auto& node : nodes) node->fetch();
        return;
    }

    std::atomic<size_t> next{0};
    std::exception_ptr failure;
    std::mutex failure_mtx;

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        threads.emplace_back([&] {
            for (;;) {
                size_t index = next++;
                if (index >= nodes.size()) break;
                try {
                    nodes[index]->fetch();
                } catch (...) {
                    std::lock_guard<std::mutex> lk(failure_mtx);
                    if (!failure) failure = std::current_exception();
                }
            }
        });
    }
    for (auto& t : threads) t.join();
    if (failure) std::rethrow_exception(failure);
}

void ResourceGraph::crawl_references(ResourceNode& node, StorageMode mode, const std::string& targetFolder,
                                     bool recursive) {
    const ReferenceMap& refs = node.references();
    if (refs.empty()) return;

    if (ctx_.options.max_concurrency <= 1) {
        // one reference at a time, each fully crawled before the next
        for (const auto& ref : refs) {
            if (contains(ref.url) || is_root(ref.url)) continue;
            auto child = make_node(ref.url, mode, targetFolder);
            if (!child) continue;
            child->fetch();
            if (ResourceNode* adopted = insert(std::move(child), mode)) descend(*adopted, mode, recursive);
        }
        return;
    }

    // siblings are fetched together and all registered before any of them is
    // crawled; recursion stays in reference order
    std::vector<std::unique_ptr<ResourceNode>> siblings;
    std::set<std::string> batched;
    for (const auto& ref : refs) {
        if (contains(ref.url) || is_root(ref.url) || !batched.insert(ref.url).second) continue;
        auto child = make_node(ref.url, mode, targetFolder);
        if (child) siblings.push_back(std::move(child));
    }
    fetch_all(siblings);
    std::vector<ResourceNode*> adopted;
    for (auto& child : siblings) {
        if (ResourceNode* raw = insert(std::move(child), mode)) adopted.push_back(raw);
    }
    for (ResourceNode* child : adopted) descend(*child, mode, recursive);
}
