#pragma once

#include "resource_node.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

// Every resource a page pulls in, keyed by the URL exactly as it was
// referenced. Iteration is in ascending key order, which is also the order
// parts are written to an archive. The page itself is not stored here.
class ResourceGraph {
public:
    using NodeMap = std::map<std::string, std::unique_ptr<ResourceNode>>;

    explicit ResourceGraph(const CrawlContext& ctx);

    // URLs naming the root (as referenced, resolved, or relocated by the
    // server) are never crawled.
    void set_root(const ResourceNode& root);

    // Fetches everything `root` references that is not known yet.
    void crawl(ResourceNode& root, StorageMode mode, bool recursive);

    // Children are placed in targetFolder for disk storage; embedded HTML/CSS
    // children recurse into their own <name>_files folder.
    void crawl_references(ResourceNode& node, StorageMode mode, const std::string& targetFolder, bool recursive);

    bool contains(const std::string& url) const { return nodes_.count(url) != 0; }
    const ResourceNode* find(const std::string& url) const;
    ResourceNode* find(const std::string& url);

    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }
    void clear();

    NodeMap::const_iterator begin() const { return nodes_.begin(); }
    NodeMap::const_iterator end() const { return nodes_.end(); }

private:
    bool is_root(const std::string& url) const;
    std::unique_ptr<ResourceNode> make_node(const std::string& url, StorageMode mode, const std::string& targetFolder);
    void fetch_all(std::vector<std::unique_ptr<ResourceNode>>& nodes) const;
    // Takes ownership unless the URL is already known; returns the stored node or nullptr.
    ResourceNode* insert(std::unique_ptr<ResourceNode> node, StorageMode mode);
    void descend(ResourceNode& node, StorageMode mode, bool recursive);

    CrawlContext ctx_;
    NodeMap nodes_;
    std::set<std::string> rootUrls_;
};
