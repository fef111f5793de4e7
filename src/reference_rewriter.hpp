#pragma once

#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

// One external reference found in HTML/CSS. `delimited` is the literal text
// matched, including its quotes or parentheses when present; `url` is the bare
// absolute URL inside it. The delimiters make the later replacement specific.
struct Reference {
    std::string delimited;
    std::string url;
};

// Insertion-ordered, unique by delimited text (not by url).
class ReferenceMap {
public:
    using const_iterator = std::vector<Reference>::const_iterator;

    // Returns false and keeps the first entry if `delimited` is already present.
    bool add(const std::string& delimited, const std::string& url);
    const std::string* find(const std::string& delimited) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    std::vector<Reference> entries_;
    std::unordered_map<std::string, size_t> index_;
};

class ReferenceRewriter {
public:
    // Maps a bare absolute URL to the local path that should replace it, or
    // nullopt to leave the reference alone.
    using LocalPathLookup = std::function<std::optional<std::string>(const std::string& url)>;

    // href/src/background attributes and CSS @import, *-image: and background:
    // references: root-relative values get `root` prepended, path-relative
    // values get `folder`. Quoting and delimiters are kept as found.
    static std::string to_absolute(const std::string& content, const std::string& root, const std::string& folder);

    // src=/background= attributes, CSS url()/@import, <link href>, <iframe|frame src>.
    // Only absolute http(s) URLs are kept.
    static ReferenceMap extract_references(const std::string& content);

    static std::string to_local(const std::string& content, const ReferenceMap& references,
                                const LocalPathLookup& localPath);

    // Value of the first <base href>, trailing slash stripped.
    static std::optional<std::string> base_href(const std::string& html);
    static std::string remove_base_tags(const std::string& html);

    // Puts newPath between the delimiters found around `delimited`.
    static std::string rewrap(const std::string& delimited, const std::string& newPath);

private:
    static void add_matches(const std::string& content, const std::regex& re,
                            const std::vector<std::pair<int, int>>& keyValueGroups, ReferenceMap& out);
    static std::string escape_format(const std::string& s);
    static std::string replace_all(std::string s, const std::string& from, const std::string& to);
};
