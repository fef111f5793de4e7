#include "reference_rewriter.hpp"

#include "url_resolver.hpp"

#include <regex>

namespace {

// std::regex recurses once per repeated character: every run is bounded and
// data: values are skipped before their payload is scanned.

// href="//host/x" style attributes
const char* const kAttrProtocolRelative =
    R"re((\shref|\ssrc|\sbackground)\s*?=\s*?(["'\\]{0,2})//(?=[^/]))re";
// href="/x"; the path-relative form is the same without the slash
const char* const kAttrRootRelative =
    R"re((\shref|\ssrc|\sbackground)\s*?=\s*?(["'\\]{0,2})(?!\s*\+|#|https?:|ftp:|mailto:|javascript:|data:)/(?!/)([^"'>\\]{1,2048})(["'\\]{0,2}))re";
const char* const kAttrPathRelative =
    R"re((\shref|\ssrc|\sbackground)\s*?=\s*?(["'\\]{0,2})(?!\s*\+|#|/|https?:|ftp:|mailto:|javascript:|data:)([^"'>\\\s][^"'>\\]{0,2047})(["'\\]{0,2}))re";

const char* const kCssRootRelative =
    R"re((@import\s|[\w-]{1,32}-image:|background:)(\s*?)(url)?(['"(]{1,2})(?!http)\s*/(?!/)([^"')]{1,2048})(['")]{1,2}))re";
const char* const kCssPathRelative =
    R"re((@import\s|[\w-]{1,32}-image:|background:)(\s*?)(url)?(['"(]{1,2})(?!http|data:|#|/)\s*([^"')\s][^"')]{0,2047})(['")]{1,2}))re";

const char* const kSrcAttr =
    R"re((\ssrc|\sbackground)\s*=\s*(?!["']?data:)(('([^']{1,2048})')|("([^"]{1,2048})")|(([^ \n\r\f\t>]{1,2048}))))re";
const char* const kCssRef =
    R"re((@import\s|[\w-]{1,32}-image:|background:)\s*?(url)?\s*?(?![("']{1,2}data:)(["'(]{1,2}([^"')]{1,2048})["')]{1,2}))re";
const char* const kLinkHref =
    R"re(<link[^>]{1,2048}?href\s*=\s*(?!['"]*data:)(('|")*([^'">]{1,2048})('|")*))re";
const char* const kFrameSrc =
    R"re(<i*frame[^>]{1,2048}?src\s*=\s*(?!['"]?data:)(['"]{0,1}([^'"\\>]{1,2048})['"]{0,1}))re";

const auto kFlags = std::regex::icase | std::regex::ECMAScript;

} // namespace

// -------------------- ReferenceMap --------------------
bool ReferenceMap::add(const std::string& delimited, const std::string& url) {
    if (index_.count(delimited)) return false;
    index_.emplace(delimited, entries_.size());
    entries_.push_back(Reference{delimited, url});
    return true;
}

const std::string* ReferenceMap::find(const std::string& delimited) const {
    auto it = index_.find(delimited);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].url;
}

// -------------------- helpers --------------------
std::string ReferenceRewriter::escape_format(const std::string& s) {
    std::string r;
    r.reserve(s.size());
    for (char c : s) {
        if (c == '$') r += "$$";
        else r += c;
    }
    return r;
}

std::string ReferenceRewriter::replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

std::string ReferenceRewriter::rewrap(const std::string& delimited, const std::string& newPath) {
    size_t lead = 0;
    while (lead < delimited.size() && (delimited[lead] == '"' || delimited[lead] == '\'' || delimited[lead] == '(')) {
        ++lead;
    }
    size_t trail = delimited.size();
    while (trail > lead && (delimited[trail - 1] == '"' || delimited[trail - 1] == '\'' || delimited[trail - 1] == ')')) {
        --trail;
    }
    return delimited.substr(0, lead) + newPath + delimited.substr(trail);
}

// -------------------- relative -> absolute --------------------
std::string ReferenceRewriter::to_absolute(const std::string& content, const std::string& root, const std::string& folder) {
    static const std::regex attrProtocol(kAttrProtocolRelative, kFlags);
    static const std::regex attrRoot(kAttrRootRelative, kFlags);
    static const std::regex attrPath(kAttrPathRelative, kFlags);
    static const std::regex cssRoot(kCssRootRelative, kFlags);
    static const std::regex cssPath(kCssPathRelative, kFlags);

    const std::string r = escape_format(root);
    const std::string f = escape_format(folder);

    std::string out = content;
    auto schemeEnd = root.find("://");
    if (schemeEnd != std::string::npos) {
        out = std::regex_replace(out, attrProtocol, "$1=$2" + escape_format(root.substr(0, schemeEnd)) + "://");
    }
    out = std::regex_replace(out, attrRoot, "$1=$2" + r + "/$3$4");
    out = std::regex_replace(out, attrPath, "$1=$2" + f + "/$3$4");
    out = std::regex_replace(out, cssRoot, "$1$2$3$4" + r + "/$5$6");
    out = std::regex_replace(out, cssPath, "$1$2$3$4" + f + "/$5$6");
    return out;
}

// -------------------- reference extraction --------------------
void ReferenceRewriter::add_matches(const std::string& content, const std::regex& re,
                                    const std::vector<std::pair<int, int>>& keyValueGroups, ReferenceMap& out) {
    for (std::sregex_iterator it(content.begin(), content.end(), re), end; it != end; ++it) {
        const std::smatch& m = *it;
        for (const auto& kv : keyValueGroups) {
            if (!m[kv.first].matched) continue;
            std::string value = m[kv.second].str();
            if (UrlResolver::is_absolute_http(value)) out.add(m[kv.first].str(), value);
            break;
        }
    }
}

ReferenceMap ReferenceRewriter::extract_references(const std::string& content) {
    static const std::regex srcAttr(kSrcAttr, kFlags);
    static const std::regex cssRef(kCssRef, kFlags);
    static const std::regex linkHref(kLinkHref, kFlags);
    static const std::regex frameSrc(kFrameSrc, kFlags);

    ReferenceMap refs;
    // src='x' ; background="x" ; src=x  (three quoting styles)
    add_matches(content, srcAttr, {{3, 4}, {5, 6}, {7, 8}}, refs);
    // @import "style.css" or url(style.css)
    add_matches(content, cssRef, {{3, 4}}, refs);
    // <link rel=stylesheet href="style.css">
    add_matches(content, linkHref, {{1, 3}}, refs);
    // <iframe src="page.htm"> or <frame src="page.htm">
    add_matches(content, frameSrc, {{1, 2}}, refs);
    return refs;
}

// -------------------- absolute -> local --------------------
std::string ReferenceRewriter::to_local(const std::string& content, const ReferenceMap& references,
                                       const LocalPathLookup& localPath) {
    std::string out = content;
    for (const auto& ref : references) {
        auto path = localPath(ref.url);
        if (!path) continue;
        out = replace_all(out, ref.delimited, rewrap(ref.delimited, *path));
    }
    return out;
}

// -------------------- <base href> --------------------
std::optional<std::string> ReferenceRewriter::base_href(const std::string& html) {
    static const std::regex re(R"re(<base[^>]{1,2048}?href=['"]{0,1}([^'">]{1,2048})['"]{0,1})re", kFlags);
    std::smatch m;
    if (!std::regex_search(html, m, re)) return std::nullopt;
    std::string value = m[1].str();
    if (!value.empty() && value.back() == '/') value.pop_back();
    if (value.empty()) return std::nullopt;
    return value;
}

std::string ReferenceRewriter::remove_base_tags(const std::string& html) {
    static const std::regex re(R"(<base[^>]*?>)", kFlags);
    return std::regex_replace(html, re, "");
}
