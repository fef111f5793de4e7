#pragma once

#include "file_system.hpp"
#include "resource_graph.hpp"
#include "resource_node.hpp"

#include <chrono>
#include <string>

// Builds one multipart/related (MHT) archive. Lines end in CRLF.
//
//   Empty -> HeaderWritten -> PartWritten* -> Finalized
//
// Calls out of that order throw std::logic_error. A finalized encoder may
// start over with write_header().
class ArchiveEncoder {
public:
    enum class State { Empty, HeaderWritten, PartWritten, Finalized };

    static const char* const kBoundary;

    explicit ArchiveEncoder(FileSystem& files);

    // Message headers and preamble; Subject is the root's title.
    void write_header(const ResourceNode& root);

    // One part per fetched node; nodes already appended or not fetched are skipped.
    void write_part(ResourceNode& node);

    // Header, root part, graph parts in key order, then a closing boundary
    // line without the trailing "--".
    void write_all(ResourceNode& root, const ResourceGraph& graph);

    // Hands back the archive and resets the buffer.
    std::string finalize();
    // Writes the archive to path. Write failures are reported on stderr and
    // yield false; the buffer is reset either way.
    bool finalize(const std::string& path);

    State state() const { return state_; }
    size_t size() const { return buffer_.size(); }

    // "Mon, 02 Jan 2006 15:04:05 +01:00" in local time.
    static std::string date_string(std::chrono::system_clock::time_point when);

private:
    void append_line(const std::string& line);
    void append_boundary();
    void append_text_part(const ResourceNode& node);
    void append_binary_part(const ResourceNode& node);
    std::string binary_body(const ResourceNode& node) const;
    void require_open(const char* operation) const;

    static std::string sender();

    FileSystem& files_;
    std::string buffer_;
    State state_ = State::Empty;
};
