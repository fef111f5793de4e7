#include "archive_encoder.hpp"

#include "mime_encoding.hpp"
#include "string_util.hpp"

#include <cstdlib>
#include <ctime>
#include <iostream>
#include <stdexcept>

#include <unistd.h>

#ifndef PAGE_ARCHIVER_VERSION
#define PAGE_ARCHIVER_VERSION "0.0.0"
#endif

const char* const ArchiveEncoder::kBoundary = "----=_NextPart_000_00";

ArchiveEncoder::ArchiveEncoder(FileSystem& files) : files_(files) {}

// -------------------- small utils --------------------
std::string ArchiveEncoder::date_string(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&t, &local);

    char text[64];
    std::strftime(text, sizeof(text), "%a, %d %b %Y %H:%M:%S ", &local);
    char zone[16];
    std::strftime(zone, sizeof(zone), "%z", &local);

    // +0100 -> +01:00
    std::string offset = zone;
    if (offset.size() == 5) offset.insert(3, ":");
    return std::string(text) + offset;
}

std::string ArchiveEncoder::sender() {
    const char* user = std::getenv("USER");
    if (!user || !*user) user = std::getenv("LOGNAME");
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0) host[0] = '\0';
    return "<Saved by " + std::string(user ? user : "unknown") + " on " +
           std::string(*host ? host : "localhost") + ">";
}

void ArchiveEncoder::append_line(const std::string& line) {
    buffer_ += line;
    buffer_ += "\r\n";
}

void ArchiveEncoder::append_boundary() {
    append_line("");
    append_line(std::string("--") + kBoundary);
}

void ArchiveEncoder::require_open(const char* operation) const {
    if (state_ != State::HeaderWritten && state_ != State::PartWritten) {
        throw std::logic_error(std::string(operation) + " requires write_header() first");
    }
}

// -------------------- header --------------------
void ArchiveEncoder::write_header(const ResourceNode& root) {
    if (state_ != State::Empty && state_ != State::Finalized) {
        throw std::logic_error("write_header() called twice without finalize()");
    }
    buffer_.clear();

    append_line("From: " + sender());
    // header values stay on one line
    append_line("Subject: " + (root.is_html() ? StringUtil::collapse_whitespace(root.html_title()) : std::string()));
    append_line("Date: " + date_string(std::chrono::system_clock::now()));
    append_line("MIME-Version: 1.0");
    append_line("Content-Type: multipart/related;");
    append_line("\ttype=\"text/html\";");
    append_line(std::string("\tboundary=\"") + kBoundary + "\"");
    append_line("X-MimeOLE: Produced by PageArchiver " PAGE_ARCHIVER_VERSION);
    append_line("");
    append_line("This is a multi-part message in MIME format.");
    state_ = State::HeaderWritten;
}

// -------------------- parts --------------------
void ArchiveEncoder::write_part(ResourceNode& node) {
    require_open("write_part()");
    if (node.appended()) return;
    if (node.fetched()) {
        if (node.is_binary()) append_binary_part(node);
        else append_text_part(node);
        state_ = State::PartWritten;
    }
    node.set_appended(true);
}

void ArchiveEncoder::append_text_part(const ResourceNode& node) {
    const TextEncoding enc = node.text_encoding();
    append_boundary();
    append_line("Content-Type: " + node.content_type() + ";");
    append_line(std::string("\tcharset=\"") + enc.web_name() + "\"");
    append_line("Content-Transfer-Encoding: quoted-printable");
    append_line("Content-Location: " + node.url());
    append_line("");
    append_line(MimeEncoding::quoted_printable_encode(node.bytes(), enc));
}

void ArchiveEncoder::append_binary_part(const ResourceNode& node) {
    append_boundary();
    append_line("Content-Type: " + node.content_type());
    append_line("Content-Transfer-Encoding: base64");
    append_line("Content-Location: " + node.url());
    append_line("");
    for (const auto& line : MimeEncoding::base64_lines(binary_body(node))) append_line(line);
}

// Disk backed nodes are read back from their saved file.
std::string ArchiveEncoder::binary_body(const ResourceNode& node) const {
    if (node.storage() == StorageMode::Memory) return node.bytes();
    try {
        return files_.read_file(node.download_path());
    } catch (const FileSystemError& e) {
        std::cerr << "Reading " << e.path() << " failed, using the downloaded copy" << std::endl;
        return node.bytes();
    }
}

void ArchiveEncoder::write_all(ResourceNode& root, const ResourceGraph& graph) {
    write_header(root);
    write_part(root);
    for (const auto& entry : graph) write_part(*entry.second);
    append_boundary();
}

// -------------------- finalize --------------------
std::string ArchiveEncoder::finalize() {
    require_open("finalize()");
    std::string out;
    out.swap(buffer_);
    state_ = State::Finalized;
    return out;
}

bool ArchiveEncoder::finalize(const std::string& path) {
    std::string out = finalize();
    try {
        files_.write_file(path, out);
    } catch (const FileSystemError& e) {
        std::cerr << "Writing archive failed: " << e.what() << std::endl;
        return false;
    }
    return true;
}
