#include "file_system.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

void LocalFileSystem::create_directories(const std::string& path) {
    if (path.empty()) return;
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) throw FileSystemError(path, "Cannot create directory (" + ec.message() + ")");
}

void LocalFileSystem::write_file(const std::string& path, const std::string& data) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) throw FileSystemError(path, "Cannot open file for writing");
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.close();
    if (!ofs) throw FileSystemError(path, "Write failed");
}

std::string LocalFileSystem::read_file(const std::string& path) const {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) throw FileSystemError(path, "Cannot open file for reading");
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

bool LocalFileSystem::remove_file(const std::string& path) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) throw FileSystemError(path, "Cannot delete file (" + ec.message() + ")");
    return removed;
}

bool LocalFileSystem::remove_directory(const std::string& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) return false;
    bool removed = fs::remove(path, ec);
    if (ec) throw FileSystemError(path, "Cannot delete directory (" + ec.message() + ")");
    return removed;
}

std::vector<std::string> LocalFileSystem::list_directory(const std::string& path) const {
    std::vector<std::string> entries;
    std::error_code ec;
    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path().string());
    }
    if (ec) throw FileSystemError(path, "Cannot list directory (" + ec.message() + ")");
    return entries;
}

bool LocalFileSystem::exists(const std::string& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}
