#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

class FileSystemError : public std::runtime_error {
public:
    FileSystemError(std::string path, const std::string& message)
        : std::runtime_error(message + ": " + path), path_(std::move(path)) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual void create_directories(const std::string& path) = 0;
    // Creates or truncates.
    virtual void write_file(const std::string& path, const std::string& data) = 0;
    virtual std::string read_file(const std::string& path) const = 0;
    virtual bool remove_file(const std::string& path) = 0;
    virtual bool remove_directory(const std::string& path) = 0;
    virtual std::vector<std::string> list_directory(const std::string& path) const = 0;
    virtual bool exists(const std::string& path) const = 0;
};

class LocalFileSystem : public FileSystem {
public:
    void create_directories(const std::string& path) override;
    void write_file(const std::string& path, const std::string& data) override;
    std::string read_file(const std::string& path) const override;
    bool remove_file(const std::string& path) override;
    bool remove_directory(const std::string& path) override;
    std::vector<std::string> list_directory(const std::string& path) const override;
    bool exists(const std::string& path) const override;
};
