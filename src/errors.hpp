#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    InvalidUrl,
    InvalidFileName,
    InvalidExtension,
    DownloadFailed,
    NotHtmlOperation
};

const char* to_string(ErrorKind kind);

// Base for every failure the builder reports to its caller.
class ArchiveError : public std::runtime_error {
public:
    ArchiveError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidUrlError : public ArchiveError {
public:
    explicit InvalidUrlError(std::string url);

    const std::string& url() const { return url_; }

private:
    std::string url_;
};

// Raised before any network activity when an output path does not carry one of
// the allowed extensions. kind() is InvalidFileName when the extension is
// missing and InvalidExtension when it is not in the allowed set.
class InvalidFileNameError : public ArchiveError {
public:
    InvalidFileNameError(ErrorKind kind, std::string path, std::string allowedExtensions);

    const std::string& path() const { return path_; }
    const std::string& allowed_extensions() const { return allowed_; }

private:
    std::string path_;
    std::string allowed_;
};

class DownloadFailedError : public ArchiveError {
public:
    DownloadFailedError(std::string url, std::string cause);

    const std::string& url() const { return url_; }
    const std::string& cause() const { return cause_; }

private:
    std::string url_;
    std::string cause_;
};

class NotHtmlError : public ArchiveError {
public:
    NotHtmlError(std::string contentType, const std::string& operation);

    const std::string& content_type() const { return contentType_; }

private:
    std::string contentType_;
};
