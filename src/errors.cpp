#include "errors.hpp"

#include <utility>

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidUrl: return "InvalidUrl";
        case ErrorKind::InvalidFileName: return "InvalidFileName";
        case ErrorKind::InvalidExtension: return "InvalidExtension";
        case ErrorKind::DownloadFailed: return "DownloadFailed";
        case ErrorKind::NotHtmlOperation: return "NotHtmlOperation";
    }
    return "Unknown";
}

InvalidUrlError::InvalidUrlError(std::string url)
    : ArchiveError(ErrorKind::InvalidUrl, "'" + url + "' does not appear to be a valid URL."),
      url_(std::move(url)) {}

InvalidFileNameError::InvalidFileNameError(ErrorKind kind, std::string path, std::string allowedExtensions)
    : ArchiveError(kind,
                   (kind == ErrorKind::InvalidExtension
                        ? "The extension of '" + path + "' is not allowed"
                        : "'" + path + "' has no file extension") +
                       "; expected one of: " + allowedExtensions),
      path_(std::move(path)),
      allowed_(std::move(allowedExtensions)) {}

DownloadFailedError::DownloadFailedError(std::string url, std::string cause)
    : ArchiveError(ErrorKind::DownloadFailed, "Unable to download '" + url + "': " + cause),
      url_(std::move(url)),
      cause_(std::move(cause)) {}

NotHtmlError::NotHtmlError(std::string contentType, const std::string& operation)
    : ArchiveError(ErrorKind::NotHtmlOperation,
                   operation + " only makes sense for HTML or CSS content; this file is of type '" +
                       contentType + "'"),
      contentType_(std::move(contentType)) {}
