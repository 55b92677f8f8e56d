#pragma once

#include <stdexcept>
#include <string>

namespace pagedecode {

enum class ErrorKind {
    // Input validation
    CwdUnavailable,
    InputNotFound,
    InputIsDirectory,
    OutputDirectoryNotFound,
    OutputDirectoryIsAFile,
    OutputDirectoryCreateFailed,

    // Format
    UnsupportedFormat,
    InvalidExtensionEncoding,

    // Container
    ArchiveOpenFailed,
    InvalidArchive,
    EntryUnreadable,
    DocumentOpenFailed,
    PageUnreadable,
    PageResourcesUnreadable,

    // I/O
    OutputFileCreateFailed,
    EntryCopyFailed,
    EntryNameInvalidEncoding,
    RenameFailed,
    ImageWriteFailed
};

// Stable snake_case identifier, used by front ends to render diagnostics
const char *error_kind_name(ErrorKind kind);

// The single error type thrown by the extraction pipeline.
// `subject` is whatever the error concerns: an extension, a path or a path
// inside the container. `page` is the 1-based PDF page number, 0 otherwise.
class ExtractionError : public std::runtime_error {
public:
    ExtractionError(ErrorKind kind, const std::string &message,
                    std::string subject = std::string(), int page = 0);

    ErrorKind kind() const { return kind_; }
    const std::string &subject() const { return subject_; }
    int page() const { return page_; }

private:
    ErrorKind kind_;
    std::string subject_;
    int page_;
};

} // namespace pagedecode
