#include "extraction_error.hpp"

#include <utility>

namespace pagedecode {

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CwdUnavailable:              return "cwd_unavailable";
        case ErrorKind::InputNotFound:               return "input_not_found";
        case ErrorKind::InputIsDirectory:            return "input_is_directory";
        case ErrorKind::OutputDirectoryNotFound:     return "output_directory_not_found";
        case ErrorKind::OutputDirectoryIsAFile:      return "output_directory_is_a_file";
        case ErrorKind::OutputDirectoryCreateFailed: return "output_directory_create_failed";
        case ErrorKind::UnsupportedFormat:           return "unsupported_format";
        case ErrorKind::InvalidExtensionEncoding:    return "invalid_extension_encoding";
        case ErrorKind::ArchiveOpenFailed:           return "archive_open_failed";
        case ErrorKind::InvalidArchive:              return "invalid_archive";
        case ErrorKind::EntryUnreadable:             return "entry_unreadable";
        case ErrorKind::DocumentOpenFailed:          return "document_open_failed";
        case ErrorKind::PageUnreadable:              return "page_unreadable";
        case ErrorKind::PageResourcesUnreadable:     return "page_resources_unreadable";
        case ErrorKind::OutputFileCreateFailed:      return "output_file_create_failed";
        case ErrorKind::EntryCopyFailed:             return "entry_copy_failed";
        case ErrorKind::EntryNameInvalidEncoding:    return "entry_name_invalid_encoding";
        case ErrorKind::RenameFailed:                return "rename_failed";
        case ErrorKind::ImageWriteFailed:            return "image_write_failed";
    }
    return "unknown";
}

ExtractionError::ExtractionError(ErrorKind kind, const std::string &message,
                                 std::string subject, int page)
    : std::runtime_error(message), kind_(kind), subject_(std::move(subject)), page_(page) {}

} // namespace pagedecode
