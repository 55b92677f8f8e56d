#include "archive_extractor.hpp"

#include "extraction_error.hpp"
#include "image_formats.hpp"
#include "page_naming.hpp"

#include <zip.h>

#include <algorithm>
#include <fstream>
#include <memory>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace pagedecode {

namespace {

constexpr size_t COPY_CHUNK_SIZE = 64 * 1024;

// A page that has been copied out of the archive but not yet renamed
struct StagedPage {
    std::string path_in_zip;
    fs::path extracted_path;
    std::optional<std::string> extension;
};

struct ZipArchiveCloser {
    void operator()(zip_t *archive) const { zip_discard(archive); }
};

struct ZipFileCloser {
    void operator()(zip_file_t *file) const { zip_fclose(file); }
};

using ZipArchivePtr = std::unique_ptr<zip_t, ZipArchiveCloser>;
using ZipFilePtr = std::unique_ptr<zip_file_t, ZipFileCloser>;

std::string zip_error_message(int error_code) {
    zip_error_t error;
    zip_error_init_with_code(&error, error_code);
    std::string message = zip_error_strerror(&error);
    zip_error_fini(&error);
    return message;
}

ZipArchivePtr open_archive(const fs::path &archive_path) {
    int zip_error = 0;
    zip_t *archive = zip_open(archive_path.c_str(), ZIP_RDONLY, &zip_error);
    if (archive) {
        return ZipArchivePtr(archive);
    }

    std::string message = zip_error_message(zip_error);
    switch (zip_error) {
        case ZIP_ER_NOENT:
        case ZIP_ER_OPEN:
        case ZIP_ER_READ:
        case ZIP_ER_SEEK:
        case ZIP_ER_MEMORY:
            throw ExtractionError(ErrorKind::ArchiveOpenFailed,
                                  "Failed to open ZIP file: " + message,
                                  archive_path.string());
        default:
            throw ExtractionError(ErrorKind::InvalidArchive,
                                  "Invalid ZIP archive: " + message,
                                  archive_path.string());
    }
}

// Stream one entry's decompressed bytes into `outpath`. The entry handle is
// closed before returning, on every path.
void copy_entry(zip_t *archive, zip_uint64_t entry_idx, const std::string &path_in_zip,
                const fs::path &outpath) {
    ZipFilePtr zip_handle(zip_fopen_index(archive, entry_idx, 0));
    if (!zip_handle) {
        throw ExtractionError(ErrorKind::EntryUnreadable,
                              "Failed to open ZIP entry '" + path_in_zip + "': " +
                                  zip_strerror(archive),
                              path_in_zip);
    }

    std::ofstream output_file(outpath, std::ios::binary | std::ios::trunc);
    if (!output_file.is_open()) {
        throw ExtractionError(ErrorKind::OutputFileCreateFailed,
                              "Failed to create output file " + outpath.string(),
                              outpath.string());
    }

    std::vector<char> chunk(COPY_CHUNK_SIZE);
    for (;;) {
        zip_int64_t bytes_read = zip_fread(zip_handle.get(), chunk.data(), chunk.size());
        if (bytes_read < 0) {
            throw ExtractionError(ErrorKind::EntryCopyFailed,
                                  "Failed to extract ZIP entry '" + path_in_zip + "' to " +
                                      outpath.string() + ": " +
                                      zip_file_strerror(zip_handle.get()),
                                  path_in_zip);
        }
        if (bytes_read == 0) break;

        output_file.write(chunk.data(), static_cast<std::streamsize>(bytes_read));
        if (!output_file) {
            throw ExtractionError(ErrorKind::EntryCopyFailed,
                                  "Failed to write ZIP entry '" + path_in_zip + "' to " +
                                      outpath.string(),
                                  path_in_zip);
        }
    }

    output_file.close();
    if (!output_file) {
        throw ExtractionError(ErrorKind::EntryCopyFailed,
                              "Failed to flush " + outpath.string(), path_in_zip);
    }
}

} // namespace

EntryFilter images_only_filter(bool accept_extended) {
    return [accept_extended](const std::string &path) {
        return has_image_ext(path, accept_extended);
    };
}

EntryFilter accept_all_filter() {
    return [](const std::string &) { return true; };
}

std::string sanitize_entry_path(const std::string &raw_name) {
    std::string sanitized;
    std::string segment;

    auto flush_segment = [&]() {
        if (!segment.empty() && segment != "." && segment != "..") {
            if (!sanitized.empty()) sanitized += '/';
            sanitized += segment;
        }
        segment.clear();
    };

    for (char ch : raw_name) {
        if (ch == '/' || ch == '\\') {
            flush_segment();
        } else {
            segment += ch;
        }
    }
    flush_segment();

    return sanitized;
}

std::vector<fs::path> extract_archive(const fs::path &archive_path,
                                      const fs::path &output_dir,
                                      const ArchiveOptions &options,
                                      ExtractionObserver &observer) {
    observer.trace("Opening ZIP archive...", {{"path", archive_path.string()}});
    ZipArchivePtr archive = open_archive(archive_path);

    zip_int64_t total_entries = zip_get_num_entries(archive.get(), 0);
    std::vector<StagedPage> pages;

    for (zip_int64_t entry_idx = 0; entry_idx < total_entries; entry_idx++) {
        std::string entry_no = std::to_string(entry_idx + 1) + "/" + std::to_string(total_entries);
        observer.trace("Retrieving ZIP entry...", {{"entry", entry_no}});

        // Raw names: libzip's default guessing would convert any non-UTF-8
        // name from CP437 and hide encoding problems from the check below
        zip_stat_t entry_stat;
        zip_stat_init(&entry_stat);
        if (zip_stat_index(archive.get(), entry_idx, ZIP_FL_ENC_RAW, &entry_stat) != 0 ||
            !(entry_stat.valid & ZIP_STAT_NAME)) {
            throw ExtractionError(ErrorKind::EntryUnreadable,
                                  "Failed to read ZIP entry " + entry_no + ": " +
                                      zip_strerror(archive.get()),
                                  entry_no);
        }

        // Ignore folders
        std::string raw_name = entry_stat.name;
        if (raw_name.empty() || raw_name.back() == '/' || raw_name.back() == '\\') {
            continue;
        }

        std::string path_in_zip = sanitize_entry_path(raw_name);
        if (path_in_zip.empty()) {
            continue;
        }

        if (!options.filter(path_in_zip)) {
            observer.trace("Ignoring file based on extension", {{"entry", entry_no},
                                                                {"name", path_in_zip}});
            continue;
        }

        std::optional<std::string> extension;
        std::string ext = path_extension(path_in_zip);
        if (!ext.empty()) {
            if (!is_valid_utf8(ext)) {
                throw ExtractionError(ErrorKind::EntryNameInvalidEncoding,
                                      "ZIP entry '" + path_in_zip +
                                          "' has a file extension that is not valid UTF-8",
                                      path_in_zip);
            }
            extension = ext;
        }

        fs::path outpath = output_dir / ("___tmp_pic_" + std::to_string(pages.size()));

        observer.debug("Extracting file...", {{"entry", entry_no}, {"name", path_in_zip}});
        copy_entry(archive.get(), static_cast<zip_uint64_t>(entry_idx), path_in_zip, outpath);

        pages.push_back({path_in_zip, outpath, extension});
    }

    // Entries are not needed past this point
    archive.reset();

    observer.trace("Sorting pages...", {{"count", std::to_string(pages.size())}});
    PageOrdering ordering = options.ordering;
    std::stable_sort(pages.begin(), pages.end(),
                     [ordering](const StagedPage &a, const StagedPage &b) {
                         return paths_compare(ordering, a.path_in_zip, b.path_in_zip) < 0;
                     });

    size_t total_pages = pages.size();
    size_t width = pad_width(total_pages);
    std::vector<fs::path> extracted;
    extracted.reserve(total_pages);

    observer.debug("Renaming pictures...");

    for (size_t i = 0; i < total_pages; i++) {
        const StagedPage &page = pages[i];
        fs::path target = output_dir / padded_page_name(i, width, page.extension.value_or(""));

        observer.trace("Renaming picture...", {{"page", std::to_string(i + 1) + "/" +
                                                            std::to_string(total_pages)},
                                               {"from", page.path_in_zip}});

        std::error_code ec;
        fs::rename(page.extracted_path, target, ec);
        if (ec) {
            throw ExtractionError(ErrorKind::RenameFailed,
                                  "Failed to rename " + page.extracted_path.string() + " to " +
                                      target.string() + ": " + ec.message(),
                                  page.extracted_path.string());
        }

        extracted.push_back(target);
    }

    return extracted;
}

} // namespace pagedecode
