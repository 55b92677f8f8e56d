#include "dispatcher.hpp"

#include "archive_extractor.hpp"
#include "document_extractor.hpp"
#include "extraction_error.hpp"
#include "image_formats.hpp"
#include "mupdf_document.hpp"

#include <chrono>
#include <cstdio>
#include <system_error>

namespace fs = std::filesystem;

namespace pagedecode {

namespace {

std::vector<fs::path> decode_archive(const fs::path &input, const fs::path &output_dir,
                                     const DecodeConfig &config, ExtractionObserver &observer) {
    observer.debug("Matched input format: ZIP / CBZ");

    ArchiveOptions options;
    if (config.extract_images_only) {
        options.filter = images_only_filter(config.accept_extended_image_formats);
    }
    options.ordering = config.simple_sorting ? PageOrdering::Lexicographic
                                             : PageOrdering::Natural;

    return extract_archive(input, output_dir, options, observer);
}

std::vector<fs::path> decode_pdf(const fs::path &input, const fs::path &output_dir,
                                 const DecodeConfig &config, ExtractionObserver &observer) {
    observer.debug("Matched input format: PDF");
    observer.trace("Opening input file...", {{"path", input.string()}});

    MuPdfDocument document(input);
    return extract_document_images(document, output_dir, config.skip_bad_pdf_pages, observer);
}

// Make sure `output` is a usable directory, creating it when allowed
void prepare_output_dir(const fs::path &output, bool create) {
    std::error_code ec;
    if (!fs::exists(output, ec)) {
        if (!create) {
            throw ExtractionError(ErrorKind::OutputDirectoryNotFound,
                                  "Output directory not found: " + output.string(),
                                  output.string());
        }
        fs::create_directories(output, ec);
        if (ec) {
            throw ExtractionError(ErrorKind::OutputDirectoryCreateFailed,
                                  "Failed to create output directory " + output.string() +
                                      ": " + ec.message(),
                                  output.string());
        }
    } else if (!fs::is_directory(output, ec)) {
        throw ExtractionError(ErrorKind::OutputDirectoryIsAFile,
                              "Output path is a file: " + output.string(), output.string());
    }
}

} // namespace

std::vector<fs::path> decode_file(const fs::path &input, const fs::path &output_dir,
                                  const DecodeConfig &config, ExtractionObserver &observer) {
    // Get the input file's extension to determine its format
    std::string raw_ext = input.extension().string();
    if (raw_ext.size() <= 1) {
        throw ExtractionError(ErrorKind::UnsupportedFormat,
                              "Input file has no extension: " + input.filename().string(), "");
    }
    raw_ext.erase(0, 1);

    if (!is_valid_utf8(raw_ext)) {
        throw ExtractionError(ErrorKind::InvalidExtensionEncoding,
                              "Input file has an extension that is not valid UTF-8: " +
                                  input.filename().string(),
                              input.filename().string());
    }

    std::string ext = normalize_ext(raw_ext);

    // Get timestamp to measure decoding time
    auto extraction_started = std::chrono::steady_clock::now();

    std::vector<fs::path> pages;
    if (ext == "zip" || ext == "cbz") {
        pages = decode_archive(input, output_dir, config, observer);
    } else if (ext == "pdf") {
        pages = decode_pdf(input, output_dir, config, observer);
    } else {
        if (is_supported_for_decoding(ext)) {
            observer.warn("Internal error: format cannot be handled but is marked as supported "
                          "nonetheless",
                          {{"format", ext}});
        }
        throw ExtractionError(ErrorKind::UnsupportedFormat,
                              "Unsupported format: " + raw_ext, raw_ext);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - extraction_started);
    char seconds[32];
    std::snprintf(seconds, sizeof(seconds), "%lld.%03lld",
                  static_cast<long long>(elapsed.count() / 1000),
                  static_cast<long long>(elapsed.count() % 1000));

    observer.info("Successfully extracted pages", {{"count", std::to_string(pages.size())},
                                                   {"elapsed_s", seconds}});
    return pages;
}

std::vector<fs::path> decode(const DecodeRequest &request, ExtractionObserver &observer) {
    // Get absolute path to the input for path manipulation
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        throw ExtractionError(ErrorKind::CwdUnavailable,
                              "Failed to get the current working directory: " + ec.message());
    }
    fs::path input = cwd / request.input;

    if (!fs::exists(input, ec)) {
        throw ExtractionError(ErrorKind::InputNotFound,
                              "Input file not found: " + input.string(), input.string());
    }
    if (!fs::is_regular_file(input, ec)) {
        throw ExtractionError(ErrorKind::InputIsDirectory,
                              "Input path is not a file: " + input.string(), input.string());
    }

    fs::path output;
    if (request.output) {
        output = *request.output;
        prepare_output_dir(output, request.create_output_dir);
    } else {
        output = fs::path(input).replace_extension();
        prepare_output_dir(output, true);
    }

    observer.debug("Decoding", {{"input", input.string()}, {"output", output.string()}});
    return decode_file(input, output, request.config, observer);
}

} // namespace pagedecode
