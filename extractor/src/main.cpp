#include "dispatcher.hpp"
#include "extraction_error.hpp"
#include "json_output.hpp"
#include "observer.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace pagedecode;

void print_usage(const char *prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " <file.cbz|file.zip|file.pdf> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --output <dir>         Output directory (default: input path without extension)\n"
              << "  --create-output-dir    Create the output directory if it does not exist\n"
              << "  --all-files            Extract every archive entry, not only images\n"
              << "  --extended-formats     Accept less common image formats (tiff, avif, ...)\n"
              << "  --simple-sorting       Order archive pages lexicographically\n"
              << "  --skip-bad-pages       Warn about unreadable PDF pages instead of failing\n"
              << "  --quiet | --verbose | --trace\n"
              << "\n"
              << "Output: JSON to stdout.\n"
              << "Logs/errors go to stderr.\n";
}

int main(int argc, char *argv[]) {
    if (argc < 2) { print_usage(argv[0]); return 1; }

    DecodeRequest request;
    LogLevel log_level = LogLevel::Info;
    std::string file_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--output" && i + 1 < argc) {
            request.output = fs::path(argv[++i]);
        } else if (arg == "--create-output-dir") {
            request.create_output_dir = true;
        } else if (arg == "--all-files") {
            request.config.extract_images_only = false;
        } else if (arg == "--extended-formats") {
            request.config.accept_extended_image_formats = true;
        } else if (arg == "--simple-sorting") {
            request.config.simple_sorting = true;
        } else if (arg == "--skip-bad-pages") {
            request.config.skip_bad_pdf_pages = true;
        } else if (arg == "--quiet") {
            log_level = LogLevel::Warn;
        } else if (arg == "--verbose") {
            log_level = LogLevel::Debug;
        } else if (arg == "--trace") {
            log_level = LogLevel::Trace;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (file_path.empty() && arg[0] != '-') {
            file_path = arg;
        } else {
            std::cerr << "Error: unexpected argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (file_path.empty()) {
        std::cerr << "Error: file path required\n";
        print_usage(argv[0]);
        return 1;
    }
    request.input = file_path;

    StderrObserver observer(log_level);

    try {
        std::vector<fs::path> pages = decode(request, observer);
        write_success_json(std::cout, file_path, pages);
    } catch (const ExtractionError &e) {
        std::cerr << "Error: " << e.what() << "\n";
        write_failure_json(std::cout, file_path, error_kind_name(e.kind()), e.what());
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        write_failure_json(std::cout, file_path, "internal", e.what());
        return 1;
    }

    return 0;
}
