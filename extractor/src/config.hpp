#pragma once

#include <filesystem>
#include <optional>

namespace pagedecode {

struct DecodeConfig {
    bool extract_images_only = true;
    bool accept_extended_image_formats = false;
    bool simple_sorting = false;  // lexicographic instead of natural page order
    bool skip_bad_pdf_pages = false;
};

// Everything the front end collected from the command line
struct DecodeRequest {
    std::filesystem::path input;
    std::optional<std::filesystem::path> output;  // defaults to the input path without its extension
    bool create_output_dir = false;
    DecodeConfig config;
};

} // namespace pagedecode
