#pragma once

#include "config.hpp"
#include "observer.hpp"

#include <filesystem>
#include <vector>

namespace pagedecode {

// Pick the extractor for `input` from its extension (zip/cbz or pdf, any
// case) and run it. `input` must be an existing file and `output_dir` an
// existing directory. Returns the extracted pages in order.
std::vector<std::filesystem::path> decode_file(const std::filesystem::path &input,
                                               const std::filesystem::path &output_dir,
                                               const DecodeConfig &config,
                                               ExtractionObserver &observer);

// Validate the request's paths, create the output directory if needed, then
// run decode_file.
std::vector<std::filesystem::path> decode(const DecodeRequest &request,
                                          ExtractionObserver &observer);

} // namespace pagedecode
