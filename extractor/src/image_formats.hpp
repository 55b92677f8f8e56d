#pragma once

#include <string>

namespace pagedecode {

// Normalize a file extension to lowercase (e.g. "PNG" -> "png")
std::string normalize_ext(const std::string &ext);

// Extension of the last segment of a slash-separated path, without the dot.
// Empty when the name has no extension (or is a dotfile such as ".hidden").
std::string path_extension(const std::string &path);

// True when `path` names an image by its extension. The extended set adds
// formats that are less common in comic archives (tiff, avif, ...).
bool has_image_ext(const std::string &path, bool accept_extended);

// Container formats the dispatcher knows how to decode
bool is_supported_for_decoding(const std::string &ext);

bool is_valid_utf8(const std::string &bytes);

} // namespace pagedecode
