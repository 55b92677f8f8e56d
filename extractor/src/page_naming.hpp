#pragma once

#include <cstddef>
#include <string>

namespace pagedecode {

// Number of decimal digits needed to print the largest page number of a
// sequence of `count` pages. Never less than 1.
std::size_t pad_width(std::size_t count);

// Output file name of the page at 0-based `index`: the 1-based page number
// left-padded with zeros to `width`, plus "." and `extension` if not empty.
std::string padded_page_name(std::size_t index, std::size_t width, const std::string &extension);

} // namespace pagedecode
