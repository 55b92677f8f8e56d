#pragma once

#include <string>

namespace pagedecode {

// How staged archive pages are put in reading order
enum class PageOrdering {
    Natural,       // digit runs compare by numeric value ("page2" < "page10")
    Lexicographic  // plain byte-wise comparison of each path segment
};

// Compare two strings, treating runs of decimal digits as unsigned integers.
// Returns <0, 0 or >0.
int natural_compare(const std::string &lhs, const std::string &rhs);

// Compare two slash-separated paths segment by segment with natural_compare
int natural_paths_compare(const std::string &lhs, const std::string &rhs);

// Compare two slash-separated paths segment by segment, byte-wise
int simple_paths_compare(const std::string &lhs, const std::string &rhs);

int paths_compare(PageOrdering ordering, const std::string &lhs, const std::string &rhs);

} // namespace pagedecode
