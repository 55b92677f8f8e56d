#pragma once

#include "natural_order.hpp"
#include "observer.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace pagedecode {

// Decides from an entry's sanitized path whether it is a page
using EntryFilter = std::function<bool(const std::string &)>;

EntryFilter images_only_filter(bool accept_extended);
EntryFilter accept_all_filter();

struct ArchiveOptions {
    EntryFilter filter = accept_all_filter();
    PageOrdering ordering = PageOrdering::Natural;
};

// Normalize a ZIP entry name: backslashes become '/', and empty, "." and ".."
// segments are dropped so the result never escapes its root.
std::string sanitize_entry_path(const std::string &raw_name);

// Extract every page of a ZIP/CBZ archive into `output_dir`, named
// 1.ext, 2.ext, ... (zero-padded) in the order given by `options.ordering`.
// Returns the written paths in page order. Throws ExtractionError on the
// first failure, leaving already staged files in place.
std::vector<std::filesystem::path> extract_archive(const std::filesystem::path &archive_path,
                                                   const std::filesystem::path &output_dir,
                                                   const ArchiveOptions &options,
                                                   ExtractionObserver &observer);

} // namespace pagedecode
