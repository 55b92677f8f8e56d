#pragma once

#include "observer.hpp"

#include <filesystem>
#include <vector>

namespace pagedecode {

// A raster image referenced from a page's resources. It has no ordering key
// of its own; its position in the collected list is its page order.
struct EmbeddedImage {
    int page_number;    // 1-based
    int object_number;  // identifies the image inside the document
};

// A paged document that exposes the raster images of each page
class ImageDocument {
public:
    virtual ~ImageDocument() = default;

    virtual int count_pages() = 0;

    // Images of the page at 0-based `page_index`, in resource order.
    // Throws ExtractionError (PageUnreadable or PageResourcesUnreadable).
    virtual std::vector<EmbeddedImage> page_images(int page_index) = 0;

    // Fill `out` with the image as a JPEG file. Returns false when the
    // image has no JPEG form.
    virtual bool encode_jpeg(const EmbeddedImage &image, std::vector<unsigned char> &out) = 0;
};

// Write every image of `document` to `output_dir` as 1.jpg, 2.jpg, ...
// (zero-padded) in document order. With `skip_bad_pages`, pages that fail to
// resolve are reported as warnings and contribute no images.
std::vector<std::filesystem::path> extract_document_images(ImageDocument &document,
                                                           const std::filesystem::path &output_dir,
                                                           bool skip_bad_pages,
                                                           ExtractionObserver &observer);

} // namespace pagedecode
