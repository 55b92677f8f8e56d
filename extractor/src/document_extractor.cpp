#include "document_extractor.hpp"

#include "extraction_error.hpp"
#include "page_naming.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace pagedecode {

std::vector<fs::path> extract_document_images(ImageDocument &document,
                                              const fs::path &output_dir,
                                              bool skip_bad_pages,
                                              ExtractionObserver &observer) {
    std::vector<EmbeddedImage> images;
    int page_count = document.count_pages();

    observer.debug("Looking for images in the provided PDF...",
                   {{"pages", std::to_string(page_count)}});

    for (int page_idx = 0; page_idx < page_count; page_idx++) {
        observer.trace("Counting images from page...", {{"page", std::to_string(page_idx + 1)}});

        try {
            std::vector<EmbeddedImage> page_images = document.page_images(page_idx);
            images.insert(images.end(), page_images.begin(), page_images.end());
        } catch (const ExtractionError &e) {
            if (!skip_bad_pages) throw;
            observer.warn(e.what(), {{"page", std::to_string(page_idx + 1)},
                                     {"kind", error_kind_name(e.kind())}});
        }
    }

    observer.info("Extracting images from PDF...", {{"count", std::to_string(images.size())}});

    std::vector<fs::path> extracted;
    size_t width = pad_width(images.size());

    for (size_t i = 0; i < images.size(); i++) {
        const EmbeddedImage &image = images[i];

        std::vector<unsigned char> encoded;
        if (!document.encode_jpeg(image, encoded)) {
            observer.debug("Skipping image without a JPEG form",
                           {{"page", std::to_string(image.page_number)},
                            {"object", std::to_string(image.object_number)}});
            continue;
        }

        fs::path outpath = output_dir / padded_page_name(i, width, "jpg");

        observer.debug("Extracting page...", {{"page", std::to_string(i + 1) + "/" +
                                                           std::to_string(images.size())}});

        std::ofstream output_file(outpath, std::ios::binary | std::ios::trunc);
        if (output_file.is_open()) {
            output_file.write(reinterpret_cast<const char *>(encoded.data()),
                              static_cast<std::streamsize>(encoded.size()));
            output_file.close();
        }
        if (!output_file) {
            throw ExtractionError(ErrorKind::ImageWriteFailed,
                                  "Failed to write image " + std::to_string(i + 1) + " to " +
                                      outpath.string(),
                                  outpath.string(), image.page_number);
        }

        extracted.push_back(outpath);
    }

    return extracted;
}

} // namespace pagedecode
