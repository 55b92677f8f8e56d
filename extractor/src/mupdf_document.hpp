#pragma once

#include "document_extractor.hpp"

#include <filesystem>

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

namespace pagedecode {

// ImageDocument backed by a MuPDF pdf_document. Owns its own fz_context.
class MuPdfDocument : public ImageDocument {
public:
    // Throws ExtractionError(DocumentOpenFailed)
    explicit MuPdfDocument(const std::filesystem::path &pdf_path);
    ~MuPdfDocument() override;

    MuPdfDocument(const MuPdfDocument &) = delete;
    MuPdfDocument &operator=(const MuPdfDocument &) = delete;

    int count_pages() override;
    std::vector<EmbeddedImage> page_images(int page_index) override;
    bool encode_jpeg(const EmbeddedImage &image, std::vector<unsigned char> &out) override;

private:
    std::filesystem::path path_;
    fz_context *ctx_ = nullptr;
    pdf_document *doc_ = nullptr;
};

} // namespace pagedecode
