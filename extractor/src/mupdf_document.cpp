#include "mupdf_document.hpp"

#include "extraction_error.hpp"

#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace pagedecode {

namespace {

struct BufferDropper {
    fz_context *ctx;
    void operator()(fz_buffer *buffer) const { fz_drop_buffer(ctx, buffer); }
};

using BufferPtr = std::unique_ptr<fz_buffer, BufferDropper>;

} // namespace

MuPdfDocument::MuPdfDocument(const fs::path &pdf_path) : path_(pdf_path) {
    ctx_ = fz_new_context(NULL, NULL, FZ_STORE_UNLIMITED);
    if (!ctx_) {
        throw ExtractionError(ErrorKind::DocumentOpenFailed,
                              "Failed to create MuPDF context", path_.string());
    }

    std::string error_msg;
    bool failed = false;
    pdf_document *doc = NULL;
    fz_var(doc);
    fz_try(ctx_) {
        doc = pdf_open_document(ctx_, path_.c_str());
    }
    fz_catch(ctx_) {
        failed = true;
        error_msg = fz_caught_message(ctx_);
    }

    if (failed) {
        fz_drop_context(ctx_);
        ctx_ = nullptr;
        throw ExtractionError(ErrorKind::DocumentOpenFailed,
                              "Failed to open PDF file: " + error_msg, path_.string());
    }
    doc_ = doc;
}

MuPdfDocument::~MuPdfDocument() {
    if (ctx_) {
        pdf_drop_document(ctx_, doc_);
        fz_drop_context(ctx_);
    }
}

int MuPdfDocument::count_pages() {
    int page_count = 0;
    std::string error_msg;
    bool failed = false;
    fz_try(ctx_) {
        page_count = pdf_count_pages(ctx_, doc_);
    }
    fz_catch(ctx_) {
        failed = true;
        error_msg = fz_caught_message(ctx_);
    }

    if (failed) {
        throw ExtractionError(ErrorKind::DocumentOpenFailed,
                              "Failed to count PDF pages: " + error_msg, path_.string());
    }
    return page_count;
}

std::vector<EmbeddedImage> MuPdfDocument::page_images(int page_index) {
    int page_number = page_index + 1;
    std::string error_msg;

    pdf_obj *page_obj = NULL;
    bool page_failed = false;
    fz_var(page_obj);
    fz_try(ctx_) {
        page_obj = pdf_lookup_page_obj(ctx_, doc_, page_index);
    }
    fz_catch(ctx_) {
        page_failed = true;
        error_msg = fz_caught_message(ctx_);
    }

    if (page_failed || !page_obj) {
        throw ExtractionError(ErrorKind::PageUnreadable,
                              "Failed to get PDF page " + std::to_string(page_number) +
                                  (error_msg.empty() ? std::string() : ": " + error_msg),
                              path_.string(), page_number);
    }

    pdf_obj *xobjects = NULL;
    bool resources_failed = false;
    fz_var(xobjects);
    fz_try(ctx_) {
        pdf_obj *resources = pdf_dict_get_inheritable(ctx_, page_obj, PDF_NAME(Resources));
        xobjects = pdf_dict_get(ctx_, resources, PDF_NAME(XObject));
    }
    fz_catch(ctx_) {
        resources_failed = true;
        error_msg = fz_caught_message(ctx_);
    }

    if (resources_failed) {
        throw ExtractionError(ErrorKind::PageResourcesUnreadable,
                              "Failed to get resources of PDF page " +
                                  std::to_string(page_number) + ": " + error_msg,
                              path_.string(), page_number);
    }

    std::vector<EmbeddedImage> images;
    if (!xobjects) {
        return images;
    }

    int xobject_count = pdf_dict_len(ctx_, xobjects);
    for (int obj_idx = 0; obj_idx < xobject_count; obj_idx++) {
        int object_number = 0;
        bool is_image = false;

        // XObjects that fail to resolve are not images as far as we can tell
        fz_try(ctx_) {
            pdf_obj *image_ref = pdf_dict_get_val(ctx_, xobjects, obj_idx);
            if (pdf_dict_get(ctx_, image_ref, PDF_NAME(Subtype)) == PDF_NAME(Image)) {
                object_number = pdf_to_num(ctx_, image_ref);
                is_image = object_number > 0;
            }
        }
        fz_catch(ctx_) {
            is_image = false;
        }

        if (is_image) {
            images.push_back({page_number, object_number});
        }
    }

    return images;
}

bool MuPdfDocument::encode_jpeg(const EmbeddedImage &image, std::vector<unsigned char> &out) {
    pdf_obj *image_obj = NULL;
    fz_image *fz_img = NULL;
    fz_buffer *jpeg_buffer = NULL;
    bool failed = false;

    fz_var(image_obj);
    fz_var(fz_img);
    fz_var(jpeg_buffer);

    fz_try(ctx_) {
        image_obj = pdf_load_object(ctx_, doc_, image.object_number);
        fz_img = pdf_load_image(ctx_, doc_, image_obj);

        // Only images stored as DCT streams have a JPEG form; they are
        // written out as-is, without re-encoding.
        fz_compressed_buffer *compressed = fz_compressed_image_buffer(ctx_, fz_img);
        if (compressed && compressed->params.type == FZ_IMAGE_JPEG && compressed->buffer) {
            jpeg_buffer = fz_keep_buffer(ctx_, compressed->buffer);
        }
    }
    fz_always(ctx_) {
        fz_drop_image(ctx_, fz_img);
        pdf_drop_obj(ctx_, image_obj);
    }
    fz_catch(ctx_) {
        failed = true;
    }

    if (failed || !jpeg_buffer) {
        fz_drop_buffer(ctx_, jpeg_buffer);
        return false;
    }

    // C++ exceptions must not cross an fz_try region, so copy out here
    BufferPtr buffer_guard(jpeg_buffer, BufferDropper{ctx_});
    unsigned char *data = NULL;
    size_t len = fz_buffer_storage(ctx_, jpeg_buffer, &data);
    out.assign(data, data + len);

    return len > 0;
}

} // namespace pagedecode
