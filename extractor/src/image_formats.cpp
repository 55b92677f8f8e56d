#include "image_formats.hpp"

#include <cctype>
#include <set>

namespace pagedecode {

// Image formats commonly found in comic archives
static const std::set<std::string> IMAGE_EXTS = {
    "jpg", "jpeg", "png", "gif", "bmp", "webp"
};

static const std::set<std::string> EXTENDED_IMAGE_EXTS = {
    "tif", "tiff", "jxl", "avif", "heic", "heif", "ico", "tga",
    "pnm", "pbm", "pgm", "ppm", "jp2", "j2k", "jfif"
};

static const std::set<std::string> DECODABLE_EXTS = {
    "zip", "cbz", "pdf"
};

std::string normalize_ext(const std::string &ext) {
    std::string norm;
    for (char ch : ext) norm += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return norm;
}

std::string path_extension(const std::string &path) {
    size_t slash = path.rfind('/');
    std::string file_name = (slash != std::string::npos) ? path.substr(slash + 1) : path;

    size_t dot = file_name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return "";
    }
    return file_name.substr(dot + 1);
}

bool has_image_ext(const std::string &path, bool accept_extended) {
    std::string ext = normalize_ext(path_extension(path));
    if (ext.empty()) return false;

    if (IMAGE_EXTS.count(ext) > 0) return true;
    return accept_extended && EXTENDED_IMAGE_EXTS.count(ext) > 0;
}

bool is_supported_for_decoding(const std::string &ext) {
    return DECODABLE_EXTS.count(normalize_ext(ext)) > 0;
}

bool is_valid_utf8(const std::string &bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        unsigned char lead = static_cast<unsigned char>(bytes[i]);
        size_t extra = 0;
        unsigned int code_point = 0;

        if (lead < 0x80) {
            i++;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (i + extra >= bytes.size()) return false;

        for (size_t k = 1; k <= extra; k++) {
            unsigned char cont = static_cast<unsigned char>(bytes[i + k]);
            if ((cont & 0xC0) != 0x80) return false;
            code_point = (code_point << 6) | (cont & 0x3F);
        }

        // Reject overlong forms, surrogates and values past U+10FFFF
        if ((extra == 1 && code_point < 0x80) ||
            (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }

        i += extra + 1;
    }
    return true;
}

} // namespace pagedecode
