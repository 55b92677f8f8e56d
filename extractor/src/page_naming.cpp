#include "page_naming.hpp"

namespace pagedecode {

std::size_t pad_width(std::size_t count) {
    std::size_t width = 1;
    while (count >= 10) {
        count /= 10;
        width++;
    }
    return width;
}

std::string padded_page_name(std::size_t index, std::size_t width, const std::string &extension) {
    std::string number = std::to_string(index + 1);
    if (number.size() < width) {
        number.insert(0, width - number.size(), '0');
    }

    if (extension.empty()) {
        return number;
    }
    return number + "." + extension;
}

} // namespace pagedecode
