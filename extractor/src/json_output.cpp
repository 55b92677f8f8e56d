#include "json_output.hpp"

namespace pagedecode {

namespace {

const char HEX_DIGITS[] = "0123456789abcdef";

void append_string_value(std::ostream &out, const std::string &s) {
    out << '"' << json_escape(s) << '"';
}

} // namespace

std::string json_escape(const std::string &s) {
    std::string escaped;
    escaped.reserve(s.size());
    for (char c : s) {
        unsigned char byte = static_cast<unsigned char>(c);
        switch (c) {
            case '"':  escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (byte < 0x20) {
                    escaped += "\\u00";
                    escaped += HEX_DIGITS[byte >> 4];
                    escaped += HEX_DIGITS[byte & 0x0f];
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

void write_success_json(std::ostream &out, const std::string &file_path,
                        const std::vector<std::filesystem::path> &pages) {
    out << "{\"success\":true,\"file\":";
    append_string_value(out, file_path);
    out << ",\"page_count\":" << pages.size() << ",\"pages\":[";
    for (size_t i = 0; i < pages.size(); i++) {
        if (i) out << ",";
        append_string_value(out, pages[i].string());
    }
    out << "]}" << std::endl;
}

void write_failure_json(std::ostream &out, const std::string &file_path,
                        const std::string &kind, const std::string &message) {
    out << "{\"success\":false,\"file\":";
    append_string_value(out, file_path);
    out << ",\"error_kind\":";
    append_string_value(out, kind);
    out << ",\"error\":";
    append_string_value(out, message);
    out << "}" << std::endl;
}

} // namespace pagedecode
