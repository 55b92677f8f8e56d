#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace pagedecode {

// `s` as the body of a JSON string literal: quotes, backslashes and control
// characters escaped, every other byte passed through.
std::string json_escape(const std::string &s);

// One line: {"success":true,"file":...,"page_count":N,"pages":[...]}
void write_success_json(std::ostream &out, const std::string &file_path,
                        const std::vector<std::filesystem::path> &pages);

// One line: {"success":false,"file":...,"error_kind":...,"error":...}
void write_failure_json(std::ostream &out, const std::string &file_path,
                        const std::string &kind, const std::string &message);

} // namespace pagedecode
