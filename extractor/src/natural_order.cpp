#include "natural_order.hpp"

#include <cstddef>

namespace pagedecode {

namespace {

bool is_digit(char ch) {
    return ch >= '0' && ch <= '9';
}

int sign(int value) {
    return (value > 0) - (value < 0);
}

// Compare the digit runs [a_begin, a_end) and [b_begin, b_end) by value.
// Leading zeros are skipped, so runs of any length compare without overflow.
int compare_digit_runs(const std::string &a, size_t a_begin, size_t a_end,
                       const std::string &b, size_t b_begin, size_t b_end) {
    while (a_begin < a_end && a[a_begin] == '0') a_begin++;
    while (b_begin < b_end && b[b_begin] == '0') b_begin++;

    size_t a_len = a_end - a_begin;
    size_t b_len = b_end - b_begin;
    if (a_len != b_len) {
        return a_len < b_len ? -1 : 1;
    }

    return sign(a.compare(a_begin, a_len, b, b_begin, b_len));
}

// Walk both paths one '/'-separated segment at a time
template <typename SegmentCompare>
int compare_segments(const std::string &lhs, const std::string &rhs, SegmentCompare compare) {
    size_t lhs_pos = 0;
    size_t rhs_pos = 0;

    while (lhs_pos <= lhs.size() && rhs_pos <= rhs.size()) {
        size_t lhs_end = lhs.find('/', lhs_pos);
        size_t rhs_end = rhs.find('/', rhs_pos);
        if (lhs_end == std::string::npos) lhs_end = lhs.size();
        if (rhs_end == std::string::npos) rhs_end = rhs.size();

        int result = compare(lhs.substr(lhs_pos, lhs_end - lhs_pos),
                             rhs.substr(rhs_pos, rhs_end - rhs_pos));
        if (result != 0) return result;

        lhs_pos = lhs_end + 1;
        rhs_pos = rhs_end + 1;
    }

    // One path ran out of segments first: it is a prefix of the other
    bool lhs_done = lhs_pos > lhs.size();
    bool rhs_done = rhs_pos > rhs.size();
    if (lhs_done && rhs_done) return 0;
    return lhs_done ? -1 : 1;
}

} // namespace

int natural_compare(const std::string &lhs, const std::string &rhs) {
    size_t i = 0;
    size_t j = 0;

    while (i < lhs.size() && j < rhs.size()) {
        if (is_digit(lhs[i]) && is_digit(rhs[j])) {
            size_t i_end = i;
            size_t j_end = j;
            while (i_end < lhs.size() && is_digit(lhs[i_end])) i_end++;
            while (j_end < rhs.size() && is_digit(rhs[j_end])) j_end++;

            int result = compare_digit_runs(lhs, i, i_end, rhs, j, j_end);
            if (result != 0) return result;

            i = i_end;
            j = j_end;
            continue;
        }

        unsigned char a = static_cast<unsigned char>(lhs[i]);
        unsigned char b = static_cast<unsigned char>(rhs[j]);
        if (a != b) return a < b ? -1 : 1;
        i++;
        j++;
    }

    bool lhs_done = i >= lhs.size();
    bool rhs_done = j >= rhs.size();
    if (lhs_done && rhs_done) return 0;
    return lhs_done ? -1 : 1;
}

int natural_paths_compare(const std::string &lhs, const std::string &rhs) {
    return compare_segments(lhs, rhs, [](const std::string &a, const std::string &b) {
        return natural_compare(a, b);
    });
}

int simple_paths_compare(const std::string &lhs, const std::string &rhs) {
    return compare_segments(lhs, rhs, [](const std::string &a, const std::string &b) {
        return sign(a.compare(b));
    });
}

int paths_compare(PageOrdering ordering, const std::string &lhs, const std::string &rhs) {
    if (ordering == PageOrdering::Lexicographic) {
        return simple_paths_compare(lhs, rhs);
    }
    return natural_paths_compare(lhs, rhs);
}

} // namespace pagedecode
