//
// Created by Giuseppe Francione on 04/02/26.
//

#include "../../include/filename_sanitizer.hpp"
#include <algorithm>
#include <iterator>

namespace folio {

namespace {

constexpr bool is_allowed(const char c) noexcept {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    switch (c) {
        case ' ': case '.': case '-': case ',': case '&':
        case '(': case ')': case '_': case '^':
            return true;
        default:
            return false;
    }
}

} // namespace

std::string sanitize_filename(const std::string_view name) {
    std::string out;
    out.reserve(name.size());
    std::ranges::copy_if(name, std::back_inserter(out), is_allowed);
    return out;
}

bool is_valid_filename(const std::string_view name) noexcept {
    return std::ranges::all_of(name, is_allowed);
}

} // namespace folio
