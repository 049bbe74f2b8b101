//
// Created by Giuseppe Francione on 04/02/26.
//

#include "../../include/page_range.hpp"
#include <charconv>
#include <optional>

namespace folio {

namespace {

// far above any real page count; keeps "1-2147483647" from running forever
constexpr int kMaxPageNumber = 1'000'000;

std::string_view trim(std::string_view s) {
    constexpr std::string_view ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

// whole token must be a decimal integer
std::optional<int> to_int(std::string_view s) {
    s = trim(s);
    if (s.empty()) return std::nullopt;
    int value = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

template <typename Fn>
void for_each_token(std::string_view spec, const char sep, Fn&& fn) {
    while (!spec.empty()) {
        const auto pos = spec.find(sep);
        fn(trim(spec.substr(0, pos)));
        if (pos == std::string_view::npos) break;
        spec.remove_prefix(pos + 1);
    }
}

} // namespace

PageRange::PageRange(const std::set<int>& pages) : filtered_(true) {
    for (const int p : pages) {
        if (p >= 1) pages_.insert(p);
    }
}

PageRange PageRange::parse(const std::string_view spec) {
    if (trim(spec).empty()) {
        return {};
    }

    std::set<int> pages;
    for_each_token(spec, ',', [&pages](const std::string_view token) {
        if (token.empty()) return;
        const auto dash = token.find('-');
        if (dash == std::string_view::npos) {
            if (const auto page = to_int(token); page && *page >= 1 && *page <= kMaxPageNumber) {
                pages.insert(*page);
            }
            return;
        }
        const auto start = to_int(token.substr(0, dash));
        const auto end = to_int(token.substr(dash + 1));
        if (!start || !end || *start < 1 || *end > kMaxPageNumber) return;
        for (int p = *start; p <= *end; ++p) {
            pages.insert(p);
        }
    });
    return PageRange(pages);
}

bool PageRange::contains(const int page) const noexcept {
    return !filtered_ || pages_.contains(page);
}

std::vector<int> PageRange::select(const int page_count) const {
    std::vector<int> out;
    for (int p = 1; p <= page_count; ++p) {
        if (contains(p)) out.push_back(p);
    }
    return out;
}

std::string PageRange::to_string() const {
    std::string out;
    auto it = pages_.begin();
    while (it != pages_.end()) {
        const int start = *it;
        int end = start;
        ++it;
        while (it != pages_.end() && *it == end + 1) {
            end = *it;
            ++it;
        }
        if (!out.empty()) out += ',';
        out += std::to_string(start);
        if (end != start) {
            out += '-';
            out += std::to_string(end);
        }
    }
    return out;
}

std::vector<int> parse_page_numbers(const std::string_view spec) {
    std::vector<int> out;
    for_each_token(spec, ',', [&out](const std::string_view token) {
        if (const auto n = to_int(token); n && *n > 0) {
            out.push_back(*n);
        }
    });
    return out;
}

std::map<int, int> parse_insert_spec(const std::string_view spec) {
    std::map<int, int> out;
    for_each_token(spec, ',', [&out](const std::string_view token) {
        const auto colon = token.find(':');
        if (colon == std::string_view::npos) return;
        const auto position = to_int(token.substr(0, colon));
        const auto count = to_int(token.substr(colon + 1));
        if (position && count && *position > 0 && *count > 0) {
            out[*position] = *count;
        }
    });
    return out;
}

} // namespace folio
