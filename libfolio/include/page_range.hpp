//
// Created by Giuseppe Francione on 04/02/26.
//

/**
 * @file page_range.hpp
 * @brief Parsing of textual page selections ("1,3,5-8") and page lists.
 */

#ifndef FOLIO_PAGE_RANGE_HPP
#define FOLIO_PAGE_RANGE_HPP

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace folio {

/**
 * @brief A set of 1-based display page numbers, or "no filter".
 *
 * An unfiltered range (parsed from an empty specification) selects every
 * page. A filtered range may be empty when no token of the specification
 * was usable; callers treat that as a validation failure.
 */
class PageRange {
public:
    /// @brief Unfiltered range.
    PageRange() = default;

    /// @brief Filtered range holding exactly @p pages (values < 1 are ignored).
    explicit PageRange(const std::set<int>& pages);

    /**
     * @brief Parses a comma-separated list of "N" and "A-B" tokens.
     *
     * Whitespace around tokens is ignored. Malformed tokens (non-numeric,
     * missing bounds, open-ended, values below 1) are skipped. A token with
     * A > B contributes nothing. An empty or blank input yields an
     * unfiltered range.
     */
    static PageRange parse(std::string_view spec);

    [[nodiscard]] bool is_filtered() const noexcept { return filtered_; }

    /// @return True if a filter is set but selects no page at all.
    [[nodiscard]] bool empty() const noexcept { return filtered_ && pages_.empty(); }

    /// @return True if @p page passes the filter (always true when unfiltered).
    [[nodiscard]] bool contains(int page) const noexcept;

    [[nodiscard]] const std::set<int>& pages() const noexcept { return pages_; }

    /// @return The selected pages within 1..page_count, ascending.
    [[nodiscard]] std::vector<int> select(int page_count) const;

    /// @return Canonical text form, runs collapsed ("1,3,5-8"); empty when unfiltered.
    [[nodiscard]] std::string to_string() const;

private:
    std::set<int> pages_;
    bool filtered_ = false;
};

/**
 * @brief Parses a comma-separated list of positive integers, keeping order
 * and duplicates. Invalid entries are skipped.
 */
std::vector<int> parse_page_numbers(std::string_view spec);

/**
 * @brief Parses "position:count,..." into a position -> count map.
 *
 * Both numbers must be positive; other entries are skipped. A later
 * entry for the same position overwrites an earlier one.
 */
std::map<int, int> parse_insert_spec(std::string_view spec);

} // namespace folio

#endif // FOLIO_PAGE_RANGE_HPP
