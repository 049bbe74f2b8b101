//
// Created by Giuseppe Francione on 08/02/26.
//

/**
 * @file naming_strategy.hpp
 * @brief Resolves output file names for produced pages.
 */

#ifndef FOLIO_NAMING_STRATEGY_HPP
#define FOLIO_NAMING_STRATEGY_HPP

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace folio {

/// Bookmark-derived names are cut to this many characters after sanitizing.
inline constexpr std::size_t kMaxBookmarkNameLength = 100;

/**
 * @brief Inputs to name resolution, all keyed by 1-based page number.
 */
struct NamingRules {
    std::string original_stem;                  ///< input file name without extension
    std::map<int, std::string> overrides;       ///< explicit per-page names
    std::map<int, std::string> bookmark_titles; ///< from page_title_map()
    std::string name_template;                  ///< may contain {original} and {page}
};

/**
 * @brief Resolves the base name (no extension) for one page.
 *
 * Precedence, highest first: explicit override, sanitized and truncated
 * bookmark title, template, "{original}-{page:03}". Exactly one level
 * supplies the name; a level that would produce an empty name does not
 * apply.
 */
std::string resolve_name(int page, const NamingRules& rules);

/**
 * @brief Replaces {original} and {page} (zero-padded to 3 digits) in @p pattern.
 */
std::string expand_template(const std::string& pattern, const std::string& original, int page);

/**
 * @brief Per-invocation name allocator guaranteeing unique results.
 *
 * A name already handed out gets "-NNN" (the page) appended, then a
 * running counter, until it is unique. Comparison is case-insensitive
 * so outputs never collide on case-folding file systems.
 */
class NamingPlan {
public:
    explicit NamingPlan(NamingRules rules) : rules_(std::move(rules)) {}

    /// @return The unique base name for @p page.
    std::string assign(int page);

    [[nodiscard]] const NamingRules& rules() const noexcept { return rules_; }

private:
    bool claim(const std::string& name);

    NamingRules rules_;
    std::set<std::string> used_;
};

/**
 * @brief Parses a names script into explicit overrides.
 *
 * A line "N=name" names page N and moves the counter to N; any other line
 * names the page at the counter. The counter starts at 1 and advances
 * after every line. The first name given for a page is kept.
 */
std::map<int, std::string> parse_names_script(const std::vector<std::string>& lines);

} // namespace folio

#endif // FOLIO_NAMING_STRATEGY_HPP
