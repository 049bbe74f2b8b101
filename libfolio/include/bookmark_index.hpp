//
// Created by Giuseppe Francione on 07/02/26.
//

#ifndef FOLIO_BOOKMARK_INDEX_HPP
#define FOLIO_BOOKMARK_INDEX_HPP

#include "pdf_engine.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio {

/**
 * @brief One flattened outline entry.
 */
struct BookmarkNode {
    std::string title;
    int level = 0;                    ///< nesting depth, 0 for top-level items
    std::optional<ActionKind> action; ///< empty when the item has neither action nor destination
    std::optional<int> page;          ///< 1-based display page number
};

/// @return Display name of an action kind ("GOTO", "URI", "Page", ...).
[[nodiscard]] std::string_view to_string(ActionKind kind) noexcept;

/**
 * @brief Flattens the outline of @p doc depth-first, child before sibling.
 *
 * An item whose title is missing or blank is emitted but ends the walk
 * beneath it: neither its children nor its following siblings are
 * visited. Items reached twice (cyclic outlines) are emitted once.
 * The page is resolved through the action for GOTO and REMOTE_GOTO,
 * through the item's own destination when there is no action, and left
 * empty otherwise.
 */
std::vector<BookmarkNode> build_bookmark_index(const IPdfDocument& doc);

/**
 * @brief Collapses bookmarks into page -> title; the last item in
 * traversal order wins for a page. Items without a page are ignored.
 */
std::map<int, std::string> page_title_map(const std::vector<BookmarkNode>& nodes);

} // namespace folio

#endif // FOLIO_BOOKMARK_INDEX_HPP
