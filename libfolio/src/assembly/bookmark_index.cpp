//
// Created by Giuseppe Francione on 07/02/26.
//

#include "../../include/bookmark_index.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <stack>

namespace folio {

namespace {

bool is_blank(const std::optional<std::string>& title) {
    return !title || std::ranges::all_of(*title, [](const unsigned char c) { return std::isspace(c) != 0; });
}

struct PendingItem {
    OutlineRef ref;
    int level = 0;
};

} // namespace

std::string_view to_string(const ActionKind kind) noexcept {
    switch (kind) {
        case ActionKind::Goto:         return "GOTO";
        case ActionKind::RemoteGoto:   return "REMOTEGOTO";
        case ActionKind::Uri:          return "URI";
        case ActionKind::Launch:       return "LAUNCH";
        case ActionKind::EmbeddedGoto: return "EMBEDDEDGOTO";
        case ActionKind::Page:         return "Page";
        case ActionKind::Unsupported:  return "UNSUPPORTED";
    }
    return "UNSUPPORTED";
}

std::vector<BookmarkNode> build_bookmark_index(const IPdfDocument& doc) {
    std::vector<BookmarkNode> nodes;
    std::set<OutlineRef> visited;
    std::stack<PendingItem> pending;

    if (const auto first = doc.outline_first_child(std::nullopt)) {
        pending.push({*first, 0});
    }

    while (!pending.empty()) {
        const PendingItem item = pending.top();
        pending.pop();
        if (!visited.insert(item.ref).second) {
            Logger::log(LogLevel::Warning,
                "Outline item " + std::to_string(item.ref.obj) + " reached twice, skipping", "bookmark_index");
            continue;
        }

        const auto title = doc.outline_title(item.ref);
        BookmarkNode node;
        node.title = title.value_or("");
        node.level = item.level;

        if (const auto action = doc.outline_action(item.ref)) {
            node.action = action->kind;
            if ((action->kind == ActionKind::Goto || action->kind == ActionKind::RemoteGoto) &&
                action->page_index && *action->page_index >= 0) {
                node.page = *action->page_index + 1;
            }
        } else if (const auto dest = doc.outline_dest_page(item.ref)) {
            node.action = ActionKind::Page;
            if (*dest >= 0) node.page = *dest + 1;
        }
        nodes.push_back(std::move(node));

        if (is_blank(title)) {
            continue;
        }
        // sibling goes below the child so the whole subtree is walked first
        if (const auto next = doc.outline_next_sibling(item.ref)) {
            pending.push({*next, item.level});
        }
        if (const auto child = doc.outline_first_child(item.ref)) {
            pending.push({*child, item.level + 1});
        }
    }
    return nodes;
}

std::map<int, std::string> page_title_map(const std::vector<BookmarkNode>& nodes) {
    std::map<int, std::string> out;
    for (const auto& node : nodes) {
        if (node.page) {
            out[*node.page] = node.title;
        }
    }
    return out;
}

} // namespace folio
