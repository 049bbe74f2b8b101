//
// Created by Giuseppe Francione on 08/02/26.
//

#include "../../include/naming_strategy.hpp"
#include "../../include/filename_sanitizer.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <utility>

namespace folio {

namespace {

std::string pad3(const int page) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%03d", page);
    return buf;
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    for (auto pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size())) {
        s.replace(pos, from.size(), to);
    }
}

std::string fold_case(std::string s) {
    std::ranges::transform(s, s.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::string expand_template(const std::string& pattern, const std::string& original, const int page) {
    std::string out = pattern;
    replace_all(out, "{original}", original);
    replace_all(out, "{page}", pad3(page));
    return out;
}

std::string resolve_name(const int page, const NamingRules& rules) {
    if (const auto it = rules.overrides.find(page); it != rules.overrides.end() && !it->second.empty()) {
        return it->second;
    }

    if (const auto it = rules.bookmark_titles.find(page); it != rules.bookmark_titles.end()) {
        std::string name = sanitize_filename(it->second);
        if (name.size() > kMaxBookmarkNameLength) {
            name.resize(kMaxBookmarkNameLength);
        }
        if (!name.empty()) {
            return name;
        }
    }

    if (!rules.name_template.empty()) {
        if (std::string name = expand_template(rules.name_template, rules.original_stem, page); !name.empty()) {
            return name;
        }
    }

    return rules.original_stem + "-" + pad3(page);
}

bool NamingPlan::claim(const std::string& name) {
    return used_.insert(fold_case(name)).second;
}

std::string NamingPlan::assign(const int page) {
    const std::string base = resolve_name(page, rules_);
    if (claim(base)) {
        return base;
    }

    const std::string with_page = base + "-" + pad3(page);
    if (claim(with_page)) {
        return with_page;
    }

    for (int n = 2;; ++n) {
        std::string candidate = with_page + "-" + std::to_string(n);
        if (claim(candidate)) {
            return candidate;
        }
    }
}

std::map<int, std::string> parse_names_script(const std::vector<std::string>& lines) {
    std::map<int, std::string> out;
    int counter = 1;
    for (const auto& line : lines) {
        if (const auto eq = line.find('='); eq != std::string::npos) {
            int page = 0;
            const char* first = line.data();
            const char* last = line.data() + eq;
            const auto [ptr, ec] = std::from_chars(first, last, page);
            if (ec == std::errc() && ptr == last) {
                out.try_emplace(page, line.substr(eq + 1));
                counter = page;
            }
        } else {
            out.try_emplace(counter, line);
        }
        ++counter;
    }
    return out;
}

} // namespace folio
