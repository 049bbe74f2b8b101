//
// Created by Giuseppe Francione on 04/02/26.
//

#ifndef FOLIO_FILENAME_SANITIZER_HPP
#define FOLIO_FILENAME_SANITIZER_HPP

#include <string>
#include <string_view>

namespace folio {

/**
 * @brief Drops every character outside the file name allow-list.
 *
 * Allowed: ASCII letters, digits, space and `. - , & ( ) _ ^`.
 * Lossy and deterministic; no length limit is applied.
 */
std::string sanitize_filename(std::string_view name);

/// @return True iff every character of @p name is in the allow-list.
bool is_valid_filename(std::string_view name) noexcept;

} // namespace folio

#endif // FOLIO_FILENAME_SANITIZER_HPP
