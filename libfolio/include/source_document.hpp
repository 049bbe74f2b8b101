//
// Created by Giuseppe Francione on 09/02/26.
//

#ifndef FOLIO_SOURCE_DOCUMENT_HPP
#define FOLIO_SOURCE_DOCUMENT_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace folio {

/**
 * @brief A document on disk together with the password that opens it.
 */
struct SourceDocument {
    std::filesystem::path path;
    std::string password;
};

/**
 * @brief Checks that @p source names an existing regular file.
 * @throws ValidationError prefixed with @p operation.
 */
void require_source(const SourceDocument& source, std::string_view operation);

/**
 * @brief Checks that an output path was given.
 * @throws ValidationError prefixed with @p operation.
 */
void require_output(const std::filesystem::path& output, std::string_view operation);

} // namespace folio

#endif // FOLIO_SOURCE_DOCUMENT_HPP
