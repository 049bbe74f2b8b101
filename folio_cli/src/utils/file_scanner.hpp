//
// Created by Giuseppe Francione on 17/02/26.
//

#ifndef FOLIO_FILE_SCANNER_HPP
#define FOLIO_FILE_SCANNER_HPP

#include <filesystem>
#include <vector>

struct Settings; // forward declaration

/// @return The *.pdf files under @p dir (case-insensitive extension), sorted by path.
std::vector<std::filesystem::path>
collect_pdf_files(const std::filesystem::path& dir, bool recursive);

/// @return The lines of @p script naming existing .pdf files, in file order.
std::vector<std::filesystem::path>
read_input_script(const std::filesystem::path& script);

/**
 * @brief Gathers the merge inputs: --inputs, then --input-dir, then --input-script.
 *
 * --inputs entries are passed through unchecked; the merge reports the ones it cannot load.
 */
std::vector<std::filesystem::path>
collect_merge_inputs(const Settings& settings);

#endif // FOLIO_FILE_SCANNER_HPP
