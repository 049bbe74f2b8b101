//
// Created by Giuseppe Francione on 05/02/26.
//

#ifndef FOLIO_FILE_UTILS_HPP
#define FOLIO_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace folio {

    /**
     * @brief RAII wrapper for FILE pointers to ensure they are closed.
     */
    struct FileCloser {
        void operator()(FILE *f) const { if (f) std::fclose(f); }
    };

    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Reads a whole file into memory.
     * @throws std::runtime_error if the file cannot be opened or read.
     */
    std::vector<unsigned char> read_file(const std::filesystem::path &path);

    /**
     * @brief Writes @p data to @p path, creating missing parent directories.
     * @throws std::runtime_error on any I/O failure.
     */
    void write_file(const std::filesystem::path &path, const std::vector<unsigned char> &data);

    /**
     * @brief Reads a text file line by line, stripping trailing '\r'.
     * @throws std::runtime_error if the file cannot be opened.
     */
    std::vector<std::string> read_lines(const std::filesystem::path &path);

    /**
     * @brief Creates @p dir (and parents) when missing.
     * @throws std::runtime_error if the directory cannot be created.
     */
    void ensure_directory(const std::filesystem::path &dir, std::string_view tag = "file_utils");

    /// @return Lowercase extension of @p path including the dot (".pdf"), or empty.
    std::string lowercase_extension(const std::filesystem::path &path);

} // namespace folio

#endif // FOLIO_FILE_UTILS_HPP
