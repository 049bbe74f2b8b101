//
// Created by Giuseppe Francione on 09/02/26.
//

/**
 * @file document_assembler.hpp
 * @brief Page composition: split, merge, reorder, remove, insert, rotate, unlock.
 */

#ifndef FOLIO_DOCUMENT_ASSEMBLER_HPP
#define FOLIO_DOCUMENT_ASSEMBLER_HPP

#include "page_range.hpp"
#include "pdf_engine.hpp"
#include "progress.hpp"
#include "source_document.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace folio {

/**
 * @brief Destination for produced documents.
 */
class IArtifactSink {
public:
    virtual ~IArtifactSink() = default;

    /// @brief Persists @p bytes at @p path, creating parent directories.
    virtual void write(const std::filesystem::path& path, const std::vector<unsigned char>& bytes) = 0;
};

/**
 * @brief Writes artifacts to the local file system.
 */
class FileArtifactSink final : public IArtifactSink {
public:
    void write(const std::filesystem::path& path, const std::vector<unsigned char>& bytes) override;
};

/// Default blank page size (US Letter, points).
inline constexpr double kDefaultPageWidth = 612.0;
inline constexpr double kDefaultPageHeight = 792.0;

struct SplitRequest {
    SourceDocument source;
    std::filesystem::path output_dir;          ///< empty: the input's directory
    PageRange range;                           ///< unfiltered: every page
    std::map<int, std::string> name_overrides; ///< page -> explicit name
    bool use_bookmarks = false;
    std::string name_template;
};

struct MergeRequest {
    std::vector<std::filesystem::path> inputs;
    std::string password;          ///< tried on every input
    std::filesystem::path output;
    bool delete_originals = false; ///< applied only after the merged file was written
    bool strict = false;           ///< fail instead of skipping unusable inputs
};

struct MergeSummary {
    int merged_files = 0;
    int page_count = 0;
    std::vector<std::filesystem::path> skipped;
};

struct ReorderRequest {
    SourceDocument source;
    std::filesystem::path output;
    std::vector<int> order; ///< permutation of 1..N
};

struct RemoveRequest {
    SourceDocument source;
    std::filesystem::path output;
    std::vector<int> pages; ///< 1-based, out-of-range entries are dropped
};

struct InsertRequest {
    SourceDocument source;
    std::filesystem::path output;
    std::map<int, int> positions; ///< 1-based position -> number of blank pages
    double width = kDefaultPageWidth;
    double height = kDefaultPageHeight;
};

struct RotateRequest {
    SourceDocument source;
    std::filesystem::path output;
    int degrees = 90; ///< 90, 180 or 270
    PageRange range;
};

struct UnlockRequest {
    SourceDocument source;
    std::filesystem::path output;
};

/**
 * @brief Executes page composition on top of an IPdfEngine.
 *
 * Every operation takes the global engine lock for its whole duration,
 * loads its inputs (a load failure is fatal and happens before anything
 * is written), validates the request, then builds and writes its
 * outputs. Display page numbers are converted to engine indices here
 * and nowhere else. Failures are raised as ValidationError (bad
 * request, nothing written) or OperationError (with the engine cause
 * nested and the failing unit named).
 */
class DocumentAssembler {
public:
    DocumentAssembler(IPdfEngine& engine, IArtifactSink& sink, IProgressReporter* progress = nullptr)
        : engine_(engine), sink_(sink), progress_(progress) {}

    /**
     * @brief One single-page document per selected page.
     *
     * Already written pages stay on disk when a later page fails.
     * @return Written paths, in page order.
     */
    std::vector<std::filesystem::path> split(const SplitRequest& request);

    /**
     * @brief Concatenates all usable inputs, in order, into one document.
     *
     * Missing or unloadable inputs are skipped with a warning unless
     * strict is set. Progress is reported once per input.
     */
    MergeSummary merge(const MergeRequest& request);

    /// @brief New document with the source pages in the given order.
    void reorder(const ReorderRequest& request);

    /// @brief Deletes pages, highest first.
    void remove(const RemoveRequest& request);

    /// @brief Inserts blank pages, highest position first.
    void insert(const InsertRequest& request);

    /// @brief Sets the absolute rotation of the selected pages.
    void rotate(const RotateRequest& request);

    /// @brief Rewrites the document without encryption.
    void unlock(const UnlockRequest& request);

private:
    std::unique_ptr<IPdfDocument> load(const SourceDocument& source, std::string_view operation);
    void save(IPdfDocument& doc, const std::filesystem::path& output, const SaveOptions& options,
              std::string_view operation);

    IPdfEngine& engine_;
    IArtifactSink& sink_;
    IProgressReporter* progress_;
};

} // namespace folio

#endif // FOLIO_DOCUMENT_ASSEMBLER_HPP
