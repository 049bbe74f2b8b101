//
// Created by Giuseppe Francione on 17/02/26.
//

/**
 * @file folio.hpp
 * @brief Public API for the folio library.
 */

#ifndef FOLIO_HPP
#define FOLIO_HPP

#include "bookmark_index.hpp"
#include "document_assembler.hpp"
#include "image_to_pdf.hpp"
#include "models.hpp"
#include "page_range.hpp"
#include "pdf_engine.hpp"
#include "source_document.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace folio {

/**
 * @brief Interface for receiving progress and status events during execution.
 */
struct FolioObserver {
    virtual ~FolioObserver() = default;

    virtual void on_start(const std::string& operation, const std::string& input) {}

    virtual void on_progress(const std::string& operation, int current, int total, const std::string& context) {}

    virtual void on_finish(const std::string& operation, std::chrono::milliseconds duration) {}

    virtual void on_error(const std::string& operation, const std::string& error) {}

    virtual void on_log(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Main interface for the folio library.
 *
 * @details Every operation is blocking and serialized against all other
 * engine work in the process. Failures are thrown as ValidationError or
 * OperationError after the observer's on_error was called.
 * Uses PIMPL idiom to hide the engines.
 */
class Folio {
public:
    /// @brief Uses the qpdf engine and writes to the local file system.
    Folio();

    /// @brief Uses @p engine for page composition and bookmarks.
    explicit Folio(std::unique_ptr<IPdfEngine> engine);

    ~Folio();

    Folio(const Folio&) = delete;
    Folio& operator=(const Folio&) = delete;
    Folio(Folio&&) noexcept;
    Folio& operator=(Folio&&) noexcept;

    // --- Observability ---

    /**
     * @brief Sets the observer for progress and log events.
     * The caller retains ownership of the observer; pass nullptr to detach.
     */
    void set_observer(FolioObserver* observer);

    // --- Page composition ---

    std::vector<std::filesystem::path> split(const SplitRequest& request);
    MergeSummary merge(const MergeRequest& request);
    void reorder(const ReorderRequest& request);
    void remove(const RemoveRequest& request);
    void insert(const InsertRequest& request);
    void rotate(const RotateRequest& request);
    void unlock(const UnlockRequest& request);

    // --- Inspection ---

    [[nodiscard]] PdfInfo info(const SourceDocument& source);
    [[nodiscard]] std::vector<BookmarkNode> bookmarks(const SourceDocument& source);
    [[nodiscard]] std::vector<PageText> text(const SourceDocument& source, const PageRange& range = {});
    [[nodiscard]] std::vector<Attachment> attachments(const SourceDocument& source);
    std::vector<std::filesystem::path> extract_attachments(const SourceDocument& source,
                                                           const std::filesystem::path& output_dir,
                                                           std::optional<int> index = std::nullopt);
    [[nodiscard]] std::vector<FormField> form_fields(const SourceDocument& source, const PageRange& range = {});
    [[nodiscard]] std::vector<PageObject> page_objects(const SourceDocument& source, const PageRange& range = {});
    void remove_object(const SourceDocument& source, const std::filesystem::path& output,
                       int page_number, int object_index);

    // --- Rendering ---

    std::vector<std::filesystem::path> convert(const SourceDocument& source, const ConvertOptions& options);
    std::filesystem::path image_to_pdf(const ImageToPdfRequest& request);
    void watermark(const SourceDocument& source, const std::filesystem::path& output,
                   const WatermarkOptions& options, const PageRange& range = {});

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace folio

#endif // FOLIO_HPP
