//
// Created by Giuseppe Francione on 11/02/26.
//

/**
 * @file document_inspector.hpp
 * @brief Read-only queries over a document: information, attachments, form fields.
 */

#ifndef FOLIO_DOCUMENT_INSPECTOR_HPP
#define FOLIO_DOCUMENT_INSPECTOR_HPP

#include "document_assembler.hpp"
#include "models.hpp"
#include "progress.hpp"
#include "source_document.hpp"
#include <filesystem>
#include <optional>
#include <vector>

namespace folio {

/**
 * @brief Inspects documents with qpdf.
 *
 * Each call loads the document under the engine lock and releases it
 * before returning. Load failures become OperationError with the
 * EngineError nested.
 */
class DocumentInspector {
public:
    explicit DocumentInspector(IArtifactSink& sink, IProgressReporter* progress = nullptr)
        : sink_(sink), progress_(progress) {}

    [[nodiscard]] PdfInfo info(const SourceDocument& source);

    /// @return Embedded files in name-tree order.
    [[nodiscard]] std::vector<Attachment> attachments(const SourceDocument& source);

    /**
     * @brief Writes embedded files into @p output_dir under their sanitized names.
     * @param index 0-based attachment to extract; every attachment when empty.
     * @throws ValidationError when @p index is out of range.
     * @return Written paths.
     */
    std::vector<std::filesystem::path> extract_attachments(const SourceDocument& source,
                                                           const std::filesystem::path& output_dir,
                                                           std::optional<int> index = std::nullopt);

    /// @return One entry per widget annotation, in page order.
    [[nodiscard]] std::vector<FormField> form_fields(const SourceDocument& source, const PageRange& range = {});

private:
    IArtifactSink& sink_;
    IProgressReporter* progress_;
};

} // namespace folio

#endif // FOLIO_DOCUMENT_INSPECTOR_HPP
