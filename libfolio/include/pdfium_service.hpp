//
// Created by Giuseppe Francione on 15/02/26.
//

/**
 * @file pdfium_service.hpp
 * @brief Operations that need a rendering engine: convert, text, page objects, watermark.
 */

#ifndef FOLIO_PDFIUM_SERVICE_HPP
#define FOLIO_PDFIUM_SERVICE_HPP

#include "codec_registry.hpp"
#include "document_assembler.hpp"
#include "models.hpp"
#include "page_range.hpp"
#include "progress.hpp"
#include "source_document.hpp"
#include <filesystem>
#include <vector>

namespace folio {

/**
 * @brief Rendering and content services on top of pdfium.
 *
 * pdfium keeps process-wide state, so every call runs under the global
 * engine lock. Document, page and text-page handles are scoped to the
 * call and released inner first.
 */
class PdfiumService {
public:
    PdfiumService(const CodecRegistry& codecs, IArtifactSink& sink, IProgressReporter* progress = nullptr)
        : codecs_(codecs), sink_(sink), progress_(progress) {}

    /**
     * @brief Rasterizes the selected pages and encodes one image per page.
     * @return Written paths, in page order.
     */
    std::vector<std::filesystem::path> convert(const SourceDocument& source, const ConvertOptions& options);

    /// @return Text of each selected page.
    [[nodiscard]] std::vector<PageText> extract_text(const SourceDocument& source, const PageRange& range);

    /// @return Every page object of the selected pages with its bounds.
    [[nodiscard]] std::vector<PageObject> list_objects(const SourceDocument& source, const PageRange& range);

    /**
     * @brief Deletes one page object and writes the result to @p output.
     * @param page_number 1-based page.
     * @param object_index 0-based index as reported by list_objects().
     * @throws ValidationError when the page or the object does not exist.
     */
    void remove_object(const SourceDocument& source, const std::filesystem::path& output,
                       int page_number, int object_index);

    /**
     * @brief Stamps a text or an image on every selected page and writes @p output.
     * @throws ValidationError unless exactly one of text and image is set.
     */
    void watermark(const SourceDocument& source, const std::filesystem::path& output,
                   const WatermarkOptions& options, const PageRange& range);

private:
    const CodecRegistry& codecs_;
    IArtifactSink& sink_;
    IProgressReporter* progress_;
};

} // namespace folio

#endif // FOLIO_PDFIUM_SERVICE_HPP
