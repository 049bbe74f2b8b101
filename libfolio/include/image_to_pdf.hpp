//
// Created by Giuseppe Francione on 14/02/26.
//

#ifndef FOLIO_IMAGE_TO_PDF_HPP
#define FOLIO_IMAGE_TO_PDF_HPP

#include "codec_registry.hpp"
#include "document_assembler.hpp"
#include "progress.hpp"
#include <filesystem>

namespace folio {

struct ImageToPdfRequest {
    std::filesystem::path image;
    std::filesystem::path output; ///< empty: the image path with ".pdf"
};

/**
 * @brief Writes a one-page PDF showing @p request.image full page.
 *
 * The page's MediaBox is the image size in pixels, taken as points.
 * Transparency is composited onto white.
 *
 * @throws ValidationError for a missing image or an unknown format.
 * @throws OperationError when decoding or writing fails.
 * @return The written path.
 */
std::filesystem::path image_to_pdf(const ImageToPdfRequest& request, const CodecRegistry& codecs,
                                   IArtifactSink& sink, IProgressReporter* progress = nullptr);

} // namespace folio

#endif // FOLIO_IMAGE_TO_PDF_HPP
