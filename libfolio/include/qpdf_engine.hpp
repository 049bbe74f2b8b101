//
// Created by Giuseppe Francione on 10/02/26.
//

#ifndef FOLIO_QPDF_ENGINE_HPP
#define FOLIO_QPDF_ENGINE_HPP

#include "pdf_engine.hpp"

namespace folio {

/**
 * @brief IPdfEngine backed by qpdf.
 *
 * Documents produced by this engine only accept pages imported from
 * other documents of the same engine.
 */
class QpdfEngine final : public IPdfEngine {
public:
    [[nodiscard]] std::unique_ptr<IPdfDocument> load_document(const std::filesystem::path& path,
                                                              const std::string& password) override;

    [[nodiscard]] std::unique_ptr<IPdfDocument> create_document() override;
};

} // namespace folio

#endif // FOLIO_QPDF_ENGINE_HPP
