//
// Created by Giuseppe Francione on 15/02/26.
//

#ifndef FOLIO_PDFIUM_SUPPORT_HPP
#define FOLIO_PDFIUM_SUPPORT_HPP

#include "../../include/errors.hpp"
#include "../../include/source_document.hpp"
#include <fpdfview.h>
#include <fpdf_save.h>
#include <fpdf_text.h>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace folio::pdfium {

/**
 * @brief Initializes pdfium on first use and tears it down at exit.
 *
 * Callers must hold the engine lock.
 */
void ensure_library();

struct DocumentCloser {
    void operator()(FPDF_DOCUMENT d) const { if (d) FPDF_CloseDocument(d); }
};
struct PageCloser {
    void operator()(FPDF_PAGE p) const { if (p) FPDF_ClosePage(p); }
};
struct TextPageCloser {
    void operator()(FPDF_TEXTPAGE t) const { if (t) FPDFText_ClosePage(t); }
};
struct BitmapCloser {
    void operator()(FPDF_BITMAP b) const { if (b) FPDFBitmap_Destroy(b); }
};

using unique_document = std::unique_ptr<std::remove_pointer_t<FPDF_DOCUMENT>, DocumentCloser>;
using unique_page = std::unique_ptr<std::remove_pointer_t<FPDF_PAGE>, PageCloser>;
using unique_text_page = std::unique_ptr<std::remove_pointer_t<FPDF_TEXTPAGE>, TextPageCloser>;
using unique_bitmap = std::unique_ptr<std::remove_pointer_t<FPDF_BITMAP>, BitmapCloser>;

/// @brief Maps FPDF_GetLastError() onto the engine error taxonomy.
EngineErrorKind last_error_kind() noexcept;

/**
 * @brief Loads a document.
 * @throws EngineError with the kind reported by pdfium.
 */
unique_document load_document(const std::filesystem::path& path, const std::string& password);

/**
 * @brief Validates and loads @p source for @p operation.
 * @throws ValidationError for a missing file, OperationError (EngineError nested) when loading fails.
 */
unique_document open_source(const SourceDocument& source, std::string_view operation);

/**
 * @brief Loads one page by 0-based index.
 * @throws EngineError(Page) when pdfium returns no page.
 */
unique_page load_page(FPDF_DOCUMENT doc, int index);

/// @return UTF-16 code units of @p utf8; c_str() gives the FPDF_WIDESTRING form.
std::u16string to_utf16(std::string_view utf8);

/// @return UTF-8 text of @p count UTF-16 code units; unpaired surrogates become U+FFFD.
std::string to_utf8(const unsigned short* units, std::size_t count);

/**
 * @brief FPDF_FILEWRITE that collects the written bytes.
 */
struct ByteCollector : FPDF_FILEWRITE {
    std::vector<unsigned char> bytes;

    ByteCollector();

    static int write_block(FPDF_FILEWRITE* self, const void* data, unsigned long size);
};

/**
 * @brief Serializes @p doc as a full copy.
 * @throws EngineError on failure.
 */
std::vector<unsigned char> save_document(FPDF_DOCUMENT doc);

} // namespace folio::pdfium

#endif // FOLIO_PDFIUM_SUPPORT_HPP
