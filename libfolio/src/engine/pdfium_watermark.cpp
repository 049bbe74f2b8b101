//
// Created by Giuseppe Francione on 16/02/26.
//

#include "../../include/pdfium_service.hpp"
#include "../../include/engine_lock.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "pdfium_support.hpp"
#include <fpdf_edit.h>
#include <cmath>
#include <exception>
#include <mutex>
#include <numbers>

namespace folio {

namespace {

constexpr auto kTag = "pdfium_watermark";

// owns a page object until the page takes it
struct PageObjectGuard {
    FPDF_PAGEOBJECT obj = nullptr;
    ~PageObjectGuard() { if (obj) FPDFPageObj_Destroy(obj); }
    FPDF_PAGEOBJECT release() noexcept { auto* o = obj; obj = nullptr; return o; }
};

void stamp_text(FPDF_DOCUMENT doc, FPDF_PAGE page, const WatermarkOptions& options, const std::u16string& text) {
    PageObjectGuard guard{FPDFPageObj_NewTextObj(doc, options.font.c_str(), static_cast<float>(options.font_size))};
    if (!guard.obj) {
        throw EngineError(EngineErrorKind::Unknown, "cannot create a text object with font " + options.font);
    }
    if (!FPDFText_SetText(guard.obj, reinterpret_cast<FPDF_WIDESTRING>(text.c_str()))) {
        throw EngineError(EngineErrorKind::Unknown, "cannot set watermark text");
    }
    FPDFPageObj_SetFillColor(guard.obj, options.color.r, options.color.g, options.color.b, options.opacity);

    float left = 0, bottom = 0, right = 0, top = 0;
    FPDFPageObj_GetBounds(guard.obj, &left, &bottom, &right, &top);
    const double cx = (left + right) / 2.0;
    const double cy = (bottom + top) / 2.0;

    // rotate about the text center, then move that center to the page center
    const double angle = options.rotation * std::numbers::pi / 180.0;
    const double cos_a = std::cos(angle);
    const double sin_a = std::sin(angle);
    const double page_cx = FPDF_GetPageWidthF(page) / 2.0;
    const double page_cy = FPDF_GetPageHeightF(page) / 2.0;
    const double e = page_cx - (cx * cos_a - cy * sin_a);
    const double f = page_cy - (cx * sin_a + cy * cos_a);
    FPDFPageObj_Transform(guard.obj, cos_a, sin_a, -sin_a, cos_a, e, f);

    FPDFPage_InsertObject(page, guard.release());
}

void stamp_image(FPDF_DOCUMENT doc, FPDF_PAGE page, const WatermarkOptions& options, const Image& image,
                 std::vector<unsigned char>& bgra) {
    PageObjectGuard guard{FPDFPageObj_NewImageObj(doc)};
    if (!guard.obj) {
        throw EngineError(EngineErrorKind::Unknown, "cannot create an image object");
    }
    const pdfium::unique_bitmap bitmap(FPDFBitmap_CreateEx(image.width, image.height, FPDFBitmap_BGRA,
                                                           bgra.data(), image.width * 4));
    if (!bitmap || !FPDFImageObj_SetBitmap(nullptr, 0, guard.obj, bitmap.get())) {
        throw EngineError(EngineErrorKind::Unknown, "cannot attach the watermark bitmap");
    }

    const double width = image.width * options.scale;
    const double height = image.height * options.scale;
    const double x = (FPDF_GetPageWidthF(page) - width) / 2.0;
    const double y = (FPDF_GetPageHeightF(page) - height) / 2.0;
    FPDFImageObj_SetMatrix(guard.obj, width, 0, 0, height, x, y);

    FPDFPage_InsertObject(page, guard.release());
}

} // namespace

void PdfiumService::watermark(const SourceDocument& source, const std::filesystem::path& output,
                              const WatermarkOptions& options, const PageRange& range) {
    require_output(output, "watermark");
    const bool has_text = options.text && !options.text->empty();
    const bool has_image = options.image && !options.image->empty();
    if (has_text == has_image) {
        throw ValidationError("watermark: specify either a text or an image");
    }
    if (!(options.font_size > 0.0)) {
        throw ValidationError("watermark: font size must be positive");
    }
    if (!(options.scale > 0.0)) {
        throw ValidationError("watermark: image scale must be positive");
    }
    if (range.empty()) {
        throw ValidationError("watermark: page range selects no pages");
    }

    Image image;
    std::vector<unsigned char> bgra;
    if (has_image) {
        require_source(SourceDocument{*options.image, {}}, "watermark");
        const IImageCodec& codec = codecs_.require(lowercase_extension(*options.image));
        try {
            image = codec.decode(*options.image);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "watermark: cannot decode " + options.image->string() + ": " + e.what(), kTag);
            std::throw_with_nested(OperationError("watermark: cannot decode " + options.image->string()));
        }
        bgra = to_bgra(image);
    }
    const std::u16string text = has_text ? pdfium::to_utf16(*options.text) : std::u16string();

    std::lock_guard lock(engine_mutex());
    const auto doc = pdfium::open_source(source, "watermark");
    if (has_text) {
        FPDF_FONT font = FPDFText_LoadStandardFont(doc.get(), options.font.c_str());
        if (!font) {
            throw ValidationError("watermark: unknown font " + options.font);
        }
        FPDFFont_Close(font);
    }

    const int page_count = FPDF_GetPageCount(doc.get());
    const std::vector<int> pages = range.select(page_count);
    for (const int page_number : pages) {
        try {
            const auto page = pdfium::load_page(doc.get(), page_number - 1);
            if (has_text) {
                stamp_text(doc.get(), page.get(), options, text);
            } else {
                stamp_image(doc.get(), page.get(), options, image, bgra);
            }
            if (!FPDFPage_GenerateContent(page.get())) {
                throw EngineError(EngineErrorKind::Page, "cannot regenerate page content");
            }
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "watermark: page " + std::to_string(page_number) + " failed: " + e.what(), kTag);
            std::throw_with_nested(OperationError("watermark: cannot stamp page " + std::to_string(page_number)));
        }
        report_progress(progress_, page_number, page_count);
    }

    try {
        sink_.write(output, pdfium::save_document(doc.get()));
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "watermark: cannot write " + output.string() + ": " + e.what(), kTag);
        std::throw_with_nested(OperationError("watermark: cannot write " + output.string()));
    }
    Logger::log(LogLevel::Info, "watermark: " + std::to_string(pages.size()) + " pages -> " + output.string(), kTag);
}

} // namespace folio
