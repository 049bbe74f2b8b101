//
// Created by Giuseppe Francione on 15/02/26.
//

#include "../../include/pdfium_service.hpp"
#include "../../include/engine_lock.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/filename_sanitizer.hpp"
#include "../../include/logger.hpp"
#include "../../include/naming_strategy.hpp"
#include "pdfium_support.hpp"
#include <cmath>
#include <exception>
#include <mutex>

namespace folio {

namespace {

constexpr auto kTag = "pdfium_render";

/**
 * @brief Renders one page at @p scale onto a white background, annotations included.
 * @return RGB image.
 */
Image render_page(FPDF_PAGE page, const double scale) {
    const int width = static_cast<int>(std::lround(FPDF_GetPageWidthF(page) * scale));
    const int height = static_cast<int>(std::lround(FPDF_GetPageHeightF(page) * scale));
    if (width <= 0 || height <= 0) {
        throw EngineError(EngineErrorKind::Page, "page has an empty render size");
    }

    const pdfium::unique_bitmap bitmap(FPDFBitmap_Create(width, height, 0));
    if (!bitmap) {
        throw EngineError(EngineErrorKind::Unknown,
            "cannot allocate a " + std::to_string(width) + "x" + std::to_string(height) + " bitmap");
    }
    FPDFBitmap_FillRect(bitmap.get(), 0, 0, width, height, 0xFFFFFFFF);
    FPDF_RenderPageBitmap(bitmap.get(), page, 0, 0, width, height, 0, FPDF_ANNOT);

    // BGRx -> RGB
    const auto* buffer = static_cast<const unsigned char*>(FPDFBitmap_GetBuffer(bitmap.get()));
    const int stride = FPDFBitmap_GetStride(bitmap.get());
    Image image;
    image.width = width;
    image.height = height;
    image.channels = 3;
    image.pixels.resize(image.stride() * static_cast<size_t>(height));
    for (int y = 0; y < height; ++y) {
        const unsigned char* src = buffer + static_cast<size_t>(y) * stride;
        unsigned char* dst = image.pixels.data() + static_cast<size_t>(y) * image.stride();
        for (int x = 0; x < width; ++x, src += 4, dst += 3) {
            dst[0] = src[2];
            dst[1] = src[1];
            dst[2] = src[0];
        }
    }
    return image;
}

} // namespace

std::vector<std::filesystem::path> PdfiumService::convert(const SourceDocument& source,
                                                          const ConvertOptions& options) {
    if (options.dpi < kMinDpi || options.dpi > kMaxDpi) {
        throw ValidationError("convert: dpi must be between " + std::to_string(kMinDpi) + " and " +
                              std::to_string(kMaxDpi) + ", got " + std::to_string(options.dpi));
    }
    if (options.range.empty()) {
        throw ValidationError("convert: page range selects no pages");
    }
    const IImageCodec& codec = codecs_.require(options.encoder);
    const std::string extension(codec.get_supported_extensions().front());

    const std::filesystem::path output_dir = options.output_dir.empty()
        ? source.path.parent_path()
        : options.output_dir;

    std::lock_guard lock(engine_mutex());
    const auto doc = pdfium::open_source(source, "convert");
    const int page_count = FPDF_GetPageCount(doc.get());
    const std::vector<int> pages = options.range.select(page_count);
    if (pages.empty()) {
        throw ValidationError("convert: page range " + options.range.to_string() +
                              " selects no pages of a " + std::to_string(page_count) + "-page document");
    }
    ensure_directory(output_dir, kTag);

    NamingRules rules;
    rules.original_stem = sanitize_filename(source.path.stem().string());
    rules.name_template = options.name_template;
    NamingPlan plan(std::move(rules));

    const double scale = options.dpi / 72.0;
    std::vector<std::filesystem::path> written;
    for (const int page_number : pages) {
        std::string name = plan.assign(page_number);
        if (!codecs_.find_by_extension(lowercase_extension(name))) {
            name += extension;
        }
        const std::filesystem::path target = output_dir / name;
        try {
            Image image;
            {
                const auto page = pdfium::load_page(doc.get(), page_number - 1);
                image = render_page(page.get(), scale);
            }
            const IImageCodec* target_codec = codecs_.find_by_extension(lowercase_extension(target));
            target_codec->encode(image, target);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "convert: page " + std::to_string(page_number) + " -> " +
                        target.string() + " failed: " + e.what(), kTag);
            std::throw_with_nested(OperationError(
                "convert: page " + std::to_string(page_number) + " (" + target.filename().string() + ") failed"));
        }
        written.push_back(target);
        report_progress(progress_, page_number, page_count, target.string());
    }

    Logger::log(LogLevel::Info, "convert: wrote " + std::to_string(written.size()) + " " + std::string(codec.get_name()) +
                " images to " + output_dir.string(), kTag);
    return written;
}

} // namespace folio
