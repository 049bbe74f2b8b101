//
// Created by Giuseppe Francione on 16/02/26.
//

#include "../../include/pdfium_service.hpp"
#include "../../include/engine_lock.hpp"
#include "../../include/logger.hpp"
#include "pdfium_support.hpp"
#include <fpdf_edit.h>
#include <array>
#include <exception>
#include <mutex>

namespace folio {

namespace {

constexpr auto kTag = "pdfium_content";

constexpr std::array<const char*, 6> kObjectTypeNames = {"Unknown", "Text", "Path", "Image", "Shading", "Form"};

std::string object_type_name(const int type) {
    const char* name = type >= 0 && type < static_cast<int>(kObjectTypeNames.size())
        ? kObjectTypeNames[static_cast<size_t>(type)]
        : "Unknown";
    return std::string(name) + " (" + std::to_string(type) + ")";
}

PageText read_page_text(FPDF_PAGE page, const int page_number) {
    const pdfium::unique_text_page text_page(FPDFText_LoadPage(page));
    if (!text_page) {
        throw EngineError(EngineErrorKind::Page, "cannot load text of page " + std::to_string(page_number));
    }

    PageText out;
    out.page = page_number;
    out.characters = FPDFText_CountChars(text_page.get());
    if (out.characters <= 0) {
        out.characters = 0;
        return out;
    }

    for (int i = 0; i < out.characters; ++i) {
        const unsigned int unicode = FPDFText_GetUnicode(text_page.get(), i);
        if (unicode == ' ' || unicode == '\n' || unicode == '\t') {
            ++out.words_count;
        }
    }

    // room for the terminator pdfium always writes
    std::vector<unsigned short> buffer(static_cast<size_t>(out.characters) + 1);
    const int written = FPDFText_GetText(text_page.get(), 0, out.characters, buffer.data());
    if (written > 1) {
        out.text = pdfium::to_utf8(buffer.data(), static_cast<size_t>(written - 1));
    }

    const int rect_count = FPDFText_CountRects(text_page.get(), 0, out.characters);
    for (int i = 0; i < rect_count; ++i) {
        TextRect r;
        if (FPDFText_GetRect(text_page.get(), i, &r.left, &r.top, &r.right, &r.bottom)) {
            out.rects.push_back(r);
        }
    }
    return out;
}

} // namespace

std::vector<PageText> PdfiumService::extract_text(const SourceDocument& source, const PageRange& range) {
    if (range.empty()) {
        throw ValidationError("text: page range selects no pages");
    }

    std::lock_guard lock(engine_mutex());
    const auto doc = pdfium::open_source(source, "text");
    const int page_count = FPDF_GetPageCount(doc.get());
    const std::vector<int> pages = range.select(page_count);

    std::vector<PageText> out;
    out.reserve(pages.size());
    for (const int page_number : pages) {
        try {
            const auto page = pdfium::load_page(doc.get(), page_number - 1);
            out.push_back(read_page_text(page.get(), page_number));
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "text: page " + std::to_string(page_number) + " failed: " + e.what(), kTag);
            std::throw_with_nested(OperationError("text: cannot read page " + std::to_string(page_number)));
        }
        report_progress(progress_, page_number, page_count, std::to_string(out.back().characters) + " characters");
    }
    return out;
}

std::vector<PageObject> PdfiumService::list_objects(const SourceDocument& source, const PageRange& range) {
    if (range.empty()) {
        throw ValidationError("list-objects: page range selects no pages");
    }

    std::lock_guard lock(engine_mutex());
    const auto doc = pdfium::open_source(source, "list-objects");
    const int page_count = FPDF_GetPageCount(doc.get());
    const std::vector<int> pages = range.select(page_count);

    std::vector<PageObject> out;
    for (const int page_number : pages) {
        try {
            const auto page = pdfium::load_page(doc.get(), page_number - 1);
            const int count = FPDFPage_CountObjects(page.get());
            for (int i = 0; i < count; ++i) {
                FPDF_PAGEOBJECT obj = FPDFPage_GetObject(page.get(), i);
                if (!obj) continue;
                PageObject info;
                info.page = page_number;
                info.index = i;
                info.type = object_type_name(FPDFPageObj_GetType(obj));
                if (!FPDFPageObj_GetBounds(obj, &info.left, &info.bottom, &info.right, &info.top)) {
                    Logger::log(LogLevel::Debug, "No bounds for object " + std::to_string(i) + " on page " +
                                std::to_string(page_number), kTag);
                }
                out.push_back(std::move(info));
            }
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "list-objects: page " + std::to_string(page_number) + " failed: " + e.what(), kTag);
            std::throw_with_nested(OperationError("list-objects: cannot read page " + std::to_string(page_number)));
        }
        report_progress(progress_, page_number, page_count);
    }
    return out;
}

void PdfiumService::remove_object(const SourceDocument& source, const std::filesystem::path& output,
                                  const int page_number, const int object_index) {
    require_output(output, "remove-object");
    if (page_number < 1) {
        throw ValidationError("remove-object: page number must be 1 or greater, got " + std::to_string(page_number));
    }
    if (object_index < 0) {
        throw ValidationError("remove-object: object index must be 0 or greater, got " +
                              std::to_string(object_index));
    }

    std::lock_guard lock(engine_mutex());
    const auto doc = pdfium::open_source(source, "remove-object");
    const int page_count = FPDF_GetPageCount(doc.get());
    if (page_number > page_count) {
        throw ValidationError("remove-object: page " + std::to_string(page_number) + " is out of range 1-" +
                              std::to_string(page_count));
    }

    {
        const auto page = pdfium::load_page(doc.get(), page_number - 1);
        const int count = FPDFPage_CountObjects(page.get());
        if (object_index >= count) {
            throw ValidationError("remove-object: object " + std::to_string(object_index) + " is out of range, page " +
                                  std::to_string(page_number) + " has " + std::to_string(count) + " objects");
        }
        try {
            FPDF_PAGEOBJECT obj = FPDFPage_GetObject(page.get(), object_index);
            if (!obj || !FPDFPage_RemoveObject(page.get(), obj)) {
                throw EngineError(EngineErrorKind::Page, "cannot remove object " + std::to_string(object_index));
            }
            // a removed object belongs to the caller
            FPDFPageObj_Destroy(obj);
            if (!FPDFPage_GenerateContent(page.get())) {
                throw EngineError(EngineErrorKind::Page, "cannot regenerate page content");
            }
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "remove-object: page " + std::to_string(page_number) + " failed: " + e.what(),
                        kTag);
            std::throw_with_nested(OperationError("remove-object: cannot edit page " + std::to_string(page_number)));
        }
    }

    try {
        sink_.write(output, pdfium::save_document(doc.get()));
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "remove-object: cannot write " + output.string() + ": " + e.what(), kTag);
        std::throw_with_nested(OperationError("remove-object: cannot write " + output.string()));
    }
    report_progress(progress_, 1, 1, output.string());
    Logger::log(LogLevel::Info, "remove-object: removed object " + std::to_string(object_index) + " of page " +
                std::to_string(page_number) + " -> " + output.string(), kTag);
}

} // namespace folio
