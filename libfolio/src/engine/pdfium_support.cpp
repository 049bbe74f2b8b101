//
// Created by Giuseppe Francione on 15/02/26.
//

#include "pdfium_support.hpp"
#include "../../include/logger.hpp"
#include <exception>
#include <utility>

namespace folio::pdfium {

namespace {

constexpr auto kTag = "pdfium";

struct Library {
    Library() {
        FPDF_LIBRARY_CONFIG config{};
        config.version = 2;
        config.m_pUserFontPaths = nullptr;
        config.m_pIsolate = nullptr;
        config.m_v8EmbedderSlot = 0;
        FPDF_InitLibraryWithConfig(&config);
        Logger::log(LogLevel::Debug, "pdfium initialized", kTag);
    }
    ~Library() { FPDF_DestroyLibrary(); }

    Library(const Library&) = delete;
    Library& operator=(const Library&) = delete;
};

} // namespace

void ensure_library() {
    static Library library;
}

EngineErrorKind last_error_kind() noexcept {
    switch (FPDF_GetLastError()) {
        case FPDF_ERR_FILE:     return EngineErrorKind::File;
        case FPDF_ERR_FORMAT:   return EngineErrorKind::Format;
        case FPDF_ERR_PASSWORD: return EngineErrorKind::Password;
        case FPDF_ERR_SECURITY: return EngineErrorKind::Security;
        case FPDF_ERR_PAGE:     return EngineErrorKind::Page;
        // the XFA codes are only named in XFA-enabled builds
        case 7:                 return EngineErrorKind::XfaLoad;
        case 8:                 return EngineErrorKind::XfaLayout;
        default:                return EngineErrorKind::Unknown;
    }
}

unique_document load_document(const std::filesystem::path& path, const std::string& password) {
    ensure_library();
    unique_document doc(FPDF_LoadDocument(path.string().c_str(),
                                          password.empty() ? nullptr : password.c_str()));
    if (!doc) {
        const EngineErrorKind kind = last_error_kind();
        Logger::log(LogLevel::Error, "Failed to load " + path.string() + ": " + std::string(to_string(kind)), kTag);
        throw EngineError(kind, path.string());
    }
    return doc;
}

unique_document open_source(const SourceDocument& source, const std::string_view operation) {
    require_source(source, operation);
    try {
        return load_document(source.path, source.password);
    } catch (const EngineError&) {
        std::throw_with_nested(OperationError(std::string(operation) + ": cannot load " + source.path.string()));
    }
}

unique_page load_page(FPDF_DOCUMENT doc, const int index) {
    unique_page page(FPDF_LoadPage(doc, index));
    if (!page) {
        throw EngineError(EngineErrorKind::Page, "cannot load page " + std::to_string(index + 1));
    }
    return page;
}

std::u16string to_utf16(const std::string_view utf8) {
    // lead bytes must be followed by 10xxxxxx; anything else yields U+FFFD and resyncs on the next byte
    const auto continuation = [&utf8](const std::size_t at) {
        return at < utf8.size() && (static_cast<unsigned char>(utf8[at]) & 0xC0) == 0x80;
    };
    const auto bits = [&utf8](const std::size_t at) { return static_cast<char32_t>(utf8[at] & 0x3F); };

    std::u16string out;
    out.reserve(utf8.size() + 1);
    for (std::size_t i = 0; i < utf8.size();) {
        const auto c = static_cast<unsigned char>(utf8[i]);
        char32_t cp = 0xFFFD;
        std::size_t len = 1;
        if (c < 0x80) {
            cp = c;
        } else if ((c >> 5) == 0x6 && continuation(i + 1)) {
            cp = ((c & 0x1F) << 6) | bits(i + 1);
            len = 2;
        } else if ((c >> 4) == 0xE && continuation(i + 1) && continuation(i + 2)) {
            cp = ((c & 0x0F) << 12) | (bits(i + 1) << 6) | bits(i + 2);
            len = 3;
        } else if ((c >> 3) == 0x1E && continuation(i + 1) && continuation(i + 2) && continuation(i + 3)) {
            cp = ((c & 0x07) << 18) | (bits(i + 1) << 12) | (bits(i + 2) << 6) | bits(i + 3);
            len = 4;
        }
        if (cp > 0x10FFFF) {
            cp = 0xFFFD;
        }
        i += len;
        if (cp >= 0x10000) {
            cp -= 0x10000;
            out.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
            out.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
        } else {
            out.push_back(static_cast<char16_t>(cp));
        }
    }
    return out;
}

std::string to_utf8(const unsigned short* units, const std::size_t count) {
    std::string out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        char32_t cp = units[i];
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < count && units[i + 1] >= 0xDC00 && units[i + 1] <= 0xDFFF) {
            cp = 0x10000 + ((cp - 0xD800) << 10) + (units[i + 1] - 0xDC00);
            ++i;
        } else if (cp >= 0xD800 && cp <= 0xDFFF) {
            cp = 0xFFFD;
        }
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

ByteCollector::ByteCollector() : FPDF_FILEWRITE{} {
    version = 1;
    WriteBlock = &ByteCollector::write_block;
}

int ByteCollector::write_block(FPDF_FILEWRITE* self, const void* data, const unsigned long size) {
    auto& bytes = static_cast<ByteCollector*>(self)->bytes;
    const auto* p = static_cast<const unsigned char*>(data);
    bytes.insert(bytes.end(), p, p + size);
    return 1;
}

std::vector<unsigned char> save_document(FPDF_DOCUMENT doc) {
    ByteCollector writer;
    if (!FPDF_SaveAsCopy(doc, &writer, 0)) {
        Logger::log(LogLevel::Error, "FPDF_SaveAsCopy failed", kTag);
        throw EngineError(EngineErrorKind::Unknown, "cannot serialize document");
    }
    return std::move(writer.bytes);
}

} // namespace folio::pdfium
