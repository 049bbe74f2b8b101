//
// Created by Giuseppe Francione on 11/02/26.
//

#include "../../include/document_inspector.hpp"
#include "../../include/engine_lock.hpp"
#include "../../include/errors.hpp"
#include "../../include/filename_sanitizer.hpp"
#include "../../include/logger.hpp"
#include "qpdf_support.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/QPDFAcroFormDocumentHelper.hh>
#include <qpdf/QPDFAnnotationObjectHelper.hh>
#include <qpdf/QPDFEFStreamObjectHelper.hh>
#include <qpdf/QPDFEmbeddedFileDocumentHelper.hh>
#include <qpdf/QPDFFileSpecObjectHelper.hh>
#include <qpdf/QPDFFormFieldObjectHelper.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <exception>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace folio {

namespace {

constexpr auto kTag = "document_inspector";

void open_source(QpdfHandle& handle, const SourceDocument& source, const std::string_view operation) {
    require_source(source, operation);
    try {
        handle.open(source.path, source.password);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error,
            std::string(operation) + ": cannot load " + source.path.string() + " (" + e.what() + ")", kTag);
        std::throw_with_nested(OperationError(std::string(operation) + ": cannot load " + source.path.string()));
    }
}

std::string info_string(QPDFObjectHandle info, const char* key) {
    if (!info.isDictionary()) return {};
    QPDFObjectHandle value = info.getKey(key);
    if (value.isString()) return value.getUTF8Value();
    // /Trapped is usually a name
    if (value.isName()) return value.getName().substr(1);
    return {};
}

int version_number(const std::string& version) {
    std::string digits;
    for (const char c : version) {
        if (c >= '0' && c <= '9') digits.push_back(c);
    }
    return digits.empty() ? 0 : std::stoi(digits);
}

std::string field_type_name(QPDFFormFieldObjectHelper& field) {
    if (field.isText()) return "text";
    if (field.isCheckbox()) return "checkbox";
    if (field.isRadioButton()) return "radiobutton";
    if (field.isPushbutton()) return "pushbutton";
    if (field.isChoice()) return "choice";
    const std::string type = field.getFieldType();
    if (type == "/Sig") return "signature";
    return type.empty() ? "unknown" : type.substr(1);
}

std::string format_rect(const QPDFObjectHandle::Rectangle& r) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << r.llx << ',' << r.lly << ',' << r.urx << ',' << r.ury;
    return os.str();
}

std::vector<unsigned char> stream_bytes(QPDFObjectHandle stream) {
    const std::shared_ptr<Buffer> data = stream.getStreamData(qpdf_dl_all);
    const unsigned char* begin = data->getBuffer();
    return {begin, begin + data->getSize()};
}

} // namespace

PdfInfo DocumentInspector::info(const SourceDocument& source) {
    std::lock_guard lock(engine_mutex());
    QpdfHandle handle;
    open_source(handle, source, "info");
    QPDF& pdf = handle.get();

    PdfInfo out;
    try {
        out.pages = static_cast<int>(QPDFPageDocumentHelper(pdf).getAllPages().size());
        QPDFObjectHandle info = pdf.getTrailer().getKey("/Info");
        out.author = info_string(info, "/Author");
        out.creation_date = info_string(info, "/CreationDate");
        out.creator = info_string(info, "/Creator");
        out.keywords = info_string(info, "/Keywords");
        out.producer = info_string(info, "/Producer");
        out.modified_date = info_string(info, "/ModDate");
        out.subject = info_string(info, "/Subject");
        out.title = info_string(info, "/Title");
        out.trapped = info_string(info, "/Trapped");
        out.version = version_number(pdf.getPDFVersion());
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "info: " + source.path.string() + ": " + e.what(), kTag);
        std::throw_with_nested(OperationError("info: cannot read " + source.path.string()));
    }
    report_progress(progress_, 1, 1, source.path.string());
    return out;
}

std::vector<Attachment> DocumentInspector::attachments(const SourceDocument& source) {
    std::lock_guard lock(engine_mutex());
    QpdfHandle handle;
    open_source(handle, source, "list-attachments");

    std::vector<Attachment> out;
    try {
        QPDFEmbeddedFileDocumentHelper efdh(handle.get());
        const auto files = efdh.getEmbeddedFiles();
        const int total = static_cast<int>(files.size());
        Logger::log(LogLevel::Info, "Found " + std::to_string(total) + " attachments in " + source.path.string(), kTag);
        int i = 0;
        for (const auto& [key, spec] : files) {
            Attachment a;
            a.name = spec->getFilename();
            if (a.name.empty()) a.name = key;
            a.description = spec->getDescription();
            QPDFEFStreamObjectHelper ef(spec->getEmbeddedFileStream());
            a.mime_type = ef.getSubtype();
            a.size = ef.getSize();
            a.creation_date = ef.getCreationDate();
            a.modification_date = ef.getModDate();
            out.push_back(std::move(a));
            report_progress(progress_, ++i, total, key);
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "list-attachments: " + source.path.string() + ": " + e.what(), kTag);
        std::throw_with_nested(OperationError("list-attachments: cannot read " + source.path.string()));
    }
    return out;
}

std::vector<std::filesystem::path> DocumentInspector::extract_attachments(const SourceDocument& source,
                                                                          const std::filesystem::path& output_dir,
                                                                          const std::optional<int> index) {
    require_output(output_dir, "extract-attachments");

    std::lock_guard lock(engine_mutex());
    QpdfHandle handle;
    open_source(handle, source, "extract-attachments");

    QPDFEmbeddedFileDocumentHelper efdh(handle.get());
    const auto files = efdh.getEmbeddedFiles();
    const int count = static_cast<int>(files.size());
    if (index && (*index < 0 || *index >= count)) {
        throw ValidationError("extract-attachments: attachment index " + std::to_string(*index) +
                              " is out of range, the document has " + std::to_string(count));
    }

    std::vector<std::filesystem::path> written;
    const int total = index ? 1 : count;
    int i = 0;
    for (const auto& [key, spec] : files) {
        const int current = i++;
        if (index && current != *index) continue;

        std::string name = sanitize_filename(spec->getFilename().empty() ? key : spec->getFilename());
        if (name.empty()) {
            name = "attachment-" + std::to_string(current);
        }
        const std::filesystem::path target = output_dir / name;
        try {
            sink_.write(target, stream_bytes(spec->getEmbeddedFileStream()));
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "extract-attachments: " + name + " failed: " + e.what(), kTag);
            std::throw_with_nested(OperationError("extract-attachments: cannot extract " + name));
        }
        written.push_back(target);
        report_progress(progress_, static_cast<int>(written.size()), total, target.string());
    }

    Logger::log(LogLevel::Info, "extract-attachments: wrote " + std::to_string(written.size()) + " files to " +
                output_dir.string(), kTag);
    return written;
}

std::vector<FormField> DocumentInspector::form_fields(const SourceDocument& source, const PageRange& range) {
    if (range.empty()) {
        throw ValidationError("list-forms: page range selects no pages");
    }

    std::lock_guard lock(engine_mutex());
    QpdfHandle handle;
    open_source(handle, source, "list-forms");

    std::vector<FormField> out;
    try {
        QPDF& pdf = handle.get();
        QPDFAcroFormDocumentHelper afdh(pdf);
        auto pages = QPDFPageDocumentHelper(pdf).getAllPages();
        const std::vector<int> selected = range.select(static_cast<int>(pages.size()));
        int done = 0;
        for (const int page : selected) {
            for (auto& annot : afdh.getWidgetAnnotationsForPage(pages[static_cast<size_t>(page - 1)])) {
                QPDFFormFieldObjectHelper field = afdh.getFieldForAnnotation(annot);
                FormField f;
                f.page = page;
                f.name = field.getFullyQualifiedName();
                f.type = field_type_name(field);
                f.value = field.getValueAsString();
                f.rect = format_rect(annot.getRect());
                out.push_back(std::move(f));
            }
            report_progress(progress_, ++done, static_cast<int>(selected.size()));
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "list-forms: " + source.path.string() + ": " + e.what(), kTag);
        std::throw_with_nested(OperationError("list-forms: cannot read " + source.path.string()));
    }
    return out;
}

} // namespace folio
