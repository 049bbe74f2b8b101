//
// Created by Giuseppe Francione on 10/02/26.
//

#include "qpdf_support.hpp"
#include "../../include/logger.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/QPDFWriter.hh>
#include <stdexcept>
#include <system_error>

namespace folio {

int LoggerStreamBuf::sync() {
    std::string s = str();
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    if (!s.empty()) {
        Logger::log(level, s, module);
    }
    str("");
    return 0;
}

QpdfHandle::QpdfHandle() : pdf_(std::make_unique<QPDF>()) {
    auto qlogger = QPDFLogger::create();
    qlogger->setOutputStreams(&info_os_, &warn_os_);
    pdf_->setLogger(qlogger);
}

void QpdfHandle::open(const std::filesystem::path& path, const std::string& password) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        Logger::log(LogLevel::Error, "PDF not found: " + path.string(), "qpdf_engine");
        throw EngineError(EngineErrorKind::File, path.string());
    }
    try {
        pdf_->processFile(path.string().c_str(), password.empty() ? nullptr : password.c_str());
    } catch (const QPDFExc& e) {
        Logger::log(LogLevel::Error, "Cannot open " + path.string() + ": " + e.what(), "qpdf_engine");
        throw EngineError(to_engine_error_kind(e), path.string() + " (" + e.getMessageDetail() + ")");
    } catch (const std::runtime_error& e) {
        // qpdf reports I/O failures as plain runtime_error
        Logger::log(LogLevel::Error, "Cannot read " + path.string() + ": " + e.what(), "qpdf_engine");
        throw EngineError(EngineErrorKind::File, path.string() + " (" + e.what() + ")");
    }
}

void QpdfHandle::create() {
    pdf_->emptyPDF();
}

EngineErrorKind to_engine_error_kind(const QPDFExc& e) noexcept {
    switch (e.getErrorCode()) {
        case qpdf_e_system:      return EngineErrorKind::File;
        case qpdf_e_damaged_pdf: return EngineErrorKind::Format;
        case qpdf_e_object:      return EngineErrorKind::Format;
        case qpdf_e_password:    return EngineErrorKind::Password;
        case qpdf_e_unsupported: return EngineErrorKind::Security;
        case qpdf_e_pages:       return EngineErrorKind::Page;
        default:                 return EngineErrorKind::Unknown;
    }
}

std::vector<unsigned char> write_to_memory(QPDF& pdf, const bool remove_security) {
    try {
        QPDFWriter writer(pdf);
        writer.setOutputMemory();
        if (remove_security) {
            writer.setPreserveEncryption(false);
        }
        if (remove_security || !pdf.isEncrypted()) {
            writer.setDeterministicID(true);
        }
        writer.write();
        const std::unique_ptr<Buffer> buffer(writer.getBuffer());
        return {buffer->getBuffer(), buffer->getBuffer() + buffer->getSize()};
    } catch (const QPDFExc& e) {
        Logger::log(LogLevel::Error, std::string("qpdf write failed: ") + e.what(), "qpdf_engine");
        throw EngineError(to_engine_error_kind(e), e.what());
    } catch (const std::logic_error& e) {
        Logger::log(LogLevel::Error, std::string("qpdf write failed: ") + e.what(), "qpdf_engine");
        throw EngineError(EngineErrorKind::Unknown, e.what());
    } catch (const std::runtime_error& e) {
        Logger::log(LogLevel::Error, std::string("qpdf write failed: ") + e.what(), "qpdf_engine");
        throw EngineError(EngineErrorKind::Unknown, e.what());
    }
}

} // namespace folio
