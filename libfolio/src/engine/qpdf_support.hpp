//
// Created by Giuseppe Francione on 10/02/26.
//

#ifndef FOLIO_QPDF_SUPPORT_HPP
#define FOLIO_QPDF_SUPPORT_HPP

#include "../../include/errors.hpp"
#include "../../include/log_sink.hpp"
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFLogger.hh>
#include <filesystem>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace folio {

/**
 * @brief stringbuf that forwards each flushed chunk to Logger.
 */
struct LoggerStreamBuf final : std::stringbuf {
    LogLevel level;
    std::string module;
    LoggerStreamBuf(const LogLevel lvl, const char* mod) : level(lvl), module(mod) {}
    int sync() override;
    ~LoggerStreamBuf() override { LoggerStreamBuf::sync(); }
};

/**
 * @brief A QPDF instance whose diagnostics go to Logger.
 *
 * The streams are declared before the QPDF object so they outlive it.
 */
class QpdfHandle {
public:
    QpdfHandle();

    QpdfHandle(const QpdfHandle&) = delete;
    QpdfHandle& operator=(const QpdfHandle&) = delete;

    /**
     * @brief Opens @p path.
     * @throws EngineError mapped from the qpdf failure.
     */
    void open(const std::filesystem::path& path, const std::string& password);

    /// @brief Starts an empty document.
    void create();

    QPDF& get() noexcept { return *pdf_; }
    const QPDF& get() const noexcept { return *pdf_; }

private:
    LoggerStreamBuf info_buf_{LogLevel::Debug, "qpdf"};
    LoggerStreamBuf warn_buf_{LogLevel::Warning, "qpdf"};
    std::ostream info_os_{&info_buf_};
    std::ostream warn_os_{&warn_buf_};
    std::unique_ptr<QPDF> pdf_;
};

/// @brief Maps a qpdf exception onto the engine error taxonomy.
EngineErrorKind to_engine_error_kind(const QPDFExc& e) noexcept;

/**
 * @brief Writes @p pdf to memory.
 * @throws EngineError on failure.
 */
std::vector<unsigned char> write_to_memory(QPDF& pdf, bool remove_security);

} // namespace folio

#endif // FOLIO_QPDF_SUPPORT_HPP
