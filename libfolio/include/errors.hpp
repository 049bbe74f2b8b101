//
// Created by Giuseppe Francione on 02/02/26.
//

/**
 * @file errors.hpp
 * @brief Exception types raised by libfolio.
 */

#ifndef FOLIO_ERRORS_HPP
#define FOLIO_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace folio {

/**
 * @brief Failure categories reported by the PDF engines.
 */
enum class EngineErrorKind {
    File,      ///< file not found or could not be opened
    Format,    ///< not a PDF or corrupted
    Password,  ///< password required or incorrect
    Security,  ///< unsupported security scheme
    Page,      ///< page not found or content error
    XfaLoad,   ///< XFA form could not be loaded
    XfaLayout, ///< XFA form layout failed
    Unknown
};

/// @return Human-readable category for an engine error kind.
[[nodiscard]] std::string_view to_string(EngineErrorKind kind) noexcept;

/**
 * @brief Invalid user input detected before any engine call.
 */
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A PDF engine failed to load, edit or save a document.
 */
class EngineError : public std::runtime_error {
public:
    EngineError(EngineErrorKind kind, const std::string& what);

    [[nodiscard]] EngineErrorKind kind() const noexcept { return kind_; }

private:
    EngineErrorKind kind_;
};

/**
 * @brief Operation-level failure. The original cause, if any, is nested.
 */
class OperationError : public std::runtime_error {
public:
    explicit OperationError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Flattens an exception and its nested causes into one line.
 * @return "outer: inner: innermost".
 */
[[nodiscard]] std::string describe_error(const std::exception& e);

} // namespace folio

#endif // FOLIO_ERRORS_HPP
