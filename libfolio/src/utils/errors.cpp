//
// Created by Giuseppe Francione on 02/02/26.
//

#include "../../include/errors.hpp"
#include <exception>

namespace folio {

std::string_view to_string(const EngineErrorKind kind) noexcept {
    switch (kind) {
        case EngineErrorKind::File:      return "file not found or could not be opened";
        case EngineErrorKind::Format:    return "file not in PDF format or corrupted";
        case EngineErrorKind::Password:  return "password required or incorrect password";
        case EngineErrorKind::Security:  return "unsupported security scheme";
        case EngineErrorKind::Page:      return "page not found or content error";
        case EngineErrorKind::XfaLoad:   return "load XFA error";
        case EngineErrorKind::XfaLayout: return "layout XFA error";
        case EngineErrorKind::Unknown:   return "unknown error";
    }
    return "unknown error";
}

EngineError::EngineError(const EngineErrorKind kind, const std::string& what)
    : std::runtime_error(std::string(to_string(kind)) + ": " + what), kind_(kind) {}

namespace {

void append_nested(const std::exception& e, std::string& out) {
    out += e.what();
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& inner) {
        out += ": ";
        append_nested(inner, out);
    }
}

} // namespace

std::string describe_error(const std::exception& e) {
    std::string out;
    append_nested(e, out);
    return out;
}

} // namespace folio
