//
// Created by Giuseppe Francione on 09/02/26.
//

#include "../../include/source_document.hpp"
#include "../../include/errors.hpp"
#include <system_error>

namespace folio {

void require_source(const SourceDocument& source, const std::string_view operation) {
    if (source.path.empty()) {
        throw ValidationError(std::string(operation) + ": input filename is empty");
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source.path, ec)) {
        throw ValidationError(std::string(operation) + ": input file not found: " + source.path.string());
    }
}

void require_output(const std::filesystem::path& output, const std::string_view operation) {
    if (output.empty()) {
        throw ValidationError(std::string(operation) + ": output filename is empty");
    }
}

} // namespace folio
