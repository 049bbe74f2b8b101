//
// Created by Giuseppe Francione on 17/02/26.
//

#include "file_scanner.hpp"
#include "../cli/cli_parser.hpp"
#include "../../../libfolio/include/file_utils.hpp"
#include "../../../libfolio/include/logger.hpp"
#include <algorithm>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using folio::Logger;
using folio::LogLevel;

static bool is_junk(const fs::path& p) {
    const auto name = p.filename().string();
    return name.starts_with("._") || name.starts_with(".~");
}

namespace {
bool is_pdf_candidate(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && !is_junk(path) &&
           folio::lowercase_extension(path) == ".pdf";
}
} // namespace

std::vector<fs::path>
collect_pdf_files(const fs::path& dir, const bool recursive) {
    std::vector<fs::path> result;
    if (recursive) {
        for (const auto& e : fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied)) {
            if (is_pdf_candidate(e.path())) result.push_back(e.path());
        }
    } else {
        for (const auto& e : fs::directory_iterator(dir)) {
            if (is_pdf_candidate(e.path())) result.push_back(e.path());
        }
    }
    // directory iteration order is unspecified
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<fs::path>
read_input_script(const fs::path& script) {
    std::vector<fs::path> result;
    for (const auto& line : folio::read_lines(script)) {
        if (line.empty()) continue;
        const fs::path candidate(line);
        if (!is_pdf_candidate(candidate)) {
            Logger::log(LogLevel::Warning, "Ignoring script entry: " + line, "scanner");
            continue;
        }
        result.push_back(candidate);
    }
    return result;
}

std::vector<fs::path>
collect_merge_inputs(const Settings& settings) {
    // explicit inputs are taken as given
    std::vector<fs::path> result(settings.inputs.begin(), settings.inputs.end());

    if (!settings.input_dir.empty()) {
        auto found = collect_pdf_files(settings.input_dir, settings.recursive);
        result.insert(result.end(), found.begin(), found.end());
    }

    if (!settings.input_script.empty()) {
        auto listed = read_input_script(settings.input_script);
        result.insert(result.end(), listed.begin(), listed.end());
    }

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}
