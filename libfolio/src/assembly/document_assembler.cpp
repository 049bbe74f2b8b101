//
// Created by Giuseppe Francione on 09/02/26.
//

#include "../../include/document_assembler.hpp"
#include "../../include/bookmark_index.hpp"
#include "../../include/engine_lock.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/filename_sanitizer.hpp"
#include "../../include/logger.hpp"
#include "../../include/naming_strategy.hpp"
#include <algorithm>
#include <exception>
#include <functional>
#include <mutex>
#include <set>
#include <system_error>

namespace folio {

namespace {

constexpr auto kTag = "document_assembler";

std::filesystem::path with_pdf_extension(const std::string& name) {
    if (lowercase_extension(name) == ".pdf") {
        return name;
    }
    return name + ".pdf";
}

} // namespace

void FileArtifactSink::write(const std::filesystem::path& path, const std::vector<unsigned char>& bytes) {
    write_file(path, bytes);
    Logger::log(LogLevel::Debug, "Wrote " + std::to_string(bytes.size()) + " bytes to " + path.string(), kTag);
}

std::unique_ptr<IPdfDocument> DocumentAssembler::load(const SourceDocument& source,
                                                      const std::string_view operation) {
    try {
        return engine_.load_document(source.path, source.password);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error,
            std::string(operation) + ": cannot load " + source.path.string() + " (" + e.what() + ")", kTag);
        std::throw_with_nested(OperationError(std::string(operation) + ": cannot load " + source.path.string()));
    }
}

void DocumentAssembler::save(IPdfDocument& doc, const std::filesystem::path& output,
                             const SaveOptions& options, const std::string_view operation) {
    try {
        sink_.write(output, doc.serialize(options));
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error,
            std::string(operation) + ": cannot write " + output.string() + " (" + e.what() + ")", kTag);
        std::throw_with_nested(OperationError(std::string(operation) + ": cannot write " + output.string()));
    }
}

std::vector<std::filesystem::path> DocumentAssembler::split(const SplitRequest& request) {
    require_source(request.source, "split");
    if (request.range.empty()) {
        throw ValidationError("split: page range selects no pages");
    }

    std::lock_guard lock(engine_mutex());
    const auto source = load(request.source, "split");
    const int page_count = source->page_count();

    const std::vector<int> pages = request.range.select(page_count);
    if (pages.empty()) {
        throw ValidationError("split: page range " + request.range.to_string() +
                              " selects no pages of a " + std::to_string(page_count) + "-page document");
    }

    NamingRules rules;
    rules.original_stem = sanitize_filename(request.source.path.stem().string());
    rules.overrides = request.name_overrides;
    rules.name_template = request.name_template;
    if (request.use_bookmarks) {
        rules.bookmark_titles = page_title_map(build_bookmark_index(*source));
        Logger::log(LogLevel::Debug,
            "split: " + std::to_string(rules.bookmark_titles.size()) + " pages carry bookmark names", kTag);
    }
    NamingPlan plan(std::move(rules));

    const std::filesystem::path output_dir = request.output_dir.empty()
        ? request.source.path.parent_path()
        : request.output_dir;

    std::vector<std::filesystem::path> written;
    written.reserve(pages.size());
    for (const int page : pages) {
        const std::filesystem::path target = output_dir / with_pdf_extension(plan.assign(page));
        try {
            const auto dest = engine_.create_document();
            dest->import_pages(*source, {page - 1}, 0);
            sink_.write(target, dest->serialize(SaveOptions{}));
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error,
                "split: page " + std::to_string(page) + " -> " + target.string() + " failed: " + e.what(), kTag);
            std::throw_with_nested(OperationError(
                "split: page " + std::to_string(page) + " (" + target.filename().string() + ") failed"));
        }
        written.push_back(target);
        report_progress(progress_, page, page_count, target.string());
    }
    report_progress(progress_, page_count, page_count);

    Logger::log(LogLevel::Info,
        "split: wrote " + std::to_string(written.size()) + " files to " + output_dir.string(), kTag);
    return written;
}

MergeSummary DocumentAssembler::merge(const MergeRequest& request) {
    require_output(request.output, "merge");
    if (lowercase_extension(request.output) != ".pdf") {
        throw ValidationError("merge: output filename must end in .pdf: " + request.output.string());
    }
    if (request.inputs.empty()) {
        throw ValidationError("merge: no input files");
    }

    std::lock_guard lock(engine_mutex());
    const auto dest = engine_.create_document();
    // imported pages may reference their source until serialization
    std::vector<std::unique_ptr<IPdfDocument>> sources;
    std::vector<std::filesystem::path> merged;
    MergeSummary summary;

    const int total = static_cast<int>(request.inputs.size());
    for (int i = 0; i < total; ++i) {
        const auto& input = request.inputs[static_cast<size_t>(i)];
        std::unique_ptr<IPdfDocument> src;
        try {
            src = engine_.load_document(input, request.password);
        } catch (const EngineError& e) {
            if (request.strict) {
                Logger::log(LogLevel::Error, "merge: cannot load " + input.string() + " (" + e.what() + ")", kTag);
                std::throw_with_nested(OperationError("merge: cannot load " + input.string()));
            }
            Logger::log(LogLevel::Warning, "merge: skipping " + input.string() + " (" + e.what() + ")", kTag);
            summary.skipped.push_back(input);
            report_progress(progress_, i + 1, total, input.string());
            continue;
        }

        try {
            const int count = src->page_count();
            std::vector<int> indices(static_cast<size_t>(count));
            for (int p = 0; p < count; ++p) indices[static_cast<size_t>(p)] = p;
            dest->import_pages(*src, indices, dest->page_count());
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "merge: import of " + input.string() + " failed: " + e.what(), kTag);
            std::throw_with_nested(OperationError("merge: cannot import pages of " + input.string()));
        }

        sources.push_back(std::move(src));
        merged.push_back(input);
        report_progress(progress_, i + 1, total, input.string());
    }

    if (merged.empty()) {
        Logger::log(LogLevel::Warning, "merge: no input could be loaded, writing an empty document", kTag);
    }
    save(*dest, request.output, SaveOptions{}, "merge");

    summary.merged_files = static_cast<int>(merged.size());
    summary.page_count = dest->page_count();

    if (request.delete_originals) {
        for (const auto& input : merged) {
            std::error_code ec;
            std::filesystem::remove(input, ec);
            if (ec) {
                Logger::log(LogLevel::Warning, "merge: cannot delete " + input.string() + " (" + ec.message() + ")", kTag);
            }
        }
    }

    Logger::log(LogLevel::Info,
        "merge: " + std::to_string(summary.merged_files) + " files, " + std::to_string(summary.page_count) +
        " pages -> " + request.output.string(), kTag);
    return summary;
}

void DocumentAssembler::reorder(const ReorderRequest& request) {
    require_source(request.source, "reorder");
    require_output(request.output, "reorder");
    if (request.order.empty()) {
        throw ValidationError("reorder: page order is empty");
    }

    std::lock_guard lock(engine_mutex());
    const auto source = load(request.source, "reorder");
    const int page_count = source->page_count();

    if (static_cast<int>(request.order.size()) != page_count) {
        throw ValidationError("reorder: order lists " + std::to_string(request.order.size()) +
                              " pages but the document has " + std::to_string(page_count));
    }
    std::set<int> seen;
    for (const int page : request.order) {
        if (page < 1 || page > page_count) {
            throw ValidationError("reorder: page " + std::to_string(page) + " is out of range 1-" +
                                  std::to_string(page_count));
        }
        if (!seen.insert(page).second) {
            throw ValidationError("reorder: page " + std::to_string(page) + " appears more than once");
        }
    }

    const auto dest = engine_.create_document();
    for (int slot = 0; slot < page_count; ++slot) {
        const int page = request.order[static_cast<size_t>(slot)];
        try {
            dest->import_pages(*source, {page - 1}, slot);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "reorder: page " + std::to_string(page) + " failed: " + e.what(), kTag);
            std::throw_with_nested(OperationError("reorder: cannot import page " + std::to_string(page)));
        }
        report_progress(progress_, slot + 1, page_count);
    }
    save(*dest, request.output, SaveOptions{}, "reorder");

    Logger::log(LogLevel::Info, "reorder: wrote " + request.output.string(), kTag);
}

void DocumentAssembler::remove(const RemoveRequest& request) {
    require_source(request.source, "remove");
    require_output(request.output, "remove");
    if (request.pages.empty()) {
        throw ValidationError("remove: no pages to remove");
    }

    std::lock_guard lock(engine_mutex());
    const auto doc = load(request.source, "remove");
    const int page_count = doc->page_count();

    std::set<int, std::greater<>> targets;
    for (const int page : request.pages) {
        if (page >= 1 && page <= page_count) {
            targets.insert(page);
        } else {
            Logger::log(LogLevel::Warning, "remove: ignoring page " + std::to_string(page) +
                        " outside 1-" + std::to_string(page_count), kTag);
        }
    }

    // highest first, so pending indices stay valid
    int done = 0;
    for (const int page : targets) {
        try {
            doc->delete_page(page - 1);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "remove: page " + std::to_string(page) + " failed: " + e.what(), kTag);
            std::throw_with_nested(OperationError("remove: cannot delete page " + std::to_string(page)));
        }
        report_progress(progress_, ++done, static_cast<int>(targets.size()));
    }
    save(*doc, request.output, SaveOptions{}, "remove");

    Logger::log(LogLevel::Info, "remove: deleted " + std::to_string(targets.size()) + " pages -> " +
                request.output.string(), kTag);
}

void DocumentAssembler::insert(const InsertRequest& request) {
    require_source(request.source, "insert");
    require_output(request.output, "insert");
    if (request.positions.empty()) {
        throw ValidationError("insert: no insert positions");
    }
    if (!(request.width > 0.0) || !(request.height > 0.0)) {
        throw ValidationError("insert: page size must be positive");
    }

    std::lock_guard lock(engine_mutex());
    const auto doc = load(request.source, "insert");
    const int page_count = doc->page_count();

    std::map<int, int, std::greater<>> plan;
    for (const auto& [position, count] : request.positions) {
        if (position < 1 || position > page_count + 1 || count < 1) {
            Logger::log(LogLevel::Warning, "insert: ignoring " + std::to_string(position) + ":" +
                        std::to_string(count) + " for a " + std::to_string(page_count) + "-page document", kTag);
            continue;
        }
        plan.emplace(position, count);
    }

    // highest first, so lower positions keep their meaning
    int done = 0;
    for (const auto& [position, count] : plan) {
        try {
            for (int k = 0; k < count; ++k) {
                doc->insert_blank_page(position - 1, request.width, request.height);
            }
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "insert: position " + std::to_string(position) + " failed: " + e.what(), kTag);
            std::throw_with_nested(OperationError("insert: cannot insert at position " + std::to_string(position)));
        }
        report_progress(progress_, ++done, static_cast<int>(plan.size()));
    }
    save(*doc, request.output, SaveOptions{}, "insert");

    Logger::log(LogLevel::Info, "insert: " + std::to_string(page_count) + " -> " +
                std::to_string(doc->page_count()) + " pages -> " + request.output.string(), kTag);
}

void DocumentAssembler::rotate(const RotateRequest& request) {
    require_source(request.source, "rotate");
    require_output(request.output, "rotate");
    if (request.degrees != 90 && request.degrees != 180 && request.degrees != 270) {
        throw ValidationError("rotate: rotation must be 90, 180 or 270, got " + std::to_string(request.degrees));
    }
    if (request.range.empty()) {
        throw ValidationError("rotate: page range selects no pages");
    }

    std::lock_guard lock(engine_mutex());
    const auto doc = load(request.source, "rotate");
    const int page_count = doc->page_count();

    const std::vector<int> pages = request.range.select(page_count);
    int done = 0;
    for (const int page : pages) {
        try {
            doc->set_rotation(page - 1, request.degrees);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "rotate: page " + std::to_string(page) + " failed: " + e.what(), kTag);
            std::throw_with_nested(OperationError("rotate: cannot rotate page " + std::to_string(page)));
        }
        report_progress(progress_, ++done, static_cast<int>(pages.size()));
    }
    save(*doc, request.output, SaveOptions{}, "rotate");

    Logger::log(LogLevel::Info, "rotate: " + std::to_string(pages.size()) + " pages by " +
                std::to_string(request.degrees) + " -> " + request.output.string(), kTag);
}

void DocumentAssembler::unlock(const UnlockRequest& request) {
    require_source(request.source, "unlock");
    require_output(request.output, "unlock");
    if (request.source.password.empty()) {
        throw ValidationError("unlock: a password is required");
    }

    std::lock_guard lock(engine_mutex());
    const auto doc = load(request.source, "unlock");
    SaveOptions options;
    options.remove_security = true;
    save(*doc, request.output, options, "unlock");
    report_progress(progress_, 1, 1, request.output.string());

    Logger::log(LogLevel::Info, "unlock: wrote " + request.output.string(), kTag);
}

} // namespace folio
