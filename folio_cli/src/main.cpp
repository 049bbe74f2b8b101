//
// Created by Giuseppe Francione on 17/02/26.
//

#include <clocale>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include <CLI/CLI.hpp>
#include "report/output_formatter.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/file_scanner.hpp"
#include "../../libfolio/include/errors.hpp"
#include "../../libfolio/include/file_utils.hpp"
#include "../../libfolio/include/folio.hpp"
#include "../../libfolio/include/logger.hpp"
#include "../../libfolio/include/naming_strategy.hpp"

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

using namespace folio;
namespace fs = std::filesystem;

namespace {

// prints "current/total<TAB>context" lines while an operation runs
class ConsoleObserver final : public FolioObserver {
public:
    void on_progress(const std::string& operation, const int current, const int total,
                     const std::string& context) override {
        std::cerr << current << "/" << total << "\t" << (context.empty() ? operation : context) << std::endl;
    }
};

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

void setup_logging(const Settings& settings) {
    Logger::clear_sinks();

    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file, true);
        const bool opened = file_sink->is_open();
        Logger::add_sink(std::move(file_sink));
        if (!opened) {
            std::cerr << YELLOW << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
        }
    }

    if (!settings.quiet && settings.log_level != "NONE") {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = Logger::string_to_level(settings.log_level);
        console_sink->use_colors = isatty(fileno(stderr)) != 0;
        Logger::add_sink(std::move(console_sink));
    }
}

SourceDocument source_of(const Settings& settings) {
    return SourceDocument{settings.input, settings.password};
}

void status(const Settings& settings, const std::string& message) {
    if (!settings.quiet) {
        std::cout << message << std::endl;
    }
}

using Handler = std::function<void(Folio&, const Settings&)>;

std::map<std::string, Handler> make_handlers() {
    std::map<std::string, Handler> handlers;

    handlers["split"] = [](Folio& folio, const Settings& s) {
        SplitRequest request;
        request.source = source_of(s);
        request.output_dir = s.output;
        request.range = PageRange::parse(s.range);
        request.use_bookmarks = s.use_bookmarks;
        request.name_template = s.name_template;
        if (!s.names_file.empty()) {
            request.name_overrides = parse_names_script(read_lines(s.names_file));
        }
        const auto written = folio.split(request);
        if (!s.quiet) print_written_files(std::cout, written);
    };

    handlers["merge"] = [](Folio& folio, const Settings& s) {
        MergeRequest request;
        request.inputs = collect_merge_inputs(s);
        request.output = s.output;
        request.password = s.password;
        request.strict = s.strict;
        request.delete_originals = s.delete_originals;
        const auto summary = folio.merge(request);
        if (!s.quiet) print_merge_summary(std::cout, summary, s.output);
    };

    handlers["convert"] = [](Folio& folio, const Settings& s) {
        ConvertOptions options;
        options.dpi = s.dpi;
        options.encoder = s.encoder;
        options.output_dir = s.output;
        options.name_template = s.names;
        options.range = PageRange::parse(s.range);
        const auto written = folio.convert(source_of(s), options);
        if (!s.quiet) print_written_files(std::cout, written);
    };

    handlers["imagetopdf"] = [](Folio& folio, const Settings& s) {
        const auto written = folio.image_to_pdf(ImageToPdfRequest{s.input, s.output});
        status(s, "Wrote " + written.string());
    };

    handlers["text"] = [](Folio& folio, const Settings& s) {
        print_text(std::cout, folio.text(source_of(s), PageRange::parse(s.range)), s.format);
    };

    handlers["bookmarks"] = [](Folio& folio, const Settings& s) {
        print_bookmarks(std::cout, folio.bookmarks(source_of(s)), s.format);
    };

    handlers["info"] = [](Folio& folio, const Settings& s) {
        print_info(std::cout, folio.info(source_of(s)), s.format);
    };

    handlers["rotate"] = [](Folio& folio, const Settings& s) {
        folio.rotate(RotateRequest{source_of(s), s.output, s.degrees, PageRange::parse(s.range)});
        status(s, "Rotated pages: " + s.input.filename().string() + " -> " + s.output.string());
    };

    handlers["remove"] = [](Folio& folio, const Settings& s) {
        folio.remove(RemoveRequest{source_of(s), s.output, parse_page_numbers(s.pages)});
        status(s, "Removed pages: " + s.input.filename().string() + " -> " + s.output.string());
    };

    handlers["insert"] = [](Folio& folio, const Settings& s) {
        folio.insert(InsertRequest{source_of(s), s.output, parse_insert_spec(s.positions), s.width, s.height});
        status(s, "Inserted blank pages: " + s.input.filename().string() + " -> " + s.output.string());
    };

    handlers["reorder"] = [](Folio& folio, const Settings& s) {
        folio.reorder(ReorderRequest{source_of(s), s.output, parse_page_numbers(s.order)});
        status(s, "Reordered pages: " + s.input.filename().string() + " -> " + s.output.string());
    };

    handlers["unlock"] = [](Folio& folio, const Settings& s) {
        folio.unlock(UnlockRequest{source_of(s), s.output});
        status(s, "Unlocked: " + s.input.filename().string() + " -> " + s.output.string());
    };

    handlers["list-attachments"] = [](Folio& folio, const Settings& s) {
        print_attachments(std::cout, folio.attachments(source_of(s)), s.format);
    };

    handlers["extract-attachments"] = [](Folio& folio, const Settings& s) {
        const auto written = folio.extract_attachments(source_of(s), s.output, s.index);
        if (!s.quiet) print_written_files(std::cout, written);
    };

    handlers["list-objects"] = [](Folio& folio, const Settings& s) {
        print_page_objects(std::cout, folio.page_objects(source_of(s), PageRange::parse(s.range)), s.format);
    };

    handlers["remove-object"] = [](Folio& folio, const Settings& s) {
        folio.remove_object(source_of(s), s.output, s.page_number, s.object_index);
        status(s, "Removed object " + std::to_string(s.object_index) + " of page " + std::to_string(s.page_number) +
                  ": " + s.input.filename().string() + " -> " + s.output.string());
    };

    handlers["list-forms"] = [](Folio& folio, const Settings& s) {
        print_form_fields(std::cout, folio.form_fields(source_of(s), PageRange::parse(s.range)), s.format);
    };

    handlers["watermark"] = [](Folio& folio, const Settings& s) {
        WatermarkOptions options;
        options.text = s.text;
        options.image = s.image;
        options.font = s.font;
        options.font_size = s.font_size;
        options.opacity = static_cast<std::uint8_t>(s.opacity);
        options.rotation = s.rotation;
        options.scale = s.scale;
        options.color = parse_color(s.color);
        folio.watermark(source_of(s), s.output, options, PageRange::parse(s.range));
        status(s, "Watermark added: " + s.input.filename().string() + " -> " + s.output.string());
    };

    return handlers;
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"folio: split, merge, convert and inspect PDF documents."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    setup_logging(settings);
    init_utf8_locale();

    const auto handlers = make_handlers();
    const auto it = handlers.find(settings.command);
    if (it == handlers.end()) {
        Logger::log(LogLevel::Error, "Unknown command: " + settings.command, "main");
        return 1;
    }

    ConsoleObserver observer;
    try {
        Folio folio;
        if (!settings.quiet) {
            folio.set_observer(&observer);
        }
        it->second(folio, settings);
    } catch (const std::exception& e) {
        std::cerr << RED << "Error: " << describe_error(e) << RESET << std::endl;
        return 1;
    }
    return 0;
}
