//
// Created by Giuseppe Francione on 17/02/26.
//

#include "cli_parser.hpp"
#include "../../../libfolio/include/errors.hpp"
#include "../../../libfolio/include/file_utils.hpp"
#include "../../../libfolio/include/models.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <cctype>
#include <map>

namespace fs = std::filesystem;

namespace {
// accepts "R,G,B" with every component in 0..255
struct ColorValidator : CLI::Validator {
    ColorValidator() {
        name_ = "COLOR";
        func_ = [](const std::string& str) {
            try {
                (void) folio::parse_color(str);
            } catch (const folio::ValidationError& e) {
                return std::string(e.what());
            }
            return std::string(); // ok
        };
    }
};

// accepts any extension a registered image codec can encode
struct EncoderValidator : CLI::Validator {
    EncoderValidator() {
        name_ = "ENCODER";
        func_ = [](std::string& str) {
            if (!str.empty() && str.front() != '.') str.insert(str.begin(), '.');
            for (auto& c : str) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            static const std::vector<std::string> known = {
                ".jpg", ".jpeg", ".jpe", ".png", ".webp", ".tif", ".tiff", ".gif", ".bmp", ".dib"
            };
            if (std::find(known.begin(), known.end(), str) == known.end()) {
                return "Invalid encoder: '" + str + "'. Must be one of: .jpg, .png, .webp, .tiff, .gif, .bmp.";
            }
            return std::string();
        };
    }
};

void add_input(CLI::App* sub, Settings& settings, const std::string& description = "Input PDF file.") {
    sub->add_option("-i,--input", settings.input, description)
        ->required()
        ->check(CLI::ExistingFile);
}

void add_password(CLI::App* sub, Settings& settings) {
    sub->add_option("-p,--password", settings.password, "Password of the input document.");
}

void add_range(CLI::App* sub, Settings& settings) {
    sub->add_option("-r,--range", settings.range, "Page range, e.g. \"1,3,5-8\" (default: all pages).");
}

void add_format(CLI::App* sub, Settings& settings) {
    sub->add_option("-f,--format", settings.format, "Output format: text (default) or json.")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, OutputFormat>{
                {"text", OutputFormat::Text},
                {"json", OutputFormat::Json}
            }, CLI::ignore_case));
}

void add_output_file(CLI::App* sub, Settings& settings, const bool required = true) {
    auto* opt = sub->add_option("-o,--output", settings.output, "Output PDF file.");
    if (required) opt->required();
}

void add_output_dir(CLI::App* sub, Settings& settings) {
    sub->add_option("-o,--output", settings.output,
                    "Output directory (default: the input's directory, created when missing).");
}
} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.3");
    app.require_subcommand(1);
    // global options may follow the subcommand
    app.fallthrough();

    // --- Global options ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress progress and log output on the console.");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->transform(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- split ---
    auto* split = app.add_subcommand("split", "Split a PDF into one file per page.");
    add_input(split, settings);
    add_output_dir(split, settings);
    add_range(split, settings);
    add_password(split, settings);
    split->add_option("--names", settings.names_file,
                      "Text file with one output name per line; \"N=name\" jumps to page N.")
        ->check(CLI::ExistingFile);
    split->add_flag("--use-bookmarks", settings.use_bookmarks, "Name pages after their bookmarks.");
    split->add_option("--template", settings.name_template,
                      "Name template with {original} and {page}, e.g. \"{original}-{page}\".");

    // --- merge ---
    auto* merge = app.add_subcommand("merge", "Merge PDFs into one document.");
    // missing files are left to the merge itself, which skips them or fails under --strict
    merge->add_option("--inputs", settings.inputs, "PDF files to merge, in order.");
    merge->add_option("--input-dir", settings.input_dir, "Merge every *.pdf inside this directory.")
        ->check(CLI::ExistingDirectory);
    merge->add_flag("--recursive", settings.recursive, "Scan --input-dir recursively.");
    merge->add_option("--input-script", settings.input_script,
                      "Text file listing the PDFs to merge, one per line.")
        ->check(CLI::ExistingFile);
    add_output_file(merge, settings);
    add_password(merge, settings);
    merge->add_flag("--strict", settings.strict, "Fail instead of skipping inputs that cannot be loaded.");
    merge->add_flag("--delete-originals", settings.delete_originals,
                    "Delete the merged inputs after the output was written.");

    // --- convert ---
    auto* convert = app.add_subcommand("convert", "Render PDF pages to images.");
    add_input(convert, settings);
    add_output_dir(convert, settings);
    add_range(convert, settings);
    add_password(convert, settings);
    convert->add_option("--dpi", settings.dpi, "Output resolution.")
        ->default_val(200)
        ->check(CLI::Range(folio::kMinDpi, folio::kMaxDpi));
    convert->add_option("--encoder", settings.encoder, "Image format: .jpg, .png, .webp, .tiff, .gif, .bmp.")
        ->default_val(".jpg")
        ->transform(EncoderValidator());
    convert->add_option("--names", settings.names,
                        "Name template with {original} and {page}; its extension selects the encoder.");

    // --- imagetopdf ---
    auto* imagetopdf = app.add_subcommand("imagetopdf", "Convert an image to a one-page PDF.");
    add_input(imagetopdf, settings, "Input image file.");
    add_output_file(imagetopdf, settings, false);

    // --- text ---
    auto* text = app.add_subcommand("text", "Extract page text.");
    add_input(text, settings);
    add_range(text, settings);
    add_password(text, settings);
    add_format(text, settings);

    // --- bookmarks ---
    auto* bookmarks = app.add_subcommand("bookmarks", "List bookmarks (outlines).");
    add_input(bookmarks, settings);
    add_password(bookmarks, settings);
    add_format(bookmarks, settings);

    // --- info ---
    auto* info = app.add_subcommand("info", "Show document information.");
    add_input(info, settings);
    add_password(info, settings);
    add_format(info, settings);

    // --- rotate ---
    auto* rotate = app.add_subcommand("rotate", "Rotate pages.");
    add_input(rotate, settings);
    add_output_file(rotate, settings);
    add_range(rotate, settings);
    add_password(rotate, settings);
    rotate->add_option("--degrees", settings.degrees, "Rotation: 90, 180 or 270.")
        ->default_val(90)
        ->check(CLI::IsMember({90, 180, 270}));

    // --- remove ---
    auto* remove = app.add_subcommand("remove", "Remove pages.");
    add_input(remove, settings);
    add_output_file(remove, settings);
    add_password(remove, settings);
    remove->add_option("--pages", settings.pages, "Pages to remove, e.g. \"2,5\".")->required();

    // --- insert ---
    auto* insert = app.add_subcommand("insert", "Insert blank pages.");
    add_input(insert, settings);
    add_output_file(insert, settings);
    add_password(insert, settings);
    insert->add_option("--positions", settings.positions,
                       "Positions and counts, e.g. \"1:2,4:1\" inserts 2 pages before page 1.")
        ->required();
    insert->add_option("--width", settings.width, "Blank page width in points.")
        ->default_val(612.0)
        ->check(CLI::PositiveNumber);
    insert->add_option("--height", settings.height, "Blank page height in points.")
        ->default_val(792.0)
        ->check(CLI::PositiveNumber);

    // --- reorder ---
    auto* reorder = app.add_subcommand("reorder", "Reorder pages.");
    add_input(reorder, settings);
    add_output_file(reorder, settings);
    add_password(reorder, settings);
    reorder->add_option("--order", settings.order, "New page order, e.g. \"3,1,2\".")->required();

    // --- unlock ---
    auto* unlock = app.add_subcommand("unlock", "Remove the encryption of a document.");
    add_input(unlock, settings);
    add_output_file(unlock, settings);
    unlock->add_option("-p,--password", settings.password, "Password of the input document.")->required();

    // --- attachments ---
    auto* list_attachments = app.add_subcommand("list-attachments", "List embedded files.");
    add_input(list_attachments, settings);
    add_password(list_attachments, settings);
    add_format(list_attachments, settings);

    auto* extract_attachments = app.add_subcommand("extract-attachments", "Extract embedded files.");
    add_input(extract_attachments, settings);
    add_output_dir(extract_attachments, settings);
    add_password(extract_attachments, settings);
    extract_attachments->add_option("--index", settings.index,
                                    "0-based index of the attachment to extract (default: all).")
        ->check(CLI::NonNegativeNumber);

    // --- objects / forms ---
    auto* list_objects = app.add_subcommand("list-objects", "List page objects.");
    add_input(list_objects, settings);
    add_range(list_objects, settings);
    add_password(list_objects, settings);
    add_format(list_objects, settings);

    auto* remove_object = app.add_subcommand("remove-object", "Delete one page object.");
    add_input(remove_object, settings);
    add_output_file(remove_object, settings);
    add_password(remove_object, settings);
    remove_object->add_option("--page", settings.page_number, "1-based page holding the object.")
        ->required()
        ->check(CLI::PositiveNumber);
    remove_object->add_option("--object", settings.object_index,
                              "0-based object index, as printed by list-objects.")
        ->required()
        ->check(CLI::NonNegativeNumber);

    auto* list_forms = app.add_subcommand("list-forms", "List form fields.");
    add_input(list_forms, settings);
    add_range(list_forms, settings);
    add_password(list_forms, settings);
    add_format(list_forms, settings);

    // --- watermark ---
    auto* watermark = app.add_subcommand("watermark", "Stamp a text or image watermark.");
    add_input(watermark, settings);
    add_output_file(watermark, settings);
    add_range(watermark, settings);
    add_password(watermark, settings);
    auto* text_opt = watermark->add_option("--text", settings.text, "Watermark text.");
    auto* image_opt = watermark->add_option("--image", settings.image, "Watermark image file.")
        ->check(CLI::ExistingFile);
    text_opt->excludes(image_opt);
    watermark->add_option("--font", settings.font, "Standard font name.")->default_val("Helvetica");
    watermark->add_option("--font-size", settings.font_size, "Font size in points.")
        ->default_val(50)
        ->check(CLI::PositiveNumber);
    watermark->add_option("--opacity", settings.opacity, "Opacity 0-255.")
        ->default_val(50)
        ->check(CLI::Range(0, 255));
    watermark->add_option("--rotation", settings.rotation, "Rotation in degrees.")->default_val(45);
    watermark->add_option("--scale", settings.scale, "Image scale factor.")
        ->default_val(1.0)
        ->check(CLI::PositiveNumber);
    watermark->add_option("--color", settings.color, "Text color as R,G,B.")
        ->default_val("255,0,0")
        ->check(ColorValidator());

    // --- Cross-validation logic ---
    app.callback([&app, &settings]() {
        settings.command = app.get_subcommands().front()->get_name();

        if (settings.command == "merge") {
            if (settings.inputs.empty() && settings.input_dir.empty() && settings.input_script.empty()) {
                throw CLI::ValidationError("merge requires --inputs, --input-dir or --input-script.");
            }
            if (folio::lowercase_extension(settings.output) != ".pdf") {
                throw CLI::ValidationError("Output file ('-o') must end in .pdf.");
            }
            if (fs::exists(settings.output)) {
                throw CLI::ValidationError("Output file '" + settings.output.string() +
                                           "' already exists, specify another location.");
            }
            if (settings.recursive && settings.input_dir.empty()) {
                throw CLI::ValidationError("--recursive requires --input-dir.");
            }
        }

        if (settings.command == "watermark" && !settings.text && !settings.image) {
            throw CLI::ValidationError("Either --text or --image must be specified for watermarking.");
        }

        if (settings.command == "watermark" && settings.text && settings.text->empty()) {
            throw CLI::ValidationError("--text must not be empty.");
        }
    });
}
