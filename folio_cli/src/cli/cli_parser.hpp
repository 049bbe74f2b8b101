//
// Created by Giuseppe Francione on 17/02/26.
//

#ifndef FOLIO_CLI_PARSER_HPP
#define FOLIO_CLI_PARSER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

enum class OutputFormat {
    Text,
    Json
};

struct Settings {
    // --- global ---
    bool quiet = false;
    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::string command; ///< name of the parsed subcommand

    // --- common ---
    std::filesystem::path input;
    std::filesystem::path output;
    std::string password;
    std::string range;
    OutputFormat format = OutputFormat::Text;

    // --- split / convert ---
    std::string names;          ///< convert: naming template
    std::filesystem::path names_file; ///< split: explicit page names
    bool use_bookmarks = false;
    std::string name_template;
    int dpi = 200;
    std::string encoder = ".jpg";

    // --- merge ---
    std::vector<std::filesystem::path> inputs;
    std::filesystem::path input_dir;
    std::filesystem::path input_script;
    bool recursive = false;
    bool strict = false;
    bool delete_originals = false;

    // --- page edits ---
    int degrees = 90;
    std::string pages;     ///< remove: "2,5"
    std::string order;     ///< reorder: "3,1,2"
    std::string positions; ///< insert: "1:2,4:1"
    double width = 612.0;
    double height = 792.0;

    // --- attachments ---
    std::optional<int> index;

    // --- page objects ---
    int page_number = 1;
    int object_index = 0;

    // --- watermark ---
    std::optional<std::string> text;
    std::optional<std::filesystem::path> image;
    std::string font = "Helvetica";
    double font_size = 50;
    int opacity = 50;
    double rotation = 45;
    double scale = 1.0;
    std::string color = "255,0,0";

    [[nodiscard]] bool is_json() const { return format == OutputFormat::Json; }
};

/**
 * @brief Configures the CLI11 parser with all subcommands, options and validators.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // FOLIO_CLI_PARSER_HPP
