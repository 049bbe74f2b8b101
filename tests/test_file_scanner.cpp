//
// Created by Giuseppe Francione on 19/10/26.
//

#include "../folio_cli/src/cli/cli_parser.hpp"
#include "../folio_cli/src/utils/file_scanner.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <random>

namespace fs = std::filesystem;

class FileScannerTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        std::random_device rd;
        dir = fs::temp_directory_path() / ("folio_scanner_" + std::to_string(rd()));
        fs::create_directories(dir / "sub");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path touch(const fs::path& relative) const {
        const fs::path path = dir / relative;
        std::ofstream(path) << "%PDF-1.7";
        return path;
    }
};

TEST_F(FileScannerTest, ExplicitInputsPassThroughEvenWhenMissing) {
    const auto a = touch("a.pdf");
    Settings settings;
    settings.inputs = {a, dir / "missing.pdf", dir / "notes.txt"};
    EXPECT_EQ(collect_merge_inputs(settings), settings.inputs);
}

TEST_F(FileScannerTest, DirectoryScanIsSortedAndFiltered) {
    const auto b = touch("b.PDF");
    const auto a = touch("a.pdf");
    touch("._a.pdf");
    touch("readme.txt");
    const auto nested = touch("sub/c.pdf");

    EXPECT_EQ(collect_pdf_files(dir, false), (std::vector<fs::path>{a, b}));
    EXPECT_EQ(collect_pdf_files(dir, true), (std::vector<fs::path>{a, b, nested}));
}

TEST_F(FileScannerTest, InputsThenDirectoryThenScript) {
    const auto listed = touch("sub/listed.pdf");
    const auto script = dir / "sub" / "list.txt";
    std::ofstream(script) << listed.string() << "\n\n" << (dir / "gone.pdf").string() << "\n";
    const auto scanned = touch("scanned.pdf");

    Settings settings;
    settings.inputs = {dir / "first.pdf"};
    settings.input_dir = dir;
    settings.input_script = script;
    EXPECT_EQ(collect_merge_inputs(settings), (std::vector<fs::path>{dir / "first.pdf", scanned, listed}));
}
