//
// Created by Giuseppe Francione on 18/02/26.
//

#include "../libfolio/include/document_assembler.hpp"
#include "../libfolio/include/errors.hpp"
#include "fake_engine.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <random>
#include <stdexcept>

using namespace folio;
using namespace folio::fakes;
namespace fs = std::filesystem;

class DocumentAssemblerTest : public ::testing::Test {
protected:
    fs::path dir;
    FakeStore store;
    FakeEngine engine{store};
    RecordingReporter progress;
    DocumentAssembler assembler{engine, store, &progress};

    void SetUp() override {
        std::random_device rd;
        dir = fs::temp_directory_path() / ("folio_assembler_" + std::to_string(rd()));
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    // registers a document with the engine and touches it on disk
    fs::path add(const std::string& name, const std::vector<std::string>& labels) {
        const fs::path path = dir / name;
        std::ofstream(path) << "%PDF-fake";
        std::vector<FakePage> pages;
        for (const auto& l : labels) pages.push_back(FakePage{l});
        store.files[path] = pages;
        return path;
    }

    [[nodiscard]] std::vector<std::string> labels(const fs::path& path) const {
        return labels_of(store.files.at(path));
    }
};

// --- reorder ---

TEST_F(DocumentAssemblerTest, ReorderMovesPageThreeFirst) {
    const auto in = add("report.pdf", {"p1", "p2", "p3", "p4", "p5"});
    const auto out = dir / "out.pdf";
    assembler.reorder({{in, ""}, out, {3, 1, 2, 4, 5}});
    EXPECT_EQ(labels(out), (std::vector<std::string>{"p3", "p1", "p2", "p4", "p5"}));
    ASSERT_FALSE(progress.entries.empty());
    EXPECT_EQ(progress.entries.back().current, 5);
    EXPECT_EQ(progress.entries.back().total, 5);
}

TEST_F(DocumentAssemblerTest, ReorderRoundTripWithInverse) {
    const auto in = add("doc.pdf", {"a", "b", "c", "d"});
    const std::vector<int> p = {2, 4, 1, 3};
    std::vector<int> inverse(p.size());
    for (size_t i = 0; i < p.size(); ++i) inverse[static_cast<size_t>(p[i] - 1)] = static_cast<int>(i) + 1;

    const auto mid = dir / "mid.pdf";
    const auto back = dir / "back.pdf";
    assembler.reorder({{in, ""}, mid, p});
    std::ofstream(mid) << "%PDF-fake";
    assembler.reorder({{mid, ""}, back, inverse});
    EXPECT_EQ(labels(back), labels(in));
}

TEST_F(DocumentAssemblerTest, ReorderRejectsNonPermutationWithoutOutput) {
    const auto in = add("doc.pdf", {"a", "b", "c"});
    const auto out = dir / "out.pdf";
    EXPECT_THROW(assembler.reorder({{in, ""}, out, {1, 2}}), ValidationError);
    EXPECT_THROW(assembler.reorder({{in, ""}, out, {1, 2, 2}}), ValidationError);
    EXPECT_THROW(assembler.reorder({{in, ""}, out, {0, 1, 2}}), ValidationError);
    EXPECT_THROW(assembler.reorder({{in, ""}, out, {1, 2, 4}}), ValidationError);
    EXPECT_THROW(assembler.reorder({{in, ""}, out, {}}), ValidationError);
    EXPECT_TRUE(store.written.empty());
}

// --- remove ---

TEST_F(DocumentAssemblerTest, RemoveSecondOfThree) {
    const auto in = add("doc.pdf", {"1", "2", "3"});
    const auto out = dir / "out.pdf";
    assembler.remove({{in, ""}, out, {2}});
    EXPECT_EQ(labels(out), (std::vector<std::string>{"1", "3"}));
}

TEST_F(DocumentAssemblerTest, RemoveHighestFirstKeepsIndicesStable) {
    const auto in = add("doc.pdf", {"1", "2", "3", "4", "5"});
    const auto out = dir / "out.pdf";
    assembler.remove({{in, ""}, out, {1, 3, 5, 3}});
    EXPECT_EQ(labels(out), (std::vector<std::string>{"2", "4"}));
}

TEST_F(DocumentAssemblerTest, RemoveOutOfRangeLeavesDocumentUnchanged) {
    const auto in = add("doc.pdf", {"1", "2", "3"});
    const auto out = dir / "out.pdf";
    assembler.remove({{in, ""}, out, {4, 5}});
    EXPECT_EQ(labels(out), labels(in));
}

TEST_F(DocumentAssemblerTest, RemoveWithoutPagesIsRejected) {
    const auto in = add("doc.pdf", {"1"});
    EXPECT_THROW(assembler.remove({{in, ""}, dir / "out.pdf", {}}), ValidationError);
}

// --- insert ---

TEST_F(DocumentAssemblerTest, InsertTwoBlankPagesAtFront) {
    const auto in = add("doc.pdf", {"1", "2", "3"});
    const auto out = dir / "out.pdf";
    assembler.insert({{in, ""}, out, {{1, 2}}});
    EXPECT_EQ(labels(out), (std::vector<std::string>{"blank", "blank", "1", "2", "3"}));
}

TEST_F(DocumentAssemblerTest, InsertHighestPositionFirst) {
    const auto in = add("doc.pdf", {"1", "2", "3"});
    const auto out = dir / "out.pdf";
    assembler.insert({{in, ""}, out, {{1, 1}, {3, 1}, {4, 1}}});
    EXPECT_EQ(labels(out), (std::vector<std::string>{"blank", "1", "2", "blank", "3", "blank"}));
}

TEST_F(DocumentAssemblerTest, InsertUsesRequestedPageSize) {
    const auto in = add("doc.pdf", {"1"});
    const auto out = dir / "out.pdf";
    assembler.insert({{in, ""}, out, {{2, 1}}, 300.0, 400.0});
    const auto& pages = store.files.at(out);
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_DOUBLE_EQ(pages[1].width, 300.0);
    EXPECT_DOUBLE_EQ(pages[1].height, 400.0);
}

TEST_F(DocumentAssemblerTest, InsertDropsOutOfRangePositions) {
    const auto in = add("doc.pdf", {"1", "2"});
    const auto out = dir / "out.pdf";
    assembler.insert({{in, ""}, out, {{9, 1}, {2, 1}}});
    EXPECT_EQ(labels(out), (std::vector<std::string>{"1", "blank", "2"}));
}

TEST_F(DocumentAssemblerTest, InsertThenRemoveRestoresPageCount) {
    const auto in = add("doc.pdf", {"1", "2", "3"});
    const auto mid = dir / "mid.pdf";
    const auto back = dir / "back.pdf";
    assembler.insert({{in, ""}, mid, {{2, 1}}});
    std::ofstream(mid) << "%PDF-fake";
    assembler.remove({{mid, ""}, back, {2}});
    EXPECT_EQ(labels(back), labels(in));
}

TEST_F(DocumentAssemblerTest, InsertRejectsBadPageSize) {
    const auto in = add("doc.pdf", {"1"});
    EXPECT_THROW(assembler.insert({{in, ""}, dir / "o.pdf", {{1, 1}}, 0.0, 792.0}), ValidationError);
}

// --- split ---

TEST_F(DocumentAssemblerTest, SplitWritesOneFilePerPageWithDefaultNames) {
    const auto in = add("report.pdf", {"a", "b", "c"});
    const auto out_dir = dir / "pages";
    const auto written = assembler.split({{in, ""}, out_dir});
    ASSERT_EQ(written.size(), 3u);
    EXPECT_EQ(written[0], out_dir / "report-001.pdf");
    EXPECT_EQ(written[2], out_dir / "report-003.pdf");
    EXPECT_EQ(labels(written[1]), (std::vector<std::string>{"b"}));
}

TEST_F(DocumentAssemblerTest, SplitDefaultsToInputDirectory) {
    const auto in = add("report.pdf", {"a"});
    const auto written = assembler.split({{in, ""}});
    ASSERT_EQ(written.size(), 1u);
    EXPECT_EQ(written[0], dir / "report-001.pdf");
}

TEST_F(DocumentAssemblerTest, SplitHonorsRangeAndOverrides) {
    const auto in = add("report.pdf", {"a", "b", "c", "d"});
    SplitRequest request{{in, ""}, dir};
    request.range = PageRange::parse("2,4");
    request.name_overrides = {{4, "appendix.pdf"}};
    request.name_template = "{original}_{page}";
    const auto written = assembler.split(request);
    ASSERT_EQ(written.size(), 2u);
    EXPECT_EQ(written[0], dir / "report_002.pdf");
    EXPECT_EQ(written[1], dir / "appendix.pdf");
}

TEST_F(DocumentAssemblerTest, SplitNamesPagesAfterBookmarks) {
    const auto in = add("book.pdf", {"a", "b", "c"});
    std::vector<FakeOutlineItem> outline(2);
    outline[0].title = "Intro";
    outline[0].next = 1;
    outline[0].action = OutlineAction{ActionKind::Goto, 0};
    outline[1].title = "Body: Part 1";
    outline[1].dest = 2;
    store.outlines[in] = outline;

    SplitRequest request{{in, ""}, dir / "out"};
    request.use_bookmarks = true;
    const auto written = assembler.split(request);
    ASSERT_EQ(written.size(), 3u);
    EXPECT_EQ(written[0].filename(), "Intro.pdf");
    EXPECT_EQ(written[1].filename(), "book-002.pdf");
    EXPECT_EQ(written[2].filename(), "Body Part 1.pdf");
}

TEST_F(DocumentAssemblerTest, SplitReportsPageProgress) {
    const auto in = add("doc.pdf", {"a", "b"});
    assembler.split({{in, ""}, dir / "out"});
    ASSERT_GE(progress.entries.size(), 2u);
    EXPECT_EQ(progress.entries[0].current, 1);
    EXPECT_EQ(progress.entries[0].total, 2);
    EXPECT_EQ(progress.entries[0].context, (dir / "out" / "doc-001.pdf").string());
}

TEST_F(DocumentAssemblerTest, SplitRejectsRangeOutsideDocument) {
    const auto in = add("doc.pdf", {"a", "b"});
    SplitRequest request{{in, ""}, dir};
    request.range = PageRange::parse("7-9");
    EXPECT_THROW(assembler.split(request), ValidationError);
    request.range = PageRange::parse("junk");
    EXPECT_THROW(assembler.split(request), ValidationError);
    EXPECT_TRUE(store.written.empty());
}

TEST_F(DocumentAssemblerTest, SplitStripsDisallowedCharactersFromStem) {
    const auto in = add("q3:report#v2.pdf", {"a"});
    const auto written = assembler.split({{in, ""}, dir / "out"});
    ASSERT_EQ(written.size(), 1u);
    EXPECT_EQ(written[0].filename(), "q3reportv2-001.pdf");

    SplitRequest request{{in, ""}, dir / "tpl"};
    request.name_template = "{original}_{page}";
    EXPECT_EQ(assembler.split(request)[0].filename(), "q3reportv2_001.pdf");
}

namespace {

// forwards to the store until the nth write, which fails
class FailingSink final : public IArtifactSink {
public:
    FailingSink(FakeStore& store, const int fail_at) : store_(store), fail_at_(fail_at) {}

    void write(const fs::path& path, const std::vector<unsigned char>& bytes) override {
        if (++calls_ == fail_at_) {
            throw std::runtime_error("disk full");
        }
        store_.write(path, bytes);
    }

private:
    FakeStore& store_;
    int fail_at_;
    int calls_ = 0;
};

} // namespace

TEST_F(DocumentAssemblerTest, SplitStopsAtFailingPageAndKeepsEarlierFiles) {
    const auto in = add("doc.pdf", {"a", "b", "c", "d"});
    const auto out_dir = dir / "out";
    FailingSink failing(store, 3);
    DocumentAssembler failing_assembler(engine, failing);

    try {
        failing_assembler.split({{in, ""}, out_dir});
        FAIL() << "expected OperationError";
    } catch (const OperationError& e) {
        const std::string message = describe_error(e);
        EXPECT_NE(message.find("page 3"), std::string::npos);
        EXPECT_NE(message.find("doc-003.pdf"), std::string::npos);
        EXPECT_NE(message.find("disk full"), std::string::npos);
    }
    EXPECT_EQ(store.written, (std::vector<fs::path>{out_dir / "doc-001.pdf", out_dir / "doc-002.pdf"}));
    EXPECT_FALSE(store.files.contains(out_dir / "doc-004.pdf"));
}

TEST_F(DocumentAssemblerTest, SplitThenMergePreservesPageCount) {
    const auto in = add("doc.pdf", {"a", "b", "c", "d"});
    const auto parts = assembler.split({{in, ""}, dir / "parts"});
    ASSERT_EQ(parts.size(), 4u);

    MergeRequest merge;
    merge.inputs = parts;
    merge.output = dir / "merged.pdf";
    const auto summary = assembler.merge(merge);
    EXPECT_EQ(summary.merged_files, 4);
    EXPECT_EQ(summary.page_count, 4);
    EXPECT_EQ(labels(merge.output), labels(in));
}

// --- merge ---

TEST_F(DocumentAssemblerTest, MergeSkipsUnloadableInputs) {
    const auto a = add("a.pdf", {"a1", "a2"});
    const auto b = add("b.pdf", {"b1"});
    MergeRequest request;
    request.inputs = {a, dir / "missing.pdf", b};
    request.output = dir / "merged.pdf";
    const auto summary = assembler.merge(request);
    EXPECT_EQ(summary.merged_files, 2);
    EXPECT_EQ(summary.page_count, 3);
    ASSERT_EQ(summary.skipped.size(), 1u);
    EXPECT_EQ(summary.skipped[0], dir / "missing.pdf");
    EXPECT_EQ(labels(request.output), (std::vector<std::string>{"a1", "a2", "b1"}));
    // one event per input, not per page
    EXPECT_EQ(progress.entries.size(), 3u);
}

TEST_F(DocumentAssemblerTest, StrictMergeFailsOnUnloadableInput) {
    const auto a = add("a.pdf", {"a1"});
    MergeRequest request;
    request.inputs = {a, dir / "missing.pdf"};
    request.output = dir / "merged.pdf";
    request.strict = true;
    EXPECT_THROW(assembler.merge(request), OperationError);
    EXPECT_TRUE(store.written.empty());
}

TEST_F(DocumentAssemblerTest, MergeTriesPasswordOnEveryInput) {
    const auto a = add("a.pdf", {"a1"});
    store.passwords[a] = "secret";
    MergeRequest request;
    request.inputs = {a};
    request.output = dir / "merged.pdf";
    EXPECT_EQ(assembler.merge(request).merged_files, 0);

    request.output = dir / "merged2.pdf";
    request.password = "secret";
    EXPECT_EQ(assembler.merge(request).merged_files, 1);
}

TEST_F(DocumentAssemblerTest, MergeDeletesOriginalsAfterSave) {
    const auto a = add("a.pdf", {"a1"});
    const auto b = add("b.pdf", {"b1"});
    MergeRequest request;
    request.inputs = {a, b};
    request.output = dir / "merged.pdf";
    request.delete_originals = true;
    assembler.merge(request);
    EXPECT_FALSE(fs::exists(a));
    EXPECT_FALSE(fs::exists(b));
    EXPECT_EQ(store.written.size(), 1u);
}

TEST_F(DocumentAssemblerTest, MergeValidatesOutputAndInputs) {
    const auto a = add("a.pdf", {"a1"});
    MergeRequest request;
    request.inputs = {a};
    request.output = dir / "merged.txt";
    EXPECT_THROW(assembler.merge(request), ValidationError);

    request.output = dir / "merged.PDF";
    request.inputs.clear();
    EXPECT_THROW(assembler.merge(request), ValidationError);
}

// --- rotate / unlock ---

TEST_F(DocumentAssemblerTest, RotateSelectedPages) {
    const auto in = add("doc.pdf", {"1", "2", "3"});
    const auto out = dir / "out.pdf";
    assembler.rotate({{in, ""}, out, 180, PageRange::parse("1,3")});
    const auto& pages = store.files.at(out);
    EXPECT_EQ(pages[0].rotation, 180);
    EXPECT_EQ(pages[1].rotation, 0);
    EXPECT_EQ(pages[2].rotation, 180);
}

TEST_F(DocumentAssemblerTest, RotateRejectsOtherAngles) {
    const auto in = add("doc.pdf", {"1"});
    for (const int degrees : {0, 45, 360, -90}) {
        EXPECT_THROW(assembler.rotate({{in, ""}, dir / "out.pdf", degrees}), ValidationError) << degrees;
    }
}

TEST_F(DocumentAssemblerTest, UnlockRequiresPassword) {
    const auto in = add("doc.pdf", {"1"});
    store.passwords[in] = "pw";
    EXPECT_THROW(assembler.unlock({{in, ""}, dir / "out.pdf"}), ValidationError);
    EXPECT_THROW(assembler.unlock({{in, "wrong"}, dir / "out.pdf"}), OperationError);
    assembler.unlock({{in, "pw"}, dir / "out.pdf"});
    EXPECT_EQ(labels(dir / "out.pdf"), (std::vector<std::string>{"1"}));
}

// --- common failure policy ---

TEST_F(DocumentAssemblerTest, MissingInputIsValidationErrorBeforeEngine) {
    const auto missing = dir / "nope.pdf";
    EXPECT_THROW(assembler.split({{missing, ""}}), ValidationError);
    EXPECT_THROW(assembler.reorder({{missing, ""}, dir / "o.pdf", {1}}), ValidationError);
    EXPECT_THROW(assembler.remove({{missing, ""}, dir / "o.pdf", {1}}), ValidationError);
    EXPECT_THROW(assembler.insert({{missing, ""}, dir / "o.pdf", {{1, 1}}}), ValidationError);
    EXPECT_THROW(assembler.rotate({{"", ""}, dir / "o.pdf"}), ValidationError);
    EXPECT_EQ(engine.loads, 0);
}

TEST_F(DocumentAssemblerTest, EmptyOutputIsRejected) {
    const auto in = add("doc.pdf", {"1"});
    EXPECT_THROW(assembler.remove({{in, ""}, "", {1}}), ValidationError);
}

TEST_F(DocumentAssemblerTest, LoadFailureIsOperationErrorWithNestedCause) {
    const auto path = dir / "broken.pdf";
    std::ofstream(path) << "not a pdf";
    try {
        assembler.remove({{path, ""}, dir / "o.pdf", {1}});
        FAIL() << "expected OperationError";
    } catch (const OperationError& e) {
        EXPECT_NE(describe_error(e).find("file not found"), std::string::npos);
    }
    EXPECT_TRUE(store.written.empty());
}
