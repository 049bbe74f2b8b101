//
// Created by Giuseppe Francione on 18/02/26.
//

#include "../libfolio/include/document_inspector.hpp"
#include "../libfolio/include/errors.hpp"
#include "../libfolio/include/file_utils.hpp"
#include "fake_engine.hpp"
#include "pdf_fixtures.hpp"
#include <gtest/gtest.h>
#include <qpdf/QPDFEFStreamObjectHelper.hh>
#include <qpdf/QPDFEmbeddedFileDocumentHelper.hh>
#include <qpdf/QPDFFileSpecObjectHelper.hh>

using namespace folio;
using namespace folio::fakes;
namespace fs = std::filesystem;

namespace {

void add_info(QPDF& pdf) {
    QPDFObjectHandle info = QPDFObjectHandle::newDictionary();
    info.replaceKey("/Title", QPDFObjectHandle::newUnicodeString("Quarterly report"));
    info.replaceKey("/Author", QPDFObjectHandle::newUnicodeString("Accounting"));
    info.replaceKey("/Trapped", QPDFObjectHandle::newName("/False"));
    pdf.getTrailer().replaceKey("/Info", pdf.makeIndirectObject(info));
}

void attach(QPDF& pdf, const std::string& name, const std::string& data, const std::string& mime) {
    auto stream = QPDFEFStreamObjectHelper::createEFStream(pdf, data);
    stream.setSubtype(mime);
    auto spec = QPDFFileSpecObjectHelper::createFileSpec(pdf, name, stream);
    spec.setDescription("about " + name);
    QPDFEmbeddedFileDocumentHelper(pdf).replaceEmbeddedFile(name, spec);
}

void add_text_field(QPDF& pdf) {
    QPDFObjectHandle page = pdf.getAllPages().at(1);
    QPDFObjectHandle widget = pdf.makeIndirectObject(QPDFObjectHandle::parse(
        "<< /Type /Annot /Subtype /Widget /FT /Tx /T (customer) /V (ACME) /Rect [10 20 110 40] >>"));
    widget.replaceKey("/P", page);
    page.replaceKey("/Annots", QPDFObjectHandle::newArray(std::vector<QPDFObjectHandle>{widget}));

    QPDFObjectHandle acroform = QPDFObjectHandle::newDictionary();
    acroform.replaceKey("/Fields", QPDFObjectHandle::newArray(std::vector<QPDFObjectHandle>{widget}));
    pdf.getRoot().replaceKey("/AcroForm", pdf.makeIndirectObject(acroform));
}

} // namespace

class DocumentInspectorTest : public ::testing::Test {
protected:
    TempDir dir{"folio_inspector"};
    FileArtifactSink sink;
    RecordingReporter progress;
    DocumentInspector inspector{sink, &progress};
};

TEST_F(DocumentInspectorTest, InfoReadsTrailerDictionaryAndVersion) {
    const auto path = dir / "report.pdf";
    write_pdf(path, {100, 200, 300}, add_info, [](QPDFWriter& w) { w.forcePDFVersion("1.7"); });

    const PdfInfo info = inspector.info({path, ""});
    EXPECT_EQ(info.pages, 3);
    EXPECT_EQ(info.title, "Quarterly report");
    EXPECT_EQ(info.author, "Accounting");
    EXPECT_EQ(info.trapped, "False");
    EXPECT_EQ(info.version, 17);
    EXPECT_TRUE(info.subject.empty());
}

TEST_F(DocumentInspectorTest, InfoWithoutDictionaryHasEmptyFields) {
    const auto path = dir / "plain.pdf";
    write_pdf(path, {100});
    const PdfInfo info = inspector.info({path, ""});
    EXPECT_EQ(info.pages, 1);
    EXPECT_TRUE(info.title.empty());
    EXPECT_TRUE(info.author.empty());
}

TEST_F(DocumentInspectorTest, ListsAttachmentsInNameOrder) {
    const auto path = dir / "with_files.pdf";
    write_pdf(path, {100}, [](QPDF& pdf) {
        attach(pdf, "b.csv", "x,y\n1,2\n", "text/csv");
        attach(pdf, "a.txt", "hello", "text/plain");
    });

    const auto files = inspector.attachments({path, ""});
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].name, "a.txt");
    EXPECT_EQ(files[0].mime_type, "text/plain");
    EXPECT_EQ(files[0].description, "about a.txt");
    EXPECT_EQ(files[1].name, "b.csv");
    ASSERT_EQ(progress.entries.size(), 2u);
    EXPECT_EQ(progress.entries.back().total, 2);
}

TEST_F(DocumentInspectorTest, ExtractsAllOrOneAttachment) {
    const auto path = dir / "with_files.pdf";
    write_pdf(path, {100}, [](QPDF& pdf) {
        attach(pdf, "a.txt", "hello", "text/plain");
        attach(pdf, "b:bad?.txt", "second", "text/plain");
    });

    const auto all = inspector.extract_attachments({path, ""}, dir / "all");
    ASSERT_EQ(all.size(), 2u);
    const auto hello = read_file(dir / "all" / "a.txt");
    EXPECT_EQ(std::string(hello.begin(), hello.end()), "hello");
    EXPECT_TRUE(fs::exists(dir / "all" / "bbad.txt"));

    const auto one = inspector.extract_attachments({path, ""}, dir / "one", 1);
    ASSERT_EQ(one.size(), 1u);
    EXPECT_EQ(one[0].filename(), "bbad.txt");
    EXPECT_FALSE(fs::exists(dir / "one" / "a.txt"));
}

TEST_F(DocumentInspectorTest, AttachmentIndexOutOfRangeIsValidationError) {
    const auto path = dir / "with_file.pdf";
    write_pdf(path, {100}, [](QPDF& pdf) { attach(pdf, "a.txt", "hello", "text/plain"); });
    EXPECT_THROW((void) inspector.extract_attachments({path, ""}, dir / "out", 1), ValidationError);
    EXPECT_THROW((void) inspector.extract_attachments({path, ""}, dir / "out", -1), ValidationError);
    EXPECT_FALSE(fs::exists(dir / "out"));
}

TEST_F(DocumentInspectorTest, ListsWidgetFieldsOfSelectedPages) {
    const auto path = dir / "form.pdf";
    write_pdf(path, {100, 200}, add_text_field);

    const auto fields = inspector.form_fields({path, ""});
    ASSERT_EQ(fields.size(), 1u);
    EXPECT_EQ(fields[0].page, 2);
    EXPECT_EQ(fields[0].name, "customer");
    EXPECT_EQ(fields[0].type, "text");
    EXPECT_EQ(fields[0].value, "ACME");
    EXPECT_EQ(fields[0].rect, "10.00,20.00,110.00,40.00");

    EXPECT_TRUE(inspector.form_fields({path, ""}, PageRange::parse("1")).empty());
}

TEST_F(DocumentInspectorTest, MissingInputIsValidationError) {
    EXPECT_THROW((void) inspector.info({dir / "nope.pdf", ""}), ValidationError);
}

TEST_F(DocumentInspectorTest, GarbageInputIsOperationError) {
    const auto path = dir / "junk.pdf";
    write_file(path, {'n', 'o', 't', ' ', 'p', 'd', 'f'});
    try {
        (void) inspector.attachments({path, ""});
        FAIL() << "expected OperationError";
    } catch (const OperationError& e) {
        EXPECT_NE(describe_error(e).find("list-attachments: cannot load"), std::string::npos);
    }
}
