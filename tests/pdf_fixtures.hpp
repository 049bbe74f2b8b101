//
// Created by Giuseppe Francione on 18/02/26.
//

#ifndef FOLIO_TESTS_PDF_FIXTURES_HPP
#define FOLIO_TESTS_PDF_FIXTURES_HPP

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <filesystem>
#include <functional>
#include <random>
#include <string>
#include <vector>

namespace folio::fakes {

/// Per-test scratch directory, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() / (prefix + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Writes a PDF whose pages are told apart by their MediaBox width.
 * @param decorate Optional hook that edits the document before it is written.
 */
inline void write_pdf(const std::filesystem::path& path, const std::vector<int>& widths,
                      const std::function<void(QPDF&)>& decorate = {},
                      const std::function<void(QPDFWriter&)>& configure = {}) {
    QPDF pdf;
    pdf.emptyPDF();
    QPDFPageDocumentHelper dh(pdf);
    for (const int w : widths) {
        QPDFObjectHandle page = QPDFObjectHandle::newDictionary();
        page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
        page.replaceKey("/MediaBox", QPDFObjectHandle::newFromRectangle(
            QPDFObjectHandle::Rectangle(0, 0, static_cast<double>(w), 792)));
        page.replaceKey("/Resources", QPDFObjectHandle::newDictionary());
        page.replaceKey("/Contents", pdf.newStream(std::string("q Q")));
        dh.addPage(QPDFPageObjectHelper(pdf.makeIndirectObject(page)), false);
    }
    if (decorate) decorate(pdf);

    QPDFWriter writer(pdf, path.string().c_str());
    writer.setDeterministicID(!configure);
    if (configure) configure(writer);
    writer.write();
}

/// @return MediaBox width of every page, in page order.
inline std::vector<int> page_widths(const std::filesystem::path& path, const char* password = nullptr) {
    QPDF pdf;
    pdf.processFile(path.string().c_str(), password);
    std::vector<int> out;
    for (auto& page : QPDFPageDocumentHelper(pdf).getAllPages()) {
        const auto box = page.getMediaBox().getArrayAsRectangle();
        out.push_back(static_cast<int>(box.urx - box.llx));
    }
    return out;
}

/// @return /Rotate of every page (0 when absent).
inline std::vector<int> page_rotations(const std::filesystem::path& path) {
    QPDF pdf;
    pdf.processFile(path.string().c_str());
    std::vector<int> out;
    for (auto& page : QPDFPageDocumentHelper(pdf).getAllPages()) {
        QPDFObjectHandle rotate = page.getObjectHandle().getKey("/Rotate");
        out.push_back(rotate.isInteger() ? rotate.getIntValueAsInt() : 0);
    }
    return out;
}

} // namespace folio::fakes

#endif // FOLIO_TESTS_PDF_FIXTURES_HPP
