//
// Created by Giuseppe Francione on 18/02/26.
//

#ifndef FOLIO_TESTS_FAKE_ENGINE_HPP
#define FOLIO_TESTS_FAKE_ENGINE_HPP

#include "../libfolio/include/document_assembler.hpp"
#include "../libfolio/include/errors.hpp"
#include "../libfolio/include/pdf_engine.hpp"
#include "../libfolio/include/progress.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace folio::fakes {

struct FakePage {
    std::string label;
    int rotation = 0;
    double width = kDefaultPageWidth;
    double height = kDefaultPageHeight;
};

/// One outline item; links are indices into the owning vector, -1 for none.
struct FakeOutlineItem {
    std::optional<std::string> title;
    int first_child = -1;
    int next = -1;
    std::optional<OutlineAction> action;
    std::optional<int> dest;
};

inline std::vector<unsigned char> encode_pages(const std::vector<FakePage>& pages) {
    std::ostringstream out;
    for (const auto& p : pages) {
        out << p.label << '\t' << p.rotation << '\t' << p.width << '\t' << p.height << '\n';
    }
    const std::string s = out.str();
    return {s.begin(), s.end()};
}

inline std::vector<FakePage> decode_pages(const std::vector<unsigned char>& bytes) {
    std::istringstream in(std::string(bytes.begin(), bytes.end()));
    std::vector<FakePage> pages;
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        FakePage p;
        std::getline(fields, p.label, '\t');
        fields >> p.rotation >> p.width >> p.height;
        pages.push_back(p);
    }
    return pages;
}

class FakeDocument final : public IPdfDocument {
public:
    FakeDocument() = default;
    FakeDocument(std::vector<FakePage> pages, std::vector<FakeOutlineItem> outline)
        : pages_(std::move(pages)), outline_(std::move(outline)) {}

    [[nodiscard]] int page_count() const override { return static_cast<int>(pages_.size()); }

    void import_pages(IPdfDocument& source, const std::vector<int>& source_indices, const int insert_at) override {
        auto* src = dynamic_cast<FakeDocument*>(&source);
        if (!src) throw EngineError(EngineErrorKind::Unknown, "foreign document");
        if (insert_at < 0 || insert_at > page_count()) throw EngineError(EngineErrorKind::Page, "bad position");
        std::vector<FakePage> copies;
        for (const int index : source_indices) {
            if (index < 0 || index >= src->page_count()) throw EngineError(EngineErrorKind::Page, "bad index");
            copies.push_back(src->pages_[static_cast<size_t>(index)]);
        }
        pages_.insert(pages_.begin() + insert_at, copies.begin(), copies.end());
    }

    void delete_page(const int index) override {
        check(index);
        pages_.erase(pages_.begin() + index);
    }

    void insert_blank_page(const int index, const double width, const double height) override {
        if (index < 0 || index > page_count()) throw EngineError(EngineErrorKind::Page, "bad position");
        pages_.insert(pages_.begin() + index, FakePage{"blank", 0, width, height});
    }

    void set_rotation(const int index, const int degrees) override {
        check(index);
        pages_[static_cast<size_t>(index)].rotation = degrees;
    }

    [[nodiscard]] std::optional<OutlineRef> outline_first_child(const std::optional<OutlineRef>& parent) const override {
        if (!parent) return outline_.empty() ? std::nullopt : ref(0);
        return ref(item(*parent).first_child);
    }

    [[nodiscard]] std::optional<OutlineRef> outline_next_sibling(const OutlineRef& r) const override {
        return ref(item(r).next);
    }

    [[nodiscard]] std::optional<std::string> outline_title(const OutlineRef& r) const override {
        return item(r).title;
    }

    [[nodiscard]] std::optional<OutlineAction> outline_action(const OutlineRef& r) const override {
        return item(r).action;
    }

    [[nodiscard]] std::optional<int> outline_dest_page(const OutlineRef& r) const override {
        return item(r).dest;
    }

    [[nodiscard]] std::vector<unsigned char> serialize(const SaveOptions&) override {
        return encode_pages(pages_);
    }

    [[nodiscard]] const std::vector<FakePage>& pages() const { return pages_; }

private:
    void check(const int index) const {
        if (index < 0 || index >= page_count()) throw EngineError(EngineErrorKind::Page, "bad index");
    }

    static std::optional<OutlineRef> ref(const int index) {
        if (index < 0) return std::nullopt;
        return OutlineRef{index, 0};
    }

    [[nodiscard]] const FakeOutlineItem& item(const OutlineRef& r) const {
        return outline_.at(static_cast<size_t>(r.obj));
    }

    std::vector<FakePage> pages_;
    std::vector<FakeOutlineItem> outline_;
};

/**
 * @brief In-memory file system shared by FakeEngine (reads) and the
 * assembler's artifact sink (writes).
 */
class FakeStore final : public IArtifactSink {
public:
    void write(const std::filesystem::path& path, const std::vector<unsigned char>& bytes) override {
        files[path] = decode_pages(bytes);
        written.push_back(path);
    }

    std::map<std::filesystem::path, std::vector<FakePage>> files;
    std::map<std::filesystem::path, std::vector<FakeOutlineItem>> outlines;
    std::map<std::filesystem::path, std::string> passwords;
    std::vector<std::filesystem::path> written;
};

class FakeEngine final : public IPdfEngine {
public:
    explicit FakeEngine(FakeStore& store) : store_(store) {}

    [[nodiscard]] std::unique_ptr<IPdfDocument> load_document(const std::filesystem::path& path,
                                                              const std::string& password) override {
        const auto it = store_.files.find(path);
        if (it == store_.files.end()) {
            throw EngineError(EngineErrorKind::File, path.string());
        }
        if (const auto pw = store_.passwords.find(path); pw != store_.passwords.end() && pw->second != password) {
            throw EngineError(EngineErrorKind::Password, path.string());
        }
        ++loads;
        std::vector<FakeOutlineItem> outline;
        if (const auto o = store_.outlines.find(path); o != store_.outlines.end()) {
            outline = o->second;
        }
        return std::make_unique<FakeDocument>(it->second, std::move(outline));
    }

    [[nodiscard]] std::unique_ptr<IPdfDocument> create_document() override {
        return std::make_unique<FakeDocument>();
    }

    int loads = 0;

private:
    FakeStore& store_;
};

struct ProgressEntry {
    int current;
    int total;
    std::string context;
};

class RecordingReporter final : public IProgressReporter {
public:
    void report(const int current, const int total, const std::string& context) noexcept override {
        entries.push_back({current, total, context});
    }

    std::vector<ProgressEntry> entries;
};

inline std::vector<std::string> labels_of(const std::vector<FakePage>& pages) {
    std::vector<std::string> out;
    for (const auto& p : pages) out.push_back(p.label);
    return out;
}

} // namespace folio::fakes

#endif // FOLIO_TESTS_FAKE_ENGINE_HPP
