//
// Created by Giuseppe Francione on 10/02/26.
//

#include "../../include/qpdf_engine.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "qpdf_support.hpp"
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFOutlineDocumentHelper.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <map>
#include <stdexcept>

namespace folio {

namespace {

constexpr auto kTag = "qpdf_engine";

class QpdfDocument final : public IPdfDocument {
public:
    QpdfDocument() = default;

    QpdfHandle& handle() noexcept { return handle_; }

    [[nodiscard]] int page_count() const override {
        return static_cast<int>(pages().size());
    }

    void import_pages(IPdfDocument& source, const std::vector<int>& source_indices, const int insert_at) override {
        auto* src = dynamic_cast<QpdfDocument*>(&source);
        if (!src) {
            throw EngineError(EngineErrorKind::Unknown, "source document does not come from the qpdf engine");
        }
        const auto src_pages = src->pages();
        guard("import pages", [&] {
            QPDFPageDocumentHelper dh(qpdf());
            int pos = insert_at;
            for (const int index : source_indices) {
                check_index(index, static_cast<int>(src_pages.size()));
                insert_at_position(dh, src_pages[static_cast<size_t>(index)].getObjectHandle(), pos++);
            }
        });
        page_index_.clear();
    }

    void delete_page(const int index) override {
        const auto all = pages();
        check_index(index, static_cast<int>(all.size()));
        guard("delete page", [&] {
            QPDFPageDocumentHelper(qpdf()).removePage(all[static_cast<size_t>(index)]);
        });
        page_index_.clear();
    }

    void insert_blank_page(const int index, const double width, const double height) override {
        guard("insert blank page", [&] {
            QPDFObjectHandle page = QPDFObjectHandle::newDictionary();
            page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
            page.replaceKey("/MediaBox",
                QPDFObjectHandle::newFromRectangle(QPDFObjectHandle::Rectangle(0, 0, width, height)));
            page.replaceKey("/Resources", QPDFObjectHandle::newDictionary());
            page.replaceKey("/Contents", qpdf().newStream(std::string()));
            QPDFPageDocumentHelper dh(qpdf());
            insert_at_position(dh, qpdf().makeIndirectObject(page), index);
        });
        page_index_.clear();
    }

    void set_rotation(const int index, const int degrees) override {
        auto all = pages();
        check_index(index, static_cast<int>(all.size()));
        guard("rotate page", [&] {
            all[static_cast<size_t>(index)].rotatePage(degrees, false);
        });
    }

    [[nodiscard]] std::optional<OutlineRef> outline_first_child(const std::optional<OutlineRef>& parent) const override {
        QPDFObjectHandle node = parent
            ? object(*parent)
            : handle_.get().getRoot().getKey("/Outlines");
        if (!node.isDictionary()) return std::nullopt;
        return to_ref(node.getKey("/First"));
    }

    [[nodiscard]] std::optional<OutlineRef> outline_next_sibling(const OutlineRef& item) const override {
        return to_ref(object(item).getKey("/Next"));
    }

    [[nodiscard]] std::optional<std::string> outline_title(const OutlineRef& item) const override {
        QPDFObjectHandle title = object(item).getKey("/Title");
        if (!title.isString()) return std::nullopt;
        return title.getUTF8Value();
    }

    [[nodiscard]] std::optional<OutlineAction> outline_action(const OutlineRef& item) const override {
        QPDFObjectHandle action = object(item).getKey("/A");
        if (!action.isDictionary()) return std::nullopt;

        OutlineAction out;
        QPDFObjectHandle type = action.getKey("/S");
        const std::string name = type.isName() ? type.getName() : std::string();
        if (name == "/GoTo") {
            out.kind = ActionKind::Goto;
            out.page_index = resolve_dest(action.getKey("/D"));
        } else if (name == "/GoToR") {
            out.kind = ActionKind::RemoteGoto;
            // remote destinations name pages by number, not by reference
            QPDFObjectHandle dest = action.getKey("/D");
            if (dest.isArray() && dest.getArrayNItems() > 0 && dest.getArrayItem(0).isInteger()) {
                out.page_index = dest.getArrayItem(0).getIntValueAsInt();
            }
        } else if (name == "/URI") {
            out.kind = ActionKind::Uri;
        } else if (name == "/Launch") {
            out.kind = ActionKind::Launch;
        } else if (name == "/GoToE") {
            out.kind = ActionKind::EmbeddedGoto;
        } else {
            out.kind = ActionKind::Unsupported;
        }
        return out;
    }

    [[nodiscard]] std::optional<int> outline_dest_page(const OutlineRef& item) const override {
        QPDFObjectHandle dest = object(item).getKey("/Dest");
        if (dest.isNull()) return std::nullopt;
        return resolve_dest(dest);
    }

    [[nodiscard]] std::vector<unsigned char> serialize(const SaveOptions& options) override {
        return write_to_memory(qpdf(), options.remove_security);
    }

private:
    QPDF& qpdf() noexcept { return handle_.get(); }

    [[nodiscard]] std::vector<QPDFPageObjectHelper> pages() const {
        return QPDFPageDocumentHelper(handle_.get()).getAllPages();
    }

    static void check_index(const int index, const int count) {
        if (index < 0 || index >= count) {
            throw EngineError(EngineErrorKind::Page,
                "page index " + std::to_string(index) + " out of range 0-" + std::to_string(count - 1));
        }
    }

    static void insert_at_position(QPDFPageDocumentHelper& dh, const QPDFObjectHandle& page, const int pos) {
        const auto current = dh.getAllPages();
        if (pos < 0 || pos > static_cast<int>(current.size())) {
            throw EngineError(EngineErrorKind::Page, "insert position " + std::to_string(pos) + " out of range");
        }
        if (pos == static_cast<int>(current.size())) {
            dh.addPage(QPDFPageObjectHelper(page), false);
        } else {
            dh.addPageAt(QPDFPageObjectHelper(page), true, current[static_cast<size_t>(pos)]);
        }
    }

    // translate qpdf failures raised while editing
    template <typename Fn>
    static void guard(const char* what, Fn&& fn) {
        try {
            fn();
        } catch (const EngineError&) {
            throw;
        } catch (const QPDFExc& e) {
            Logger::log(LogLevel::Error, std::string(what) + " failed: " + e.what(), kTag);
            throw EngineError(to_engine_error_kind(e), std::string(what) + ": " + e.what());
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string(what) + " failed: " + e.what(), kTag);
            throw EngineError(EngineErrorKind::Unknown, std::string(what) + ": " + e.what());
        }
    }

    [[nodiscard]] QPDFObjectHandle object(const OutlineRef& ref) const {
        return handle_.get().getObjectByID(ref.obj, ref.gen);
    }

    static std::optional<OutlineRef> to_ref(QPDFObjectHandle node) {
        if (!node.isIndirect() || !node.isDictionary()) return std::nullopt;
        return OutlineRef{node.getObjectID(), node.getGeneration()};
    }

    [[nodiscard]] std::optional<int> resolve_dest(QPDFObjectHandle dest) const {
        if (dest.isName() || dest.isString()) {
            if (!outlines_) {
                outlines_ = std::make_unique<QPDFOutlineDocumentHelper>(handle_.get());
            }
            dest = outlines_->resolveNamedDest(dest);
        }
        if (dest.isDictionary()) {
            dest = dest.getKey("/D");
        }
        if (!dest.isArray() || dest.getArrayNItems() == 0) {
            return std::nullopt;
        }
        QPDFObjectHandle target = dest.getArrayItem(0);
        if (!target.isIndirect()) {
            return std::nullopt;
        }
        if (page_index_.empty()) {
            int i = 0;
            for (auto& page : pages()) {
                page_index_[page.getObjectHandle().getObjGen()] = i++;
            }
        }
        const auto it = page_index_.find(target.getObjGen());
        if (it == page_index_.end()) return std::nullopt;
        return it->second;
    }

    // qpdf resolves objects lazily, so read-only queries still mutate it
    mutable QpdfHandle handle_;
    mutable std::unique_ptr<QPDFOutlineDocumentHelper> outlines_;
    mutable std::map<QPDFObjGen, int> page_index_;
};

} // namespace

std::unique_ptr<IPdfDocument> QpdfEngine::load_document(const std::filesystem::path& path,
                                                        const std::string& password) {
    auto doc = std::make_unique<QpdfDocument>();
    doc->handle().open(path, password);
    Logger::log(LogLevel::Debug, "Loaded " + path.string() + " (" + std::to_string(doc->page_count()) + " pages)", kTag);
    return doc;
}

std::unique_ptr<IPdfDocument> QpdfEngine::create_document() {
    auto doc = std::make_unique<QpdfDocument>();
    doc->handle().create();
    return doc;
}

} // namespace folio
