//
// Created by Giuseppe Francione on 06/02/26.
//

/**
 * @file pdf_engine.hpp
 * @brief The narrow interface document composition consumes from a PDF engine.
 */

#ifndef FOLIO_PDF_ENGINE_HPP
#define FOLIO_PDF_ENGINE_HPP

#include <compare>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace folio {

/**
 * @brief Kind of the action attached to an outline item.
 */
enum class ActionKind {
    Goto,
    RemoteGoto,
    Uri,
    Launch,
    EmbeddedGoto,
    Page,       ///< no action, the item carries a direct destination
    Unsupported
};

/**
 * @brief Identity of an outline item inside one loaded document.
 */
struct OutlineRef {
    int obj = 0;
    int gen = 0;

    bool operator==(const OutlineRef&) const = default;
    auto operator<=>(const OutlineRef&) const = default;
};

/**
 * @brief Action of an outline item with its destination, when it has one.
 */
struct OutlineAction {
    ActionKind kind = ActionKind::Unsupported;
    std::optional<int> page_index; ///< 0-based engine index
};

/**
 * @brief Flags applied when serializing a document.
 */
struct SaveOptions {
    bool remove_security = false; ///< write without the source's encryption
};

/**
 * @brief A loaded or newly created document, owned by one operation.
 *
 * All page indices are 0-based engine indices. Implementations release
 * their native state in the destructor. Pages imported from another
 * document may keep referring to it until serialize() returns, so the
 * source must outlive the destination's serialization.
 */
class IPdfDocument {
public:
    virtual ~IPdfDocument() = default;

    [[nodiscard]] virtual int page_count() const = 0;

    /**
     * @brief Copies pages of @p source, in the given order, so that the
     * first copy lands at @p insert_at (0 <= insert_at <= page_count()).
     * @throws EngineError on failure.
     */
    virtual void import_pages(IPdfDocument& source, const std::vector<int>& source_indices,
                              int insert_at) = 0;

    virtual void delete_page(int index) = 0;

    /// @brief Inserts an empty page of @p width x @p height points before @p index.
    virtual void insert_blank_page(int index, double width, double height) = 0;

    /// @brief Sets the absolute rotation of a page (multiple of 90).
    virtual void set_rotation(int index, int degrees) = 0;

    // --- outline traversal primitives ---

    /// @return First child of @p parent, or of the outline root when @p parent is empty.
    [[nodiscard]] virtual std::optional<OutlineRef> outline_first_child(
        const std::optional<OutlineRef>& parent) const = 0;

    [[nodiscard]] virtual std::optional<OutlineRef> outline_next_sibling(const OutlineRef& item) const = 0;

    /// @return The item's title, empty optional when the item has none.
    [[nodiscard]] virtual std::optional<std::string> outline_title(const OutlineRef& item) const = 0;

    /// @return The item's action, empty optional when the item has no action.
    [[nodiscard]] virtual std::optional<OutlineAction> outline_action(const OutlineRef& item) const = 0;

    /// @return Page index of the item's own destination, if resolvable.
    [[nodiscard]] virtual std::optional<int> outline_dest_page(const OutlineRef& item) const = 0;

    /**
     * @brief Serializes the document to bytes.
     * @throws EngineError on failure.
     */
    [[nodiscard]] virtual std::vector<unsigned char> serialize(const SaveOptions& options) = 0;
};

/**
 * @brief Factory for documents.
 */
class IPdfEngine {
public:
    virtual ~IPdfEngine() = default;

    /**
     * @brief Loads a document from disk.
     * @throws EngineError (File, Format, Password, Security, ...) on failure.
     */
    [[nodiscard]] virtual std::unique_ptr<IPdfDocument> load_document(
        const std::filesystem::path& path, const std::string& password) = 0;

    [[nodiscard]] virtual std::unique_ptr<IPdfDocument> create_document() = 0;
};

} // namespace folio

#endif // FOLIO_PDF_ENGINE_HPP
