//
// Created by Giuseppe Francione on 13/02/26.
//

/**
 * @file codec_registry.hpp
 * @brief Defines the registry for discovering IImageCodec instances.
 */

#ifndef FOLIO_CODEC_REGISTRY_HPP
#define FOLIO_CODEC_REGISTRY_HPP

#include "image_codec.hpp"
#include <memory>
#include <string_view>
#include <vector>

namespace folio {

/**
 * @brief Registry of all built-in image codecs.
 *
 * @details Owns one instance of every codec and looks them up by file
 * extension. Instantiated once per operation that needs images.
 */
class CodecRegistry {
public:
    /// @brief Construct and register all built-in codecs.
    CodecRegistry();

    /**
     * @brief Find the codec handling an extension.
     *
     * Comparison is case-insensitive; the leading dot is optional
     * ("png", ".PNG").
     *
     * @return Non-owning pointer, or nullptr when no codec matches.
     */
    [[nodiscard]] const IImageCodec* find_by_extension(std::string_view ext) const;

    /**
     * @brief Like find_by_extension() but throws.
     * @throws ValidationError naming the unsupported extension.
     */
    [[nodiscard]] const IImageCodec& require(std::string_view ext) const;

    [[nodiscard]] const std::vector<std::unique_ptr<IImageCodec>>& all() const { return codecs_; }

private:
    ///< Owned instances of all registered codecs.
    std::vector<std::unique_ptr<IImageCodec>> codecs_;
};

} // namespace folio

#endif // FOLIO_CODEC_REGISTRY_HPP
