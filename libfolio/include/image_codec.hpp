//
// Created by Giuseppe Francione on 12/02/26.
//

/**
 * @file image_codec.hpp
 * @brief Raster image type and the codec interface used by convert, imagetopdf and watermark.
 */

#ifndef FOLIO_IMAGE_CODEC_HPP
#define FOLIO_IMAGE_CODEC_HPP

#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace folio {

/**
 * @brief 8-bit interleaved pixels, top row first, rows tightly packed.
 */
struct Image {
    int width = 0;
    int height = 0;
    int channels = 3; ///< 3 (RGB) or 4 (RGBA)
    std::vector<unsigned char> pixels;

    [[nodiscard]] std::size_t stride() const noexcept { return static_cast<std::size_t>(width) * channels; }
    [[nodiscard]] bool has_alpha() const noexcept { return channels == 4; }
};

/// @return RGB copy of @p image, alpha composited onto white.
Image to_rgb(const Image& image);

/// @return BGRA pixels of @p image (opaque when it has no alpha).
std::vector<unsigned char> to_bgra(const Image& image);

/**
 * @brief Decoder and encoder for one raster format.
 *
 * Implementations are stateless; the CodecRegistry owns one instance
 * of each and hands out non-owning pointers.
 */
class IImageCodec {
public:
    virtual ~IImageCodec() = default;

    /// @return Human-readable name of the codec (e.g. "PNG").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return Supported extensions, lowercase, with the leading dot. The first one is preferred.
    [[nodiscard]] virtual std::span<const std::string_view> get_supported_extensions() const noexcept = 0;

    /**
     * @brief Decodes the first image stored in @p path.
     * @throws std::runtime_error on I/O or format errors.
     */
    [[nodiscard]] virtual Image decode(const std::filesystem::path& path) const = 0;

    /**
     * @brief Encodes @p image into @p path.
     * @throws std::runtime_error on I/O or encoder errors.
     */
    virtual void encode(const Image& image, const std::filesystem::path& path) const = 0;
};

} // namespace folio

#endif // FOLIO_IMAGE_CODEC_HPP
