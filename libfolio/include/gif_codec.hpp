//
// Created by Giuseppe Francione on 13/02/26.
//

#ifndef FOLIO_GIF_CODEC_HPP
#define FOLIO_GIF_CODEC_HPP

#include "image_codec.hpp"
#include <array>

namespace folio {

    /**
     * @brief IImageCodec for GIF files.
     *
     * @details Decoding goes through stb_image and keeps the first frame.
     * Encoding goes through lcdfgif with a fixed 6x6x6 color cube, so
     * output is always a single-frame, 216-color image.
     */
    class GifCodec final : public IImageCodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "GIF";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".gif" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] Image decode(const std::filesystem::path& path) const override;

        void encode(const Image& image, const std::filesystem::path& path) const override;
    };

} // namespace folio

#endif // FOLIO_GIF_CODEC_HPP
