//
// Created by Giuseppe Francione on 12/02/26.
//

#ifndef FOLIO_PNG_CODEC_HPP
#define FOLIO_PNG_CODEC_HPP

#include "image_codec.hpp"
#include <array>

namespace folio {

    /**
     * @brief IImageCodec for PNG files using libpng.
     */
    class PngCodec final : public IImageCodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PNG";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".png" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] Image decode(const std::filesystem::path& path) const override;

        void encode(const Image& image, const std::filesystem::path& path) const override;
    };

} // namespace folio

#endif // FOLIO_PNG_CODEC_HPP
