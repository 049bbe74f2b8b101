//
// Created by Giuseppe Francione on 13/02/26.
//

#ifndef FOLIO_BMP_CODEC_HPP
#define FOLIO_BMP_CODEC_HPP

#include "image_codec.hpp"
#include <array>

namespace folio {

    /**
     * @brief IImageCodec for BMP files using bmplib.
     */
    class BmpCodec final : public IImageCodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "BMP";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 2> kExts = { ".bmp", ".dib" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] Image decode(const std::filesystem::path& path) const override;

        void encode(const Image& image, const std::filesystem::path& path) const override;
    };

} // namespace folio

#endif // FOLIO_BMP_CODEC_HPP
