//
// Created by Giuseppe Francione on 12/02/26.
//

#ifndef FOLIO_JPEG_CODEC_HPP
#define FOLIO_JPEG_CODEC_HPP

#include "image_codec.hpp"
#include <array>

namespace folio {

    /**
     * @brief IImageCodec for JPEG files using libjpeg.
     *
     * Alpha is composited onto white before encoding.
     */
    class JpegCodec final : public IImageCodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JPEG";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 3> kExts = { ".jpg", ".jpeg", ".jpe" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] Image decode(const std::filesystem::path& path) const override;

        void encode(const Image& image, const std::filesystem::path& path) const override;
    };

} // namespace folio

#endif // FOLIO_JPEG_CODEC_HPP
