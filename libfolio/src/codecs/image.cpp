//
// Created by Giuseppe Francione on 12/02/26.
//

#include "../../include/image_codec.hpp"
#include <stdexcept>
#include <string>

namespace folio {

Image to_rgb(const Image& image) {
    if (!image.has_alpha()) {
        return image;
    }
    Image out;
    out.width = image.width;
    out.height = image.height;
    out.channels = 3;
    out.pixels.resize(out.stride() * static_cast<std::size_t>(out.height));

    const unsigned char* src = image.pixels.data();
    unsigned char* dst = out.pixels.data();
    const std::size_t count = static_cast<std::size_t>(image.width) * image.height;
    for (std::size_t i = 0; i < count; ++i) {
        const unsigned a = src[3];
        for (int c = 0; c < 3; ++c) {
            // blend over white
            dst[c] = static_cast<unsigned char>((src[c] * a + 255u * (255u - a) + 127u) / 255u);
        }
        src += 4;
        dst += 3;
    }
    return out;
}

std::vector<unsigned char> to_bgra(const Image& image) {
    if (image.channels != 3 && image.channels != 4) {
        throw std::runtime_error("unsupported channel count: " + std::to_string(image.channels));
    }
    const std::size_t count = static_cast<std::size_t>(image.width) * image.height;
    std::vector<unsigned char> out(count * 4);
    const unsigned char* src = image.pixels.data();
    unsigned char* dst = out.data();
    for (std::size_t i = 0; i < count; ++i) {
        dst[0] = src[2];
        dst[1] = src[1];
        dst[2] = src[0];
        dst[3] = image.has_alpha() ? src[3] : 0xFF;
        src += image.channels;
        dst += 4;
    }
    return out;
}

} // namespace folio
