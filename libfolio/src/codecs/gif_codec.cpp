//
// Created by Giuseppe Francione on 13/02/26.
//

#include "../../include/gif_codec.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

extern "C" {
#include <lcdfgif/gif.h>
}

namespace folio {

namespace {

constexpr auto kTag = "gif_codec";
constexpr int kLevels = 6; // per channel, 6^3 = 216 colors
constexpr int kMaxGifSide = 65535;

struct StbiFree {
    void operator()(unsigned char* p) const { stbi_image_free(p); }
};

struct GifStreamDeleter {
    void operator()(Gif_Stream* gfs) const { Gif_DeleteStream(gfs); }
};

int level_of(const unsigned char v) {
    return (v * (kLevels - 1) + 127) / 255;
}

} // namespace

Image GifCodec::decode(const std::filesystem::path& path) const {
    const std::vector<unsigned char> data = read_file(path);

    Image image;
    int components = 0;
    std::unique_ptr<unsigned char, StbiFree> pixels(stbi_load_from_memory(
        data.data(), static_cast<int>(data.size()), &image.width, &image.height, &components, 4));
    if (!pixels) {
        Logger::log(LogLevel::Error, std::string("stb_image: ") + stbi_failure_reason() + " (" + path.string() + ")", kTag);
        throw std::runtime_error("GIF decode failed: " + path.string());
    }
    image.channels = 4;
    image.pixels.assign(pixels.get(), pixels.get() + image.stride() * static_cast<size_t>(image.height));
    return image;
}

void GifCodec::encode(const Image& image, const std::filesystem::path& path) const {
    if (image.width > kMaxGifSide || image.height > kMaxGifSide) {
        throw std::runtime_error("Image too large for GIF: " + std::to_string(image.width) + "x" +
                                 std::to_string(image.height));
    }
    const Image rgb = to_rgb(image);

    std::unique_ptr<Gif_Stream, GifStreamDeleter> gfs(Gif_NewStream());
    if (!gfs) throw std::runtime_error("Gif_NewStream failed");
    gfs->screen_width = static_cast<uint16_t>(rgb.width);
    gfs->screen_height = static_cast<uint16_t>(rgb.height);

    constexpr int colors = kLevels * kLevels * kLevels;
    Gif_Colormap* cmap = Gif_NewFullColormap(colors, 256);
    if (!cmap) throw std::runtime_error("Gif_NewFullColormap failed");
    for (int i = 0; i < colors; ++i) {
        Gif_Color& c = cmap->col[i];
        c.gfc_red = static_cast<uint8_t>(i / (kLevels * kLevels) * 255 / (kLevels - 1));
        c.gfc_green = static_cast<uint8_t>(i / kLevels % kLevels * 255 / (kLevels - 1));
        c.gfc_blue = static_cast<uint8_t>(i % kLevels * 255 / (kLevels - 1));
        c.haspixel = 0;
    }
    // the stream releases its global colormap
    cmap->refcount = 1;
    gfs->global = cmap;

    Gif_Image* gfi = Gif_NewImage();
    if (!gfi) throw std::runtime_error("Gif_NewImage failed");
    gfi->width = static_cast<uint16_t>(rgb.width);
    gfi->height = static_cast<uint16_t>(rgb.height);
    if (!Gif_AddImage(gfs.get(), gfi)) {
        Gif_DeleteImage(gfi);
        throw std::runtime_error("Gif_AddImage failed");
    }
    if (!Gif_CreateUncompressedImage(gfi, 0)) {
        throw std::runtime_error("Gif_CreateUncompressedImage failed");
    }

    for (int y = 0; y < rgb.height; ++y) {
        const unsigned char* src = rgb.pixels.data() + static_cast<size_t>(y) * rgb.stride();
        uint8_t* dst = gfi->img[y];
        for (int x = 0; x < rgb.width; ++x, src += 3) {
            dst[x] = static_cast<uint8_t>(level_of(src[0]) * kLevels * kLevels + level_of(src[1]) * kLevels +
                                          level_of(src[2]));
        }
    }

    const unique_FILE out(open_file(path, "wb"));
    if (!out) {
        Logger::log(LogLevel::Error, "Cannot open GIF output: " + path.string(), kTag);
        throw std::runtime_error("Cannot open GIF output: " + path.string());
    }

    Gif_CompressInfo info;
    std::memset(&info, 0, sizeof(info));
    Gif_InitCompressInfo(&info);
    if (!Gif_FullWriteFile(gfs.get(), &info, out.get())) {
        Logger::log(LogLevel::Error, "Gif_FullWriteFile failed for " + path.string(), kTag);
        throw std::runtime_error("Gif_FullWriteFile failed");
    }
}

} // namespace folio
