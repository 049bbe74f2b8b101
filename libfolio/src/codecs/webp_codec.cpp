//
// Created by Giuseppe Francione on 13/02/26.
//

#include "../../include/webp_codec.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <webp/encode.h>
#include <stdexcept>
#include <string>

namespace folio {

namespace {

constexpr auto kTag = "webp_codec";
constexpr float kWebpQuality = 90.0f;

} // namespace

Image WebpCodec::decode(const std::filesystem::path& path) const {
    const std::vector<unsigned char> data = read_file(path);

    WebPBitstreamFeatures features;
    if (WebPGetFeatures(data.data(), data.size(), &features) != VP8_STATUS_OK) {
        Logger::log(LogLevel::Error, "WebP feature detection failed for: " + path.string(), kTag);
        throw std::runtime_error("WebP feature detection failed: " + path.string());
    }

    Image image;
    image.channels = features.has_alpha ? 4 : 3;
    uint8_t* decoded = features.has_alpha
        ? WebPDecodeRGBA(data.data(), data.size(), &image.width, &image.height)
        : WebPDecodeRGB(data.data(), data.size(), &image.width, &image.height);
    if (!decoded) {
        Logger::log(LogLevel::Error, "WebP decode failed for: " + path.string(), kTag);
        throw std::runtime_error("WebP decode failed: " + path.string());
    }
    image.pixels.assign(decoded, decoded + image.stride() * static_cast<size_t>(image.height));
    WebPFree(decoded);
    return image;
}

void WebpCodec::encode(const Image& image, const std::filesystem::path& path) const {
    WebPConfig config;
    if (!WebPConfigInit(&config)) {
        throw std::runtime_error("WebPConfigInit failed");
    }
    config.quality = kWebpQuality;

    WebPPicture picture;
    if (!WebPPictureInit(&picture)) {
        throw std::runtime_error("WebPPictureInit failed");
    }
    picture.use_argb = 1;
    picture.width = image.width;
    picture.height = image.height;
    const int stride = static_cast<int>(image.stride());
    const int imported = image.has_alpha()
        ? WebPPictureImportRGBA(&picture, image.pixels.data(), stride)
        : WebPPictureImportRGB(&picture, image.pixels.data(), stride);
    if (!imported) {
        WebPPictureFree(&picture);
        throw std::runtime_error("WebPPictureImport failed");
    }

    WebPMemoryWriter writer;
    WebPMemoryWriterInit(&writer);
    picture.writer = WebPMemoryWrite;
    picture.custom_ptr = &writer;

    if (!WebPEncode(&config, &picture)) {
        const int error = picture.error_code;
        WebPPictureFree(&picture);
        WebPMemoryWriterClear(&writer);
        Logger::log(LogLevel::Error, "WebPEncode failed with code " + std::to_string(error), kTag);
        throw std::runtime_error("WebPEncode failed");
    }
    WebPPictureFree(&picture);

    const std::vector<unsigned char> bytes(writer.mem, writer.mem + writer.size);
    WebPMemoryWriterClear(&writer);
    write_file(path, bytes);
}

} // namespace folio
