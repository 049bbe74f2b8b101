//
// Created by Giuseppe Francione on 13/02/26.
//

#include "../../include/bmp_codec.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

extern "C" {
#include "bmplib.h"
}

namespace {

constexpr auto kTag = "bmp_codec";

// Helper to convert bmplib result codes to readable strings
std::string bmplib_result_to_string(const BMPRESULT res) {
    switch (res) {
        case BMP_RESULT_OK:        return "OK";
        case BMP_RESULT_INVALID:   return "Invalid pixel data";
        case BMP_RESULT_TRUNCATED: return "File truncated";
        case BMP_RESULT_INSANE:    return "Image dimensions too large (sanity check failed)";
        case BMP_RESULT_PNG:       return "Embedded PNG (unsupported)";
        case BMP_RESULT_JPEG:      return "Embedded JPEG (unsupported)";
        case BMP_RESULT_ERROR:     return "Generic error";
        case BMP_RESULT_ARRAY:     return "OS/2 Bitmap Array (unsupported)";
        default:                   return "Unknown result code (" + std::to_string(res) + ")";
    }
}

std::string describe(BMPHANDLE h, const BMPRESULT res) {
    std::string err = bmp_errmsg(h);
    return err.empty() ? bmplib_result_to_string(res) : err;
}

// RAII wrapper for bmphandle and its file
struct ScopedBmp {
    BMPHANDLE h = nullptr;
    folio::unique_FILE f;

    ScopedBmp(const std::filesystem::path& path, const char* mode) : f(folio::open_file(path, mode)) {}

    ~ScopedBmp() {
        if (h) bmp_free(h);
    }

    ScopedBmp(const ScopedBmp&) = delete;
    ScopedBmp& operator=(const ScopedBmp&) = delete;
};

} // namespace

namespace folio {

Image BmpCodec::decode(const std::filesystem::path& path) const {
    ScopedBmp in(path, "rb");
    if (!in.f) {
        Logger::log(LogLevel::Error, "Failed to open input BMP: " + path.string(), kTag);
        throw std::runtime_error("Cannot open BMP input: " + path.string());
    }
    in.h = bmpread_new(in.f.get());
    if (!in.h) throw std::runtime_error("bmpread_new failed");

    BMPRESULT res = bmpread_load_info(in.h);
    if (res != BMP_RESULT_OK) {
        const std::string err = describe(in.h, res);
        Logger::log(LogLevel::Error, "Bmplib read error: " + err, kTag);
        throw std::runtime_error("BMP read failed: " + err);
    }

    int width = 0, height = 0, channels = 0, bits = 0;
    // indexed images come back as RGB when no palette is requested
    bmpread_dimensions(in.h, &width, &height, &channels, &bits, nullptr);
    if (bits != 8 || (channels != 3 && channels != 4)) {
        throw std::runtime_error("Unsupported BMP layout: " + std::to_string(channels) + " channels, " +
                                 std::to_string(bits) + " bits");
    }

    Image image;
    image.width = width;
    image.height = height;
    image.channels = channels;
    image.pixels.resize(bmpread_buffersize(in.h));
    unsigned char* buffer = image.pixels.data();
    res = bmpread_load_image(in.h, &buffer);
    if (res != BMP_RESULT_OK && res != BMP_RESULT_TRUNCATED && res != BMP_RESULT_INVALID) {
        const std::string err = describe(in.h, res);
        Logger::log(LogLevel::Error, "Failed to load image data: " + err, kTag);
        throw std::runtime_error("BMP read failed: " + err);
    }
    if (res != BMP_RESULT_OK) {
        Logger::log(LogLevel::Warning, path.string() + ": " + describe(in.h, res), kTag);
    }
    return image;
}

void BmpCodec::encode(const Image& image, const std::filesystem::path& path) const {
    ScopedBmp out(path, "wb");
    if (!out.f) {
        Logger::log(LogLevel::Error, "Failed to open output BMP: " + path.string(), kTag);
        throw std::runtime_error("Cannot open BMP output: " + path.string());
    }
    out.h = bmpwrite_new(out.f.get());
    if (!out.h) throw std::runtime_error("bmpwrite_new failed");

    bmpwrite_set_dimensions(out.h, image.width, image.height, image.channels, 8);
    if (bmpwrite_save_image(out.h, image.pixels.data()) != BMP_RESULT_OK) {
        const std::string err = bmp_errmsg(out.h);
        Logger::log(LogLevel::Error, "Bmplib write error: " + err, kTag);
        throw std::runtime_error("BMP write failed: " + err);
    }
}

} // namespace folio
