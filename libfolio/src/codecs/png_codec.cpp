//
// Created by Giuseppe Francione on 12/02/26.
//

#include "../../include/png_codec.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <zlib.h>
#include <csetjmp>
#include <stdexcept>
#include <string>
#include <vector>

namespace folio {

namespace {

constexpr auto kTag = "png_codec";

/**
 * @brief libpng error handler that throws a C++ exception.
 */
void png_error_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Error, std::string("libpng: ") + msg, "libpng");
    throw std::runtime_error(msg);
}

void png_warning_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
}

/**
 * @brief RAII wrapper for libpng read structs.
 */
struct PngRead {
    png_structp png = nullptr;
    png_infop info = nullptr;

    ~PngRead() {
        if (png || info) png_destroy_read_struct(&png, &info, nullptr);
    }
};

/**
 * @brief RAII wrapper for libpng write structs.
 */
struct PngWrite {
    png_structp png = nullptr;
    png_infop info = nullptr;

    ~PngWrite() {
        if (png || info) png_destroy_write_struct(&png, &info);
    }
};

} // namespace

Image PngCodec::decode(const std::filesystem::path& path) const {
    const unique_FILE fp(open_file(path, "rb"));
    if (!fp) {
        Logger::log(LogLevel::Error, "Cannot open PNG input: " + path.string(), kTag);
        throw std::runtime_error("Cannot open PNG input: " + path.string());
    }

    PngRead rd;
    rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
    if (!rd.png) throw std::runtime_error("png_create_read_struct failed");
    rd.info = png_create_info_struct(rd.png);
    if (!rd.info) throw std::runtime_error("png_create_info_struct failed");
    if (setjmp(png_jmpbuf(rd.png))) throw std::runtime_error("libpng read error");

    png_init_io(rd.png, fp.get());
    png_read_info(rd.png, rd.info);

    png_uint_32 width = 0, height = 0;
    int bit_depth = 0, color_type = 0;
    png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

    // normalize everything to 8-bit RGB or RGBA
    if (bit_depth == 16) png_set_strip_16(rd.png);
    if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(rd.png);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(rd.png);
    const bool has_trns = png_get_valid(rd.png, rd.info, PNG_INFO_tRNS) != 0;
    if (has_trns) png_set_tRNS_to_alpha(rd.png);
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(rd.png);
    png_set_interlace_handling(rd.png);
    png_read_update_info(rd.png, rd.info);

    Image image;
    image.width = static_cast<int>(width);
    image.height = static_cast<int>(height);
    image.channels = static_cast<int>(png_get_channels(rd.png, rd.info));
    if (image.channels != 3 && image.channels != 4) {
        throw std::runtime_error("Unexpected PNG channel count " + std::to_string(image.channels));
    }

    const size_t rowbytes = png_get_rowbytes(rd.png, rd.info);
    if (rowbytes != image.stride()) {
        throw std::runtime_error("Rowbytes mismatch, expected 8-bit samples");
    }
    image.pixels.resize(rowbytes * height);
    std::vector<png_bytep> rows(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        rows[y] = image.pixels.data() + y * rowbytes;
    }
    png_read_image(rd.png, rows.data());
    png_read_end(rd.png, nullptr);

    Logger::log(LogLevel::Debug, "Decoded PNG " + std::to_string(width) + "x" + std::to_string(height) +
                " from " + path.string(), kTag);
    return image;
}

void PngCodec::encode(const Image& image, const std::filesystem::path& path) const {
    const unique_FILE fp(open_file(path, "wb"));
    if (!fp) {
        Logger::log(LogLevel::Error, "Cannot open PNG output: " + path.string(), kTag);
        throw std::runtime_error("Cannot open PNG output: " + path.string());
    }

    PngWrite wr;
    wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
    if (!wr.png) throw std::runtime_error("png_create_write_struct failed");
    wr.info = png_create_info_struct(wr.png);
    if (!wr.info) throw std::runtime_error("png_create_info_struct failed");
    if (setjmp(png_jmpbuf(wr.png))) throw std::runtime_error("libpng write error");

    png_init_io(wr.png, fp.get());
    png_set_compression_level(wr.png, Z_DEFAULT_COMPRESSION);
    png_set_compression_strategy(wr.png, Z_DEFAULT_STRATEGY);
    png_set_filter(wr.png, PNG_FILTER_TYPE_BASE, PNG_ALL_FILTERS);

    png_set_IHDR(wr.png, wr.info,
                 static_cast<png_uint_32>(image.width), static_cast<png_uint_32>(image.height), 8,
                 image.has_alpha() ? PNG_COLOR_TYPE_RGBA : PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
    png_write_info(wr.png, wr.info);

    const auto* row = image.pixels.data();
    for (int y = 0; y < image.height; ++y) {
        png_write_row(wr.png, row);
        row += image.stride();
    }
    png_write_end(wr.png, nullptr);

    if (std::fflush(fp.get()) != 0) {
        throw std::runtime_error("Cannot flush PNG output: " + path.string());
    }
}

} // namespace folio
