//
// Created by Giuseppe Francione on 12/02/26.
//

#include "../../include/jpeg_codec.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <jpeglib.h>
#include <stdexcept>
#include <string>

namespace {

constexpr auto kTag = "jpeg_codec";
constexpr int kJpegQuality = 90;

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorMgr*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    folio::Logger::log(folio::LogLevel::Warning, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw std::runtime_error(err->msg);
}

struct Decompress {
    jpeg_decompress_struct cinfo{};
    JpegErrorMgr err{};

    Decompress() {
        cinfo.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_error_exit_throw;
        jpeg_create_decompress(&cinfo);
    }
    ~Decompress() { jpeg_destroy_decompress(&cinfo); }

    Decompress(const Decompress&) = delete;
    Decompress& operator=(const Decompress&) = delete;
};

struct Compress {
    jpeg_compress_struct cinfo{};
    JpegErrorMgr err{};

    Compress() {
        cinfo.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_error_exit_throw;
        jpeg_create_compress(&cinfo);
    }
    ~Compress() { jpeg_destroy_compress(&cinfo); }

    Compress(const Compress&) = delete;
    Compress& operator=(const Compress&) = delete;
};

} // namespace

namespace folio {

Image JpegCodec::decode(const std::filesystem::path& path) const {
    const unique_FILE infile(open_file(path, "rb"));
    if (!infile) {
        Logger::log(LogLevel::Error, "Cannot open JPEG input: " + path.string(), kTag);
        throw std::runtime_error("Cannot open JPEG input: " + path.string());
    }

    Decompress d;
    jpeg_stdio_src(&d.cinfo, infile.get());
    if (jpeg_read_header(&d.cinfo, TRUE) != JPEG_HEADER_OK) {
        throw std::runtime_error("Invalid JPEG header: " + path.string());
    }
    if (d.cinfo.num_components == 4) {
        throw std::runtime_error("CMYK JPEG is not supported: " + path.string());
    }
    d.cinfo.out_color_space = JCS_RGB;
    jpeg_start_decompress(&d.cinfo);

    Image image;
    image.width = static_cast<int>(d.cinfo.output_width);
    image.height = static_cast<int>(d.cinfo.output_height);
    image.channels = 3;
    image.pixels.resize(image.stride() * static_cast<size_t>(image.height));

    unsigned char* row_ptr = image.pixels.data();
    while (d.cinfo.output_scanline < d.cinfo.output_height) {
        jpeg_read_scanlines(&d.cinfo, &row_ptr, 1);
        row_ptr += image.stride();
    }
    jpeg_finish_decompress(&d.cinfo);

    Logger::log(LogLevel::Debug, "Decoded JPEG " + std::to_string(image.width) + "x" +
                std::to_string(image.height) + " from " + path.string(), kTag);
    return image;
}

void JpegCodec::encode(const Image& image, const std::filesystem::path& path) const {
    const Image rgb = to_rgb(image);

    const unique_FILE outfile(open_file(path, "wb"));
    if (!outfile) {
        Logger::log(LogLevel::Error, "Cannot open JPEG output: " + path.string(), kTag);
        throw std::runtime_error("Cannot open JPEG output: " + path.string());
    }

    Compress c;
    jpeg_stdio_dest(&c.cinfo, outfile.get());
    c.cinfo.image_width = static_cast<JDIMENSION>(rgb.width);
    c.cinfo.image_height = static_cast<JDIMENSION>(rgb.height);
    c.cinfo.input_components = 3;
    c.cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&c.cinfo);
    jpeg_set_quality(&c.cinfo, kJpegQuality, TRUE);
    c.cinfo.optimize_coding = TRUE;

    jpeg_start_compress(&c.cinfo, TRUE);
    while (c.cinfo.next_scanline < c.cinfo.image_height) {
        auto* row = const_cast<JSAMPLE*>(rgb.pixels.data() + c.cinfo.next_scanline * rgb.stride());
        jpeg_write_scanlines(&c.cinfo, &row, 1);
    }
    jpeg_finish_compress(&c.cinfo);

    // explicitly flush stdio buffer to disk before returning
    if (std::fflush(outfile.get()) != 0) {
        throw std::runtime_error("Cannot flush JPEG output: " + path.string());
    }
}

} // namespace folio
