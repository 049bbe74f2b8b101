//
// Created by Giuseppe Francione on 13/02/26.
//

#include "../../include/tiff_codec.hpp"
#include "../../include/logger.hpp"
#include <tiffio.h>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace folio {

namespace {

constexpr auto kTag = "tiff_codec";

struct TiffCloser {
    void operator()(TIFF* t) const { if (t) TIFFClose(t); }
};
using unique_TIFF = std::unique_ptr<TIFF, TiffCloser>;

unique_TIFF open_tiff(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
    unique_TIFF t(TIFFOpenW(path.wstring().c_str(), mode));
#else
    unique_TIFF t(TIFFOpen(path.string().c_str(), mode));
#endif
    if (!t) {
        Logger::log(LogLevel::Error, "Failed to open TIFF: " + path.string(), kTag);
        throw std::runtime_error("Cannot open TIFF: " + path.string());
    }
    return t;
}

} // namespace

Image TiffCodec::decode(const std::filesystem::path& path) const {
    const unique_TIFF in = open_tiff(path, "r");

    uint32_t width = 0, height = 0;
    TIFFGetField(in.get(), TIFFTAG_IMAGEWIDTH, &width);
    TIFFGetField(in.get(), TIFFTAG_IMAGELENGTH, &height);
    if (width == 0 || height == 0) {
        throw std::runtime_error("Empty TIFF image: " + path.string());
    }

    std::vector<uint32_t> raster(static_cast<size_t>(width) * height);
    // read full image into raw rgba buffer, handles decompression
    if (!TIFFReadRGBAImageOriented(in.get(), width, height, raster.data(), ORIENTATION_TOPLEFT, 0)) {
        Logger::log(LogLevel::Error, "Failed to read TIFF image data: " + path.string(), kTag);
        throw std::runtime_error("TIFFReadRGBAImageOriented failed: " + path.string());
    }

    Image image;
    image.width = static_cast<int>(width);
    image.height = static_cast<int>(height);
    image.channels = 4;
    image.pixels.resize(raster.size() * 4);
    unsigned char* dst = image.pixels.data();
    for (const uint32_t px : raster) {
        dst[0] = static_cast<unsigned char>(TIFFGetR(px));
        dst[1] = static_cast<unsigned char>(TIFFGetG(px));
        dst[2] = static_cast<unsigned char>(TIFFGetB(px));
        dst[3] = static_cast<unsigned char>(TIFFGetA(px));
        dst += 4;
    }
    return image;
}

void TiffCodec::encode(const Image& image, const std::filesystem::path& path) const {
    const unique_TIFF out = open_tiff(path, "w");

    TIFFSetField(out.get(), TIFFTAG_IMAGEWIDTH, static_cast<uint32_t>(image.width));
    TIFFSetField(out.get(), TIFFTAG_IMAGELENGTH, static_cast<uint32_t>(image.height));
    TIFFSetField(out.get(), TIFFTAG_SAMPLESPERPIXEL, image.channels);
    TIFFSetField(out.get(), TIFFTAG_BITSPERSAMPLE, 8);
    TIFFSetField(out.get(), TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_RGB);
    TIFFSetField(out.get(), TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
    TIFFSetField(out.get(), TIFFTAG_ORIENTATION, ORIENTATION_TOPLEFT);
    TIFFSetField(out.get(), TIFFTAG_COMPRESSION, COMPRESSION_ADOBE_DEFLATE);
    TIFFSetField(out.get(), TIFFTAG_PREDICTOR, 2);
    TIFFSetField(out.get(), TIFFTAG_ROWSPERSTRIP, TIFFDefaultStripSize(out.get(), 0));
    if (image.has_alpha()) {
        unsigned short extra_samples = EXTRASAMPLE_UNASSALPHA;
        TIFFSetField(out.get(), TIFFTAG_EXTRASAMPLES, 1, &extra_samples);
    }

    std::vector<unsigned char> row(image.stride());
    for (int y = 0; y < image.height; ++y) {
        // libtiff may modify the buffer it is handed
        const auto* src = image.pixels.data() + static_cast<size_t>(y) * image.stride();
        std::copy(src, src + image.stride(), row.begin());
        if (TIFFWriteScanline(out.get(), row.data(), static_cast<uint32_t>(y), 0) < 0) {
            Logger::log(LogLevel::Error, "Failed to write TIFF scanline for: " + path.string(), kTag);
            throw std::runtime_error("TIFF write scanline failed: " + path.string());
        }
    }
    if (!TIFFWriteDirectory(out.get())) {
        Logger::log(LogLevel::Error, "Failed to write TIFF directory for: " + path.string(), kTag);
        throw std::runtime_error("TIFF write directory failed: " + path.string());
    }
}

} // namespace folio
