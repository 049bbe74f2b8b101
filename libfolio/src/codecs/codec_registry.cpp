//
// Created by Giuseppe Francione on 13/02/26.
//

#include "../../include/codec_registry.hpp"
#include "../../include/bmp_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/gif_codec.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/png_codec.hpp"
#include "../../include/tiff_codec.hpp"
#include "../../include/webp_codec.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace folio {

CodecRegistry::CodecRegistry() {
    codecs_.push_back(std::make_unique<JpegCodec>());
    codecs_.push_back(std::make_unique<PngCodec>());
    codecs_.push_back(std::make_unique<WebpCodec>());
    codecs_.push_back(std::make_unique<TiffCodec>());
    codecs_.push_back(std::make_unique<GifCodec>());
    codecs_.push_back(std::make_unique<BmpCodec>());
}

const IImageCodec* CodecRegistry::find_by_extension(std::string_view ext) const {
    if (!ext.empty() && ext.front() == '.') {
        ext.remove_prefix(1);
    }
    if (ext.empty()) return nullptr;

    auto iequals = [](const std::string_view s1, const std::string_view s2) {
        return std::equal(s1.begin(), s1.end(), s2.begin(), s2.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    };

    for (const auto& codec : codecs_) {
        for (const auto supported : codec->get_supported_extensions()) {
            if (iequals(supported.substr(1), ext)) {
                return codec.get();
            }
        }
    }
    return nullptr;
}

const IImageCodec& CodecRegistry::require(const std::string_view ext) const {
    const IImageCodec* codec = find_by_extension(ext);
    if (!codec) {
        throw ValidationError("unsupported image format: " + std::string(ext));
    }
    return *codec;
}

} // namespace folio
