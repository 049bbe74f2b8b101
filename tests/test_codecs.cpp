//
// Created by Giuseppe Francione on 18/02/26.
//

#include "../libfolio/include/codec_registry.hpp"
#include "../libfolio/include/errors.hpp"
#include "../libfolio/include/image_to_pdf.hpp"
#include "pdf_fixtures.hpp"
#include <gtest/gtest.h>
#include <fstream>

using namespace folio;
using namespace folio::fakes;

namespace {

// horizontal red to blue gradient
Image gradient(const int width, const int height, const int channels) {
    Image img;
    img.width = width;
    img.height = height;
    img.channels = channels;
    img.pixels.resize(img.stride() * static_cast<std::size_t>(height));
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            unsigned char* px = img.pixels.data() + static_cast<std::size_t>(y) * img.stride() +
                                static_cast<std::size_t>(x) * channels;
            px[0] = static_cast<unsigned char>(255 - x * 255 / (width - 1));
            px[1] = 0;
            px[2] = static_cast<unsigned char>(x * 255 / (width - 1));
            if (channels == 4) px[3] = 255;
        }
    }
    return img;
}

} // namespace

TEST(CodecRegistryTest, LooksUpByExtensionCaseInsensitive) {
    const CodecRegistry registry;
    ASSERT_NE(registry.find_by_extension(".png"), nullptr);
    EXPECT_EQ(registry.find_by_extension(".png")->get_name(), "PNG");
    EXPECT_EQ(registry.find_by_extension("PNG"), registry.find_by_extension(".png"));
    EXPECT_EQ(registry.find_by_extension(".JPEG")->get_name(), "JPEG");
    EXPECT_EQ(registry.find_by_extension("jpg"), registry.find_by_extension(".jpe"));
    EXPECT_EQ(registry.find_by_extension(".tif")->get_name(), "TIFF");
    EXPECT_EQ(registry.find_by_extension(".webp")->get_name(), "WebP");
    EXPECT_EQ(registry.find_by_extension(".gif")->get_name(), "GIF");
    EXPECT_EQ(registry.find_by_extension(".dib")->get_name(), "BMP");
}

TEST(CodecRegistryTest, UnknownExtensions) {
    const CodecRegistry registry;
    EXPECT_EQ(registry.find_by_extension(""), nullptr);
    EXPECT_EQ(registry.find_by_extension("."), nullptr);
    EXPECT_EQ(registry.find_by_extension(".xcf"), nullptr);
    EXPECT_THROW((void) registry.require(".xcf"), ValidationError);
    EXPECT_EQ(registry.all().size(), 6u);
}

TEST(ImageTest, ToRgbCompositesOverWhite) {
    Image rgba;
    rgba.width = 2;
    rgba.height = 1;
    rgba.channels = 4;
    rgba.pixels = {0, 0, 0, 0, 10, 20, 30, 255};
    const Image rgb = to_rgb(rgba);
    EXPECT_EQ(rgb.channels, 3);
    EXPECT_EQ(rgb.pixels, (std::vector<unsigned char>{255, 255, 255, 10, 20, 30}));
}

TEST(ImageTest, ToBgraSwapsChannels) {
    Image rgb;
    rgb.width = 1;
    rgb.height = 1;
    rgb.pixels = {1, 2, 3};
    EXPECT_EQ(to_bgra(rgb), (std::vector<unsigned char>{3, 2, 1, 255}));
}

class CodecFileTest : public ::testing::Test {
protected:
    TempDir dir{"folio_codecs"};
    CodecRegistry registry;
};

TEST_F(CodecFileTest, PngIsLossless) {
    const Image img = gradient(16, 8, 4);
    const auto path = dir / "g.png";
    registry.require(".png").encode(img, path);
    const Image back = registry.require(".png").decode(path);
    EXPECT_EQ(back.width, 16);
    EXPECT_EQ(back.height, 8);
    EXPECT_EQ(to_rgb(back).pixels, to_rgb(img).pixels);
}

TEST_F(CodecFileTest, LossyAndPalettedFormatsKeepDimensions) {
    const Image img = gradient(24, 10, 3);
    for (const char* ext : {".jpg", ".webp", ".gif", ".tiff", ".bmp"}) {
        const auto path = dir / (std::string("g") + ext);
        const IImageCodec& codec = registry.require(ext);
        codec.encode(img, path);
        const Image back = codec.decode(path);
        EXPECT_EQ(back.width, 24) << ext;
        EXPECT_EQ(back.height, 10) << ext;
        EXPECT_TRUE(back.channels == 3 || back.channels == 4) << ext;
    }
}

TEST_F(CodecFileTest, DecodingGarbageThrows) {
    const auto path = dir / "bad.png";
    std::ofstream(path) << "not an image";
    EXPECT_THROW((void) registry.require(".png").decode(path), std::runtime_error);
}

TEST_F(CodecFileTest, ImageToPdfUsesPixelSizeAsMediaBox) {
    const auto png = dir / "photo.png";
    registry.require(".png").encode(gradient(40, 30, 3), png);

    FileArtifactSink sink;
    const auto written = image_to_pdf(ImageToPdfRequest{png, {}}, registry, sink);
    EXPECT_EQ(written, dir / "photo.pdf");
    EXPECT_EQ(page_widths(written), (std::vector<int>{40}));

    QPDF pdf;
    pdf.processFile(written.string().c_str());
    auto pages = QPDFPageDocumentHelper(pdf).getAllPages();
    ASSERT_EQ(pages.size(), 1u);
    const auto box = pages[0].getMediaBox().getArrayAsRectangle();
    EXPECT_DOUBLE_EQ(box.ury - box.lly, 30.0);
    EXPECT_EQ(pages[0].getImages().size(), 1u);
}

TEST_F(CodecFileTest, ImageToPdfRejectsUnknownFormatAndMissingFile) {
    FileArtifactSink sink;
    const auto odd = dir / "picture.xcf";
    std::ofstream(odd) << "x";
    EXPECT_THROW(image_to_pdf(ImageToPdfRequest{odd, {}}, registry, sink), ValidationError);
    EXPECT_THROW(image_to_pdf(ImageToPdfRequest{dir / "none.png", {}}, registry, sink), ValidationError);
}
