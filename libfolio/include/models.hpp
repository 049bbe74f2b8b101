//
// Created by Giuseppe Francione on 11/02/26.
//

/**
 * @file models.hpp
 * @brief Plain result and option types of the inspection and rendering operations.
 */

#ifndef FOLIO_MODELS_HPP
#define FOLIO_MODELS_HPP

#include "page_range.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio {

struct PdfInfo {
    int pages = 0;
    std::string author;
    std::string creation_date;
    std::string creator;
    std::string keywords;
    std::string producer;
    std::string modified_date;
    std::string subject;
    std::string title;
    int version = 0; ///< 1.7 -> 17
    std::string trapped;
};

struct Attachment {
    std::string name;
    std::string mime_type;
    std::size_t size = 0;
    std::string creation_date;     ///< raw PDF date string, empty when absent
    std::string modification_date;
    std::string description;
};

struct FormField {
    int page = 0; ///< 1-based
    std::string name;
    std::string type;
    std::string value;
    std::string rect; ///< "l,b,r,t"
};

struct TextRect {
    double left = 0;
    double top = 0;
    double right = 0;
    double bottom = 0;
};

struct PageText {
    int page = 0; ///< 1-based
    int characters = 0;
    int words_count = 0;
    std::string text; ///< UTF-8
    std::vector<TextRect> rects;
};

struct PageObject {
    int page = 0; ///< 1-based
    int index = 0; ///< 0-based position on its page
    std::string type; ///< e.g. "Text (1)"
    float left = 0;
    float bottom = 0;
    float right = 0;
    float top = 0;
};

struct Rgb {
    std::uint8_t r = 255;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

/**
 * @brief Parses an "R,G,B" color with components in 0..255.
 * @throws ValidationError on any other shape.
 */
Rgb parse_color(std::string_view spec);

struct WatermarkOptions {
    std::optional<std::string> text;
    std::optional<std::filesystem::path> image;
    std::string font = "Helvetica";
    double font_size = 50;
    std::uint8_t opacity = 50;
    double rotation = 45; ///< degrees
    double scale = 1.0;   ///< image only
    Rgb color;
};

struct ConvertOptions {
    int dpi = 200;
    std::string encoder = ".jpg";  ///< codec extension
    std::filesystem::path output_dir; ///< empty: the input's directory
    std::string name_template;        ///< naming template, empty: original stem
    PageRange range;
};

inline constexpr int kMinDpi = 1;
inline constexpr int kMaxDpi = 2400;

} // namespace folio

#endif // FOLIO_MODELS_HPP
