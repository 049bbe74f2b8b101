//
// Created by Giuseppe Francione on 17/02/26.
//

#include "../../include/models.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <charconv>
#include <system_error>

namespace folio {

Rgb parse_color(const std::string_view spec) {
    int parts[3] = {};
    std::size_t count = 0;
    std::size_t pos = 0;
    bool ok = true;
    while (ok) {
        const auto comma = spec.find(',', pos);
        auto token = spec.substr(pos, comma == std::string_view::npos ? std::string_view::npos : comma - pos);
        while (!token.empty() && token.front() == ' ') token.remove_prefix(1);
        while (!token.empty() && token.back() == ' ') token.remove_suffix(1);

        int value = -1;
        const auto [end, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        ok = count < 3 && !token.empty() && ec == std::errc() && end == token.data() + token.size() &&
             value >= 0 && value <= 255;
        if (ok) parts[count++] = value;
        if (comma == std::string_view::npos) break;
        pos = comma + 1;
    }
    if (!ok || count != 3) {
        Logger::log(LogLevel::Error, "Invalid color: " + std::string(spec), "watermark");
        throw ValidationError("color must be in R,G,B format with components 0-255: " + std::string(spec));
    }
    return Rgb{static_cast<std::uint8_t>(parts[0]), static_cast<std::uint8_t>(parts[1]),
               static_cast<std::uint8_t>(parts[2])};
}

} // namespace folio
