#include <colourgen/color.hpp>
#include <colourgen/errors.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <unordered_map>

namespace colourgen {

namespace {

struct NamedColor {
    const char* name;
    uint32_t rgb;
};

// CSS Color Module Level 4 / X11 names, lowercase without spaces
constexpr NamedColor NAMED_COLORS[] = {
    {"aliceblue", 0xF0F8FF}, {"antiquewhite", 0xFAEBD7}, {"aqua", 0x00FFFF},
    {"aquamarine", 0x7FFFD4}, {"azure", 0xF0FFFF}, {"beige", 0xF5F5DC},
    {"bisque", 0xFFE4C4}, {"black", 0x000000}, {"blanchedalmond", 0xFFEBCD},
    {"blue", 0x0000FF}, {"blueviolet", 0x8A2BE2}, {"brown", 0xA52A2A},
    {"burlywood", 0xDEB887}, {"cadetblue", 0x5F9EA0}, {"chartreuse", 0x7FFF00},
    {"chocolate", 0xD2691E}, {"coral", 0xFF7F50}, {"cornflowerblue", 0x6495ED},
    {"cornsilk", 0xFFF8DC}, {"crimson", 0xDC143C}, {"cyan", 0x00FFFF},
    {"darkblue", 0x00008B}, {"darkcyan", 0x008B8B}, {"darkgoldenrod", 0xB8860B},
    {"darkgray", 0xA9A9A9}, {"darkgreen", 0x006400}, {"darkgrey", 0xA9A9A9},
    {"darkkhaki", 0xBDB76B}, {"darkmagenta", 0x8B008B}, {"darkolivegreen", 0x556B2F},
    {"darkorange", 0xFF8C00}, {"darkorchid", 0x9932CC}, {"darkred", 0x8B0000},
    {"darksalmon", 0xE9967A}, {"darkseagreen", 0x8FBC8F}, {"darkslateblue", 0x483D8B},
    {"darkslategray", 0x2F4F4F}, {"darkslategrey", 0x2F4F4F}, {"darkturquoise", 0x00CED1},
    {"darkviolet", 0x9400D3}, {"deeppink", 0xFF1493}, {"deepskyblue", 0x00BFFF},
    {"dimgray", 0x696969}, {"dimgrey", 0x696969}, {"dodgerblue", 0x1E90FF},
    {"firebrick", 0xB22222}, {"floralwhite", 0xFFFAF0}, {"forestgreen", 0x228B22},
    {"fuchsia", 0xFF00FF}, {"gainsboro", 0xDCDCDC}, {"ghostwhite", 0xF8F8FF},
    {"gold", 0xFFD700}, {"goldenrod", 0xDAA520}, {"gray", 0x808080},
    {"green", 0x008000}, {"greenyellow", 0xADFF2F}, {"grey", 0x808080},
    {"honeydew", 0xF0FFF0}, {"hotpink", 0xFF69B4}, {"indianred", 0xCD5C5C},
    {"indigo", 0x4B0082}, {"ivory", 0xFFFFF0}, {"khaki", 0xF0E68C},
    {"lavender", 0xE6E6FA}, {"lavenderblush", 0xFFF0F5}, {"lawngreen", 0x7CFC00},
    {"lemonchiffon", 0xFFFACD}, {"lightblue", 0xADD8E6}, {"lightcoral", 0xF08080},
    {"lightcyan", 0xE0FFFF}, {"lightgoldenrodyellow", 0xFAFAD2}, {"lightgray", 0xD3D3D3},
    {"lightgreen", 0x90EE90}, {"lightgrey", 0xD3D3D3}, {"lightpink", 0xFFB6C1},
    {"lightsalmon", 0xFFA07A}, {"lightseagreen", 0x20B2AA}, {"lightskyblue", 0x87CEFA},
    {"lightslategray", 0x778899}, {"lightslategrey", 0x778899}, {"lightsteelblue", 0xB0C4DE},
    {"lightyellow", 0xFFFFE0}, {"lime", 0x00FF00}, {"limegreen", 0x32CD32},
    {"linen", 0xFAF0E6}, {"magenta", 0xFF00FF}, {"maroon", 0x800000},
    {"mediumaquamarine", 0x66CDAA}, {"mediumblue", 0x0000CD}, {"mediumorchid", 0xBA55D3},
    {"mediumpurple", 0x9370DB}, {"mediumseagreen", 0x3CB371}, {"mediumslateblue", 0x7B68EE},
    {"mediumspringgreen", 0x00FA9A}, {"mediumturquoise", 0x48D1CC}, {"mediumvioletred", 0xC71585},
    {"midnightblue", 0x191970}, {"mintcream", 0xF5FFFA}, {"mistyrose", 0xFFE4E1},
    {"moccasin", 0xFFE4B5}, {"navajowhite", 0xFFDEAD}, {"navy", 0x000080},
    {"oldlace", 0xFDF5E6}, {"olive", 0x808000}, {"olivedrab", 0x6B8E23},
    {"orange", 0xFFA500}, {"orangered", 0xFF4500}, {"orchid", 0xDA70D6},
    {"palegoldenrod", 0xEEE8AA}, {"palegreen", 0x98FB98}, {"paleturquoise", 0xAFEEEE},
    {"palevioletred", 0xDB7093}, {"papayawhip", 0xFFEFD5}, {"peachpuff", 0xFFDAB9},
    {"peru", 0xCD853F}, {"pink", 0xFFC0CB}, {"plum", 0xDDA0DD},
    {"powderblue", 0xB0E0E6}, {"purple", 0x800080}, {"rebeccapurple", 0x663399},
    {"red", 0xFF0000}, {"rosybrown", 0xBC8F8F}, {"royalblue", 0x4169E1},
    {"saddlebrown", 0x8B4513}, {"salmon", 0xFA8072}, {"sandybrown", 0xF4A460},
    {"seagreen", 0x2E8B57}, {"seashell", 0xFFF5EE}, {"sienna", 0xA0522D},
    {"silver", 0xC0C0C0}, {"skyblue", 0x87CEEB}, {"slateblue", 0x6A5ACD},
    {"slategray", 0x708090}, {"slategrey", 0x708090}, {"snow", 0xFFFAFA},
    {"springgreen", 0x00FF7F}, {"steelblue", 0x4682B4}, {"tan", 0xD2B48C},
    {"teal", 0x008080}, {"thistle", 0xD8BFD8}, {"tomato", 0xFF6347},
    {"turquoise", 0x40E0D0}, {"violet", 0xEE82EE}, {"wheat", 0xF5DEB3},
    {"white", 0xFFFFFF}, {"whitesmoke", 0xF5F5F5}, {"yellow", 0xFFFF00},
    {"yellowgreen", 0x9ACD32},
};

const std::unordered_map<std::string, uint32_t>& named_color_index() {
    static const std::unordered_map<std::string, uint32_t> index = [] {
        std::unordered_map<std::string, uint32_t> m;
        for (const auto& entry : NAMED_COLORS) {
            m.emplace(entry.name, entry.rgb);
        }
        return m;
    }();
    return index;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

uint8_t to_byte(double unit) {
    double clamped = std::clamp(unit, 0.0, 1.0);
    return static_cast<uint8_t>(std::floor(clamped * 255.0 + 0.5));
}

} // namespace

std::string Color::hex() const {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%02X%02X%02X", r, g, b);
    return std::string(buffer);
}

double Color::luminance() const {
    return (0.2126 * r + 0.7152 * g + 0.0722 * b) / 255.0;
}

std::optional<Color> Color::parse(std::string_view text) {
    // Trim surrounding whitespace
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    if (text.front() == '#') {
        std::string_view digits = text.substr(1);
        for (char c : digits) {
            if (hex_digit(c) < 0) {
                return std::nullopt;
            }
        }
        if (digits.size() == 6 || digits.size() == 8) {
            return Color(static_cast<uint8_t>(hex_digit(digits[0]) * 16 + hex_digit(digits[1])),
                         static_cast<uint8_t>(hex_digit(digits[2]) * 16 + hex_digit(digits[3])),
                         static_cast<uint8_t>(hex_digit(digits[4]) * 16 + hex_digit(digits[5])));
        }
        if (digits.size() == 3) {
            return Color(static_cast<uint8_t>(hex_digit(digits[0]) * 17),
                         static_cast<uint8_t>(hex_digit(digits[1]) * 17),
                         static_cast<uint8_t>(hex_digit(digits[2]) * 17));
        }
        return std::nullopt;
    }

    std::string key;
    key.reserve(text.size());
    for (char c : text) {
        if (c == ' ') continue;
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    const auto& index = named_color_index();
    auto it = index.find(key);
    if (it == index.end()) {
        return std::nullopt;
    }
    uint32_t rgb = it->second;
    return Color(static_cast<uint8_t>((rgb >> 16) & 0xFF),
                 static_cast<uint8_t>((rgb >> 8) & 0xFF),
                 static_cast<uint8_t>(rgb & 0xFF));
}

Color Color::from_unit(double r, double g, double b) {
    return Color(to_byte(r), to_byte(g), to_byte(b));
}

Color Color::from_hsv(double h, double s, double v) {
    h = std::clamp(h, 0.0, 1.0);
    s = std::clamp(s, 0.0, 1.0);
    v = std::clamp(v, 0.0, 1.0);

    // Same sextant decomposition as grDevices hsv2rgb
    double t = 6.0 * std::fmod(h, 1.0);
    int i = static_cast<int>(std::floor(t));
    double f = t - i;
    double p = v * (1.0 - s);
    double q = v * (1.0 - s * f);
    double u = v * (1.0 - s * (1.0 - f));

    switch (i) {
        case 0: return from_unit(v, u, p);
        case 1: return from_unit(q, v, p);
        case 2: return from_unit(p, v, u);
        case 3: return from_unit(p, q, v);
        case 4: return from_unit(u, p, v);
        default: return from_unit(v, p, q);
    }
}

std::optional<std::string> normalize_hex(std::string_view text) {
    auto color = Color::parse(text);
    if (!color) {
        return std::nullopt;
    }
    return color->hex();
}

std::vector<std::string> to_hex_strings(const std::vector<Color>& colors) {
    std::vector<std::string> result;
    result.reserve(colors.size());
    for (const auto& c : colors) {
        result.push_back(c.hex());
    }
    return result;
}

ColorFunction make_linear_ramp(std::vector<Color> anchors) {
    if (anchors.empty()) {
        throw std::invalid_argument("Colour ramp needs at least one anchor");
    }
    return [anchors = std::move(anchors)](double t) -> Color {
        if (anchors.size() == 1) {
            return anchors.front();
        }
        t = std::clamp(t, 0.0, 1.0);
        const double segments = static_cast<double>(anchors.size() - 1);
        double position = t * segments;
        std::size_t index = static_cast<std::size_t>(std::floor(position));
        if (index >= anchors.size() - 1) {
            return anchors.back();
        }
        double f = position - static_cast<double>(index);
        const Color& a = anchors[index];
        const Color& b = anchors[index + 1];
        return Color::from_unit((a.r + f * (b.r - a.r)) / 255.0,
                                (a.g + f * (b.g - a.g)) / 255.0,
                                (a.b + f * (b.b - a.b)) / 255.0);
    };
}

ColorFunction make_linear_ramp(const std::vector<std::string>& anchors) {
    std::vector<Color> parsed;
    parsed.reserve(anchors.size());
    for (const auto& text : anchors) {
        auto color = Color::parse(text);
        if (!color) {
            throw MalformedSourceError("Invalid colour specification '" + text + "'");
        }
        parsed.push_back(*color);
    }
    if (parsed.empty()) {
        throw MalformedSourceError("Colour list is empty");
    }
    return make_linear_ramp(std::move(parsed));
}

} // namespace colourgen
