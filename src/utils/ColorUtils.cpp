#include "ColorUtils.hpp"

#include <algorithm>  // For std::min, std::max
#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "StringUtils.hpp"

namespace color_utils
{

namespace
{
uint32_t ClampChannel(double value)
{
    return static_cast<uint32_t>(std::lround(std::min(std::max(value, 0.0), 255.0)));
}

uint32_t ParseHexPair(const std::string& css, const std::string& hex, size_t offset)
{
    size_t consumed = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(hex.substr(offset, 2), &consumed, 16);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Unable to parse CSS color string " + css);
    }
    if (consumed != 2) {
        throw std::invalid_argument("Unable to parse CSS color string " + css);
    }
    return static_cast<uint32_t>(value);
}

double ParseNumber(const std::string& css, const std::string& part)
{
    try {
        return std::stod(string_utils::Trim(part));
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid color " + css);
    }
}
}  // namespace

BLRgba32 ParseCssColor(const std::string& css)
{
    std::string const str = string_utils::Trim(css);

    if (!str.empty() && str[0] == '#') {
        std::string hex = str.substr(1);
        // #ABC -> #AABBCC
        if (hex.size() == 3) {
            hex = {hex[0], hex[0], hex[1], hex[1], hex[2], hex[2]};
        }
        // #AABBCC -> #AABBCCFF
        if (hex.size() == 6) {
            hex += "FF";
        }
        if (hex.size() != 8) {
            throw std::invalid_argument("Unable to parse CSS color string " + css);
        }
        return BLRgba32(ParseHexPair(css, hex, 0), ParseHexPair(css, hex, 2), ParseHexPair(css, hex, 4), ParseHexPair(css, hex, 6));
    }

    if (str.rfind("rgb", 0) == 0) {
        size_t const open = str.find('(');
        size_t const close = str.rfind(')');
        if (open == std::string::npos || close == std::string::npos || close < open) {
            throw std::invalid_argument("Invalid color " + css);
        }
        std::vector<std::string> parts = string_utils::Split(str.substr(open + 1, close - open - 1), ',');
        bool const has_alpha = str.rfind("rgba", 0) == 0;
        if (!has_alpha) {
            parts.emplace_back("1");
        }
        if (parts.size() != 4) {
            throw std::invalid_argument("Invalid color " + css);
        }
        return BLRgba32(ClampChannel(ParseNumber(css, parts[0])),
                        ClampChannel(ParseNumber(css, parts[1])),
                        ClampChannel(ParseNumber(css, parts[2])),
                        ClampChannel(ParseNumber(css, parts[3]) * 255.0));
    }

    throw std::invalid_argument("Unable to parse CSS color string " + css);
}

std::string ToCss(BLRgba32 color)
{
    std::ostringstream out;
    out << "rgba(" << color.r() << ", " << color.g() << ", " << color.b() << ", " << (static_cast<double>(color.a()) / 255.0) << ")";
    return out.str();
}

BLRgba32 WithAlpha(BLRgba32 color, double alpha)
{
    return BLRgba32(color.r(), color.g(), color.b(), ClampChannel(alpha * 255.0));
}

BLRgba32 Mix(BLRgba32 color, BLRgba32 other, double amount)
{
    auto mix_channel = [amount](uint32_t self_channel, uint32_t other_channel) {
        return ClampChannel((static_cast<double>(other_channel) * (1.0 - amount)) + (static_cast<double>(self_channel) * amount));
    };
    return BLRgba32(mix_channel(color.r(), other.r()), mix_channel(color.g(), other.g()), mix_channel(color.b(), other.b()), color.a());
}

BLRgba32 Desaturate(BLRgba32 color)
{
    if (color.r() == color.g() && color.r() == color.b()) {
        return color;
    }
    // With zero saturation HSL collapses to the lightness grey.
    uint32_t const cmax = std::max({color.r(), color.g(), color.b()});
    uint32_t const cmin = std::min({color.r(), color.g(), color.b()});
    uint32_t const lightness = ClampChannel((static_cast<double>(cmax) + static_cast<double>(cmin)) / 2.0);
    return BLRgba32(lightness, lightness, lightness, color.a());
}

std::array<float, 4> ToFloat4(BLRgba32 color)
{
    return {static_cast<float>(color.r()) / 255.0F, static_cast<float>(color.g()) / 255.0F, static_cast<float>(color.b()) / 255.0F, static_cast<float>(color.a()) / 255.0F};
}

void BLRgba32ToHsv(const BLRgba32& rgba, HsvColor& hsv)
{
    float red = static_cast<float>(rgba.r()) / 255.0F;
    float green = static_cast<float>(rgba.g()) / 255.0F;
    float blue = static_cast<float>(rgba.b()) / 255.0F;
    hsv.alpha = rgba.a();

    float cmax = std::max({red, green, blue});
    float cmin = std::min({red, green, blue});
    float const kDelta = cmax - cmin;

    if (kDelta == 0.0F) {
        hsv.hue = 0.0F;  // Achromatic, hue is undefined, conventionally 0
    } else if (cmax == red) {
        hsv.hue = 60.0F * std::fmod(((green - blue) / kDelta), 6.0F);
    } else if (cmax == green) {
        hsv.hue = 60.0F * (((blue - red) / kDelta) + 2.0F);
    } else {
        hsv.hue = 60.0F * (((red - green) / kDelta) + 4.0F);
    }

    if (hsv.hue < 0.0F) {
        hsv.hue += 360.0F;
    }
    if (hsv.hue >= 360.0F) {
        hsv.hue = std::fmod(hsv.hue, 360.0F);
    }

    hsv.sat = (cmax == 0.0F) ? 0.0F : (kDelta / cmax);
    hsv.val = cmax;
}

void HsvToBLRgba32(const HsvColor& hsv_color, BLRgba32& rgba)
{
    float red_f = NAN;
    float green_f = NAN;
    float blue_f = NAN;

    float const kHue = hsv_color.hue;  // Expected to be [0, 360)
    float const kSat = hsv_color.sat;
    float const kVal = hsv_color.val;

    if (kSat == 0.0F) {
        red_f = green_f = blue_f = kVal;
    } else {
        float const kHueSector = kHue / 60.0F;
        int const kSectorIndex = static_cast<int>(kHueSector);
        float const kFraction = kHueSector - kSectorIndex;

        float const kPrimary = kVal * (1.0F - kSat);
        float const kSecondary = kVal * (1.0F - (kSat * kFraction));
        float const kTertiary = kVal * (1.0F - (kSat * (1.0F - kFraction)));

        switch (kSectorIndex) {
            case 0:
                red_f = kVal;
                green_f = kTertiary;
                blue_f = kPrimary;
                break;
            case 1:
                red_f = kSecondary;
                green_f = kVal;
                blue_f = kPrimary;
                break;
            case 2:
                red_f = kPrimary;
                green_f = kVal;
                blue_f = kTertiary;
                break;
            case 3:
                red_f = kPrimary;
                green_f = kSecondary;
                blue_f = kVal;
                break;
            case 4:
                red_f = kTertiary;
                green_f = kPrimary;
                blue_f = kVal;
                break;
            case 5:
            default:
                red_f = kVal;
                green_f = kPrimary;
                blue_f = kSecondary;
                break;
        }
    }

    rgba.reset(static_cast<uint32_t>(std::round(red_f * 255.0F)),
               static_cast<uint32_t>(std::round(green_f * 255.0F)),
               static_cast<uint32_t>(std::round(blue_f * 255.0F)),
               hsv_color.alpha);
}

BLRgba32 ShiftHue(BLRgba32 base_color, float hue_shift_degrees)
{
    HsvColor hsv;
    BLRgba32ToHsv(base_color, hsv);

    hsv.hue = std::fmod(hsv.hue + hue_shift_degrees, 360.0F);
    if (hsv.hue < 0.0F) {
        hsv.hue += 360.0F;
    }
    if (hsv.hue >= 360.0F) {
        hsv.hue = 0.0F;
    }

    BLRgba32 result_color;
    HsvToBLRgba32(hsv, result_color);
    return result_color;
}

BLRgba32 GenerateLayerColor(int layer_index, int total_layers, BLRgba32 base_color, float hue_step_degrees)
{
    if (total_layers <= 0) {
        return base_color;
    }

    float actual_hue_step = hue_step_degrees;
    if (actual_hue_step == 0.0F) {
        actual_hue_step = 360.0F / static_cast<float>(total_layers);
    }

    return ShiftHue(base_color, static_cast<float>(layer_index) * actual_hue_step);
}

}  // namespace color_utils
