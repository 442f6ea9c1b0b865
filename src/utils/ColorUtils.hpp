#pragma once

#include <array>
#include <string>

#include <blend2d.h>

namespace color_utils
{
struct HsvColor {
    float hue;       // Hue: 0-360 degrees
    float sat;       // Saturation: 0-1
    float val;       // Value: 0-1
    uint32_t alpha;  // Alpha: 0-255 (preserved from original RGBA)
};

inline const BLRgba32 kTransparentBlack(0, 0, 0, 0);
inline const BLRgba32 kBlack(0, 0, 0, 255);
inline const BLRgba32 kWhite(255, 255, 255, 255);

/**
 * @brief Parses a CSS color string.
 *
 * Accepts "#rgb", "#rrggbb", "#rrggbbaa", "rgb(r, g, b)" and "rgba(r, g, b, a)"
 * where r, g, b are 0-255 and a is 0-1.
 *
 * @throws std::invalid_argument if the string is not a recognised color.
 */
BLRgba32 ParseCssColor(const std::string& css);

// Formats as "rgba(r, g, b, a)".
std::string ToCss(BLRgba32 color);

// Transparent black is the "unset" color; the renderer substitutes the current state color for it.
inline bool IsTransparentBlack(BLRgba32 color)
{
    return color.value == 0;
}

// Returns the color with its alpha replaced, alpha in 0-1.
BLRgba32 WithAlpha(BLRgba32 color, double alpha);

// Linear mix: amount 1 gives 'color', amount 0 gives 'other'. Keeps the alpha of 'color'.
BLRgba32 Mix(BLRgba32 color, BLRgba32 other, double amount);

// Removes saturation, keeping HSL lightness. Greys are returned unchanged.
BLRgba32 Desaturate(BLRgba32 color);

// Normalized RGBA for vertex upload.
std::array<float, 4> ToFloat4(BLRgba32 color);

/**
 * @brief Applies a hue shift to a given BLRgba32 color.
 *
 * @param baseColor The original color.
 * @param hueShiftDegrees The amount to shift the hue, in degrees (0-360).
 *                        Positive values shift hue clockwise, negative counter-clockwise.
 * @return BLRgba32 The new color with the hue shifted.
 */
extern BLRgba32 ShiftHue(BLRgba32 base_color, float hue_shift_degrees);

/**
 * @brief Generates a distinct color for a layer based on its index and a base color using hue rotation.
 *
 * @param layer_index The index of the layer (0-based).
 * @param total_layers The total number of layers, used to spread hues when hue_step_degrees is 0.
 * @param base_color The starting color from which hues will be shifted.
 * @param hue_step_degrees The fixed degrees to shift hue for each subsequent layer.
 * @return BLRgba32 The calculated color for the layer.
 */
extern BLRgba32 GenerateLayerColor(int layer_index, int total_layers, BLRgba32 base_color, float hue_step_degrees = 30.0F);

// HSV TO BLRgba32
extern void HsvToBLRgba32(const HsvColor& hsv_color, BLRgba32& rgba);
// BLRgba32 TO HSV
extern void BLRgba32ToHsv(const BLRgba32& rgba, HsvColor& hsv);

}  // namespace color_utils
