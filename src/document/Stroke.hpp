#pragma once

#include <blend2d.h>

#include "utils/ColorUtils.hpp"

enum class StrokeType {
    kDefault,
    kSolid,
    kDash,
    kDot,
    kDashDot,
    kDashDotDot,
};

// Line style of a graphic item. A zero width or transparent black color means
// the painter picks its default.
struct Stroke {
    double width = 0.0;
    StrokeType type = StrokeType::kDefault;
    BLRgba32 color = color_utils::kTransparentBlack;
};
