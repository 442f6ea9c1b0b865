#pragma once

#include <vector>

#include <blend2d.h>

#include "utils/Angle.hpp"
#include "utils/BBox.hpp"
#include "utils/ColorUtils.hpp"
#include "utils/Vec2.hpp"

// Drawable descriptors handed to the Renderer. A transparent black color means
// "use the current render state color".
namespace shapes
{

struct Circle {
    Vec2 center;
    double radius = 0.0;
    BLRgba32 color = color_utils::kTransparentBlack;
};

struct Arc {
    Vec2 center;
    double radius = 0.0;
    Angle start_angle;
    Angle end_angle;
    double width = 0.0;
    BLRgba32 color = color_utils::kTransparentBlack;
};

struct Polyline {
    std::vector<Vec2> points;
    double width = 0.0;
    BLRgba32 color = color_utils::kTransparentBlack;

    // Closed outline of the box.
    static Polyline FromBBox(const BBox& bbox, double width, BLRgba32 color)
    {
        return {{bbox.TopLeft(), bbox.TopRight(), bbox.BottomRight(), bbox.BottomLeft(), bbox.TopLeft()}, width, color};
    }
};

struct Polygon {
    std::vector<Vec2> points;
    BLRgba32 color = color_utils::kTransparentBlack;

    static Polygon FromBBox(const BBox& bbox, BLRgba32 color)
    {
        return {{bbox.TopLeft(), bbox.TopRight(), bbox.BottomRight(), bbox.BottomLeft()}, color};
    }
};

}  // namespace shapes
