#pragma once

#include <string>
#include <vector>

#include "utils/Vec2.hpp"

enum class TextHAlign {
    kLeft,
    kCenter,
    kRight,
};

enum class TextVAlign {
    kTop,
    kCenter,
    kBottom,
};

struct TextOptions {
    Vec2 size {1.27, 1.27};
    double thickness = 0.15;
    bool bold = false;
    bool italic = false;
    bool mirror = false;
    TextHAlign h_align = TextHAlign::kCenter;
    TextVAlign v_align = TextVAlign::kCenter;
    double line_spacing = 1.0;
};

// Turns text into stroke polylines in local coordinates, origin at the
// alignment anchor. Implemented outside the renderer (stroke font layout).
class TextShaper
{
public:
    using Strokes = std::vector<std::vector<Vec2>>;

    virtual ~TextShaper() = default;

    [[nodiscard]] virtual Strokes Shape(const std::string& text, const TextOptions& options) const = 0;
};
