#pragma once

#include "sch/SchematicLayers.hpp"
#include "view/Painter.hpp"

// Painter for schematic sheets. Drawings default to the note color and the
// KiCad default line width through the renderer state.
class SchematicPainter : public DocumentPainter
{
public:
    SchematicPainter(Renderer& gfx, SchematicLayerSet& layers, const Theme& theme, const TextShaper* text_shaper = nullptr);

    // Explicit stroke color, else the state stroke, else the note color.
    [[nodiscard]] BLRgba32 StrokeColor(const Stroke& stroke) const;
    // Transparent black when the shape has no fill.
    [[nodiscard]] BLRgba32 FillColor(const Fill& fill, const Stroke& stroke) const;
    [[nodiscard]] double StrokeWidth(const Stroke& stroke) const;
};
