#pragma once

#include <vector>

#include "view/Theme.hpp"
#include "view/ViewLayer.hpp"

namespace schematic_layers
{
// Bounding boxes of clickable items
inline constexpr const char* kInteractive = ":Interactive";
// DNP and other marks
inline constexpr const char* kMarks = ":Marks";
inline constexpr const char* kSymbolField = ":Symbol:Field";
inline constexpr const char* kLabel = ":Label";
// Junctions, bus entries, no connects
inline constexpr const char* kJunction = ":Junction";
inline constexpr const char* kWire = ":Wire";
inline constexpr const char* kSymbolForeground = ":Symbol:Foreground";
// Text and graphics not inside a symbol
inline constexpr const char* kNotes = ":Notes";
inline constexpr const char* kBitmap = ":Bitmap";
inline constexpr const char* kSymbolPin = ":Symbol:Pin";
inline constexpr const char* kSymbolBackground = ":Symbol:Background";
}  // namespace schematic_layers

// A schematic has no physical layers; these only fix the drawing order.
class SchematicLayerSet : public ViewLayerSet
{
public:
    explicit SchematicLayerSet(const Theme& theme);

    // Only the hidden interactive layer is clickable.
    [[nodiscard]] std::vector<ViewLayer*> InteractiveLayers() const override;
};
