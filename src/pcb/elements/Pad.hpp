#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pcb/elements/BoardItem.hpp"
#include "utils/Vec2.hpp"

enum class PadType {
    kThruHole,
    kSmd,
    kConnect,
    kNpThruHole,
};

enum class PadShape {
    kCircle,
    kRect,
    kOval,
    kTrapezoid,
    kRoundRect,
    kCustom,
};

struct PadDrill {
    bool oval = false;
    double diameter = 0.0;
    // Oval drills only; 'diameter' is the width when zero.
    double width = 0.0;
    Vec2 offset;
};

// Footprint pad. Position is relative to the footprint, rotation is absolute
// on the board, as KiCad stores it.
class Pad : public BoardItem
{
public:
    Pad(std::string number, PadType type, PadShape shape, Vec2 position, Vec2 size, std::vector<std::string> layers, int net_id = -1, std::string net_name = {})
        : BoardItem(ElementType::kPad, layers.empty() ? std::string() : layers.front(), net_id),
          number(std::move(number)),
          type(type),
          shape(shape),
          position(position),
          size(size),
          layers(std::move(layers)),
          net_name(std::move(net_name))
    {
    }

    [[nodiscard]] std::string GetInfo() const override;

    // Adds a custom-shape primitive, drawn relative to the pad.
    void AddPrimitive(std::unique_ptr<BoardItem> primitive);
    [[nodiscard]] const std::vector<std::unique_ptr<BoardItem>>& GetPrimitives() const { return m_primitives_; }

    std::string number;
    PadType type;
    PadShape shape;
    Vec2 position;
    double rotation = 0.0;  // degrees
    Vec2 size;
    std::vector<std::string> layers;
    std::string net_name;
    // Electrical pin type from the schematic; "no_connect" pads are labeled "X".
    std::string pin_type;
    std::optional<PadDrill> drill;

    double roundrect_rratio = 0.0;
    Vec2 rect_delta;
    // Custom pads are drawn as this shape plus the primitives.
    PadShape custom_anchor = PadShape::kCircle;

private:
    std::vector<std::unique_ptr<BoardItem>> m_primitives_;
};

std::string PadTypeName(PadType type);
std::string PadShapeName(PadShape shape);
