#pragma once

#include <string>
#include <utility>
#include <vector>

#include <blend2d.h>

#include "document/Element.hpp"
#include "document/Stroke.hpp"
#include "text/TextShaper.hpp"
#include "utils/ColorUtils.hpp"
#include "utils/Vec2.hpp"

// KiCad defaults for schematic items, in millimeters.
namespace schematic_defaults
{
inline constexpr double kLineWidth = 0.1524;
inline constexpr double kWireWidth = 0.1524;
inline constexpr double kBusWidth = 0.3048;
inline constexpr double kNoConnectSize = 1.2192;
inline constexpr double kJunctionDiameter = 0.9144;
inline constexpr double kTextOffsetRatio = 0.15;
}  // namespace schematic_defaults

enum class FillType {
    kNone,
    kBackground,
    kOutline,
    kColor,
};

struct Fill {
    FillType type = FillType::kNone;
    BLRgba32 color = color_utils::kTransparentBlack;
};

// Base of schematic drawings. Wires and buses ignore the fill.
class SchematicItem : public Element
{
public:
    explicit SchematicItem(ElementType type, Stroke stroke = {}, Fill fill = {}) : Element(type), stroke(stroke), fill(fill) {}

    Stroke stroke;
    Fill fill;
};

class Wire : public SchematicItem
{
public:
    explicit Wire(std::vector<Vec2> points, Stroke stroke = {}) : SchematicItem(ElementType::kWire, stroke), points(std::move(points)) {}

    [[nodiscard]] std::string GetInfo() const override;

    std::vector<Vec2> points;
};

class Bus : public SchematicItem
{
public:
    explicit Bus(std::vector<Vec2> points, Stroke stroke = {}) : SchematicItem(ElementType::kBus, stroke), points(std::move(points)) {}

    [[nodiscard]] std::string GetInfo() const override;

    std::vector<Vec2> points;
};

class BusEntry : public SchematicItem
{
public:
    BusEntry(Vec2 position, Vec2 size) : SchematicItem(ElementType::kBusEntry), position(position), size(size) {}

    [[nodiscard]] std::string GetInfo() const override;

    Vec2 position;
    Vec2 size;
};

class Junction : public SchematicItem
{
public:
    // A zero diameter means the default junction size.
    explicit Junction(Vec2 position, double diameter = 0.0) : SchematicItem(ElementType::kJunction), position(position), diameter(diameter) {}

    [[nodiscard]] std::string GetInfo() const override;

    Vec2 position;
    double diameter;
    BLRgba32 color = color_utils::kTransparentBlack;
};

class NoConnect : public SchematicItem
{
public:
    explicit NoConnect(Vec2 position) : SchematicItem(ElementType::kNoConnect), position(position) {}

    [[nodiscard]] std::string GetInfo() const override;

    Vec2 position;
};

class SchematicPolyline : public SchematicItem
{
public:
    explicit SchematicPolyline(std::vector<Vec2> points, Stroke stroke = {}, Fill fill = {})
        : SchematicItem(ElementType::kSchematicPolyline, stroke, fill), points(std::move(points))
    {
    }

    [[nodiscard]] std::string GetInfo() const override;

    std::vector<Vec2> points;
};

class SchematicRectangle : public SchematicItem
{
public:
    SchematicRectangle(Vec2 start, Vec2 end, Stroke stroke = {}, Fill fill = {})
        : SchematicItem(ElementType::kSchematicRectangle, stroke, fill), start(start), end(end)
    {
    }

    [[nodiscard]] std::string GetInfo() const override;

    Vec2 start;
    Vec2 end;
};

class SchematicCircle : public SchematicItem
{
public:
    SchematicCircle(Vec2 center, double radius, Stroke stroke = {}, Fill fill = {})
        : SchematicItem(ElementType::kSchematicCircle, stroke, fill), center(center), radius(radius)
    {
    }

    [[nodiscard]] std::string GetInfo() const override;

    Vec2 center;
    double radius;
};

class SchematicArc : public SchematicItem
{
public:
    SchematicArc(Vec2 start, Vec2 mid, Vec2 end, Stroke stroke = {}, Fill fill = {})
        : SchematicItem(ElementType::kSchematicArc, stroke, fill), start(start), mid(mid), end(end)
    {
    }

    [[nodiscard]] std::string GetInfo() const override;

    Vec2 start;
    Vec2 mid;
    Vec2 end;
};

// Free text note.
class SchematicText : public SchematicItem
{
public:
    SchematicText(std::string text, Vec2 position, double rotation = 0.0)
        : SchematicItem(ElementType::kSchematicText), text(std::move(text)), position(position), rotation(rotation)
    {
    }

    [[nodiscard]] std::string GetInfo() const override;

    std::string text;
    Vec2 position;
    double rotation;  // degrees
    TextOptions options;
    bool hidden = false;
};

// Local net label. Rotation is one of 0, 90, 180, 270.
class NetLabel : public SchematicItem
{
public:
    NetLabel(std::string text, Vec2 position, double rotation = 0.0)
        : SchematicItem(ElementType::kNetLabel), text(std::move(text)), position(position), rotation(rotation)
    {
        options.h_align = TextHAlign::kLeft;
        options.v_align = TextVAlign::kBottom;
    }

    [[nodiscard]] std::string GetInfo() const override;

    std::string text;
    Vec2 position;
    double rotation;  // degrees
    TextOptions options;
    bool hidden = false;
};
