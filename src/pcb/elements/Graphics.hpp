#pragma once

#include <string>
#include <utility>
#include <vector>

#include "document/Stroke.hpp"
#include "pcb/elements/BoardItem.hpp"
#include "text/TextShaper.hpp"
#include "utils/Vec2.hpp"

// Board drawings (gr_* at board level, fp_* inside footprints). Footprint
// children use coordinates relative to the footprint anchor.

class GraphicLine : public BoardItem
{
public:
    GraphicLine(Vec2 start, Vec2 end, std::string layer, Stroke stroke = {})
        : BoardItem(ElementType::kGraphicLine, std::move(layer)), start(start), end(end), stroke(stroke)
    {
    }

    [[nodiscard]] std::string GetInfo() const override;

    Vec2 start;
    Vec2 end;
    Stroke stroke;
};

class GraphicRect : public BoardItem
{
public:
    GraphicRect(Vec2 start, Vec2 end, std::string layer, Stroke stroke = {}, bool fill = false)
        : BoardItem(ElementType::kGraphicRect, std::move(layer)), start(start), end(end), stroke(stroke), fill(fill)
    {
    }

    [[nodiscard]] std::string GetInfo() const override;

    Vec2 start;
    Vec2 end;
    Stroke stroke;
    bool fill;
};

class GraphicCircle : public BoardItem
{
public:
    // 'end' is any point on the circumference.
    GraphicCircle(Vec2 center, Vec2 end, std::string layer, Stroke stroke = {}, bool fill = false)
        : BoardItem(ElementType::kGraphicCircle, std::move(layer)), center(center), end(end), stroke(stroke), fill(fill)
    {
    }

    [[nodiscard]] std::string GetInfo() const override;
    [[nodiscard]] double GetRadius() const { return (end - center).Length(); }

    Vec2 center;
    Vec2 end;
    Stroke stroke;
    bool fill;
};

class GraphicArc : public BoardItem
{
public:
    GraphicArc(Vec2 start, Vec2 mid, Vec2 end, std::string layer, Stroke stroke = {})
        : BoardItem(ElementType::kGraphicArc, std::move(layer)), start(start), mid(mid), end(end), stroke(stroke)
    {
    }

    [[nodiscard]] std::string GetInfo() const override;

    Vec2 start;
    Vec2 mid;
    Vec2 end;
    Stroke stroke;
};

class GraphicPoly : public BoardItem
{
public:
    GraphicPoly(std::vector<Vec2> points, std::string layer, Stroke stroke = {}, bool fill = false)
        : BoardItem(ElementType::kGraphicPoly, std::move(layer)), points(std::move(points)), stroke(stroke), fill(fill)
    {
    }

    [[nodiscard]] std::string GetInfo() const override;

    std::vector<Vec2> points;
    Stroke stroke;
    bool fill;
};

class GraphicText : public BoardItem
{
public:
    GraphicText(std::string text, Vec2 position, std::string layer, double rotation = 0.0)
        : BoardItem(ElementType::kGraphicText, std::move(layer)), text(std::move(text)), position(position), rotation(rotation)
    {
    }

    [[nodiscard]] std::string GetInfo() const override;

    std::string text;
    Vec2 position;
    double rotation;  // degrees
    TextOptions options;
    bool hidden = false;
    // Footprint text is kept readable: its angle is folded into (-90, 90].
    bool keep_upright = false;
};
