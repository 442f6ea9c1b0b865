#pragma once

#include <string>
#include <utility>

#include "pcb/elements/BoardItem.hpp"
#include "utils/Vec2.hpp"

class TraceSegment : public BoardItem
{
public:
    TraceSegment(Vec2 start, Vec2 end, double width, std::string layer, int net_id = -1)
        : BoardItem(ElementType::kTraceSegment, std::move(layer), net_id), start(start), end(end), width(width)
    {
    }

    [[nodiscard]] std::string GetInfo() const override;

    Vec2 start;
    Vec2 end;
    double width;
};

class TraceArc : public BoardItem
{
public:
    TraceArc(Vec2 start, Vec2 mid, Vec2 end, double width, std::string layer, int net_id = -1)
        : BoardItem(ElementType::kTraceArc, std::move(layer), net_id), start(start), mid(mid), end(end), width(width)
    {
    }

    [[nodiscard]] std::string GetInfo() const override;

    Vec2 start;
    Vec2 mid;
    Vec2 end;
    double width;
};
