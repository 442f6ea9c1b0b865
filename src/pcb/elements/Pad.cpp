#include "pcb/elements/Pad.hpp"

#include <sstream>

void Pad::AddPrimitive(std::unique_ptr<BoardItem> primitive)
{
    primitive->SetParent(this);
    m_primitives_.push_back(std::move(primitive));
}

std::string Pad::GetInfo() const
{
    std::stringstream ss;
    ss << "Pad " << number << "\n";
    ss << "  Type: " << PadTypeName(type) << "\n";
    ss << "  Shape: " << PadShapeName(shape) << "\n";
    ss << "  Size: " << size.x_ax << " x " << size.y_ax << "\n";
    if (drill) {
        ss << "  Drill: " << drill->diameter << (drill->oval ? " (oval)" : "") << "\n";
    }
    ss << "  Net: " << (net_name.empty() ? "(none)" : net_name);
    return ss.str();
}

std::string PadTypeName(PadType type)
{
    switch (type) {
        case PadType::kThruHole:
            return "thru_hole";
        case PadType::kSmd:
            return "smd";
        case PadType::kConnect:
            return "connect";
        case PadType::kNpThruHole:
            return "np_thru_hole";
    }
    return "unknown";
}

std::string PadShapeName(PadShape shape)
{
    switch (shape) {
        case PadShape::kCircle:
            return "circle";
        case PadShape::kRect:
            return "rect";
        case PadShape::kOval:
            return "oval";
        case PadShape::kTrapezoid:
            return "trapezoid";
        case PadShape::kRoundRect:
            return "roundrect";
        case PadShape::kCustom:
            return "custom";
    }
    return "unknown";
}
