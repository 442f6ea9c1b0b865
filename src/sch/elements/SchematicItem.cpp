#include "sch/elements/SchematicItem.hpp"

#include <sstream>

namespace
{
void WritePoint(std::stringstream& ss, const Vec2& p)
{
    ss << "(" << p.x_ax << ", " << p.y_ax << ")";
}
}  // namespace

std::string Wire::GetInfo() const
{
    std::stringstream ss;
    ss << "Wire\n  Points: " << points.size();
    return ss.str();
}

std::string Bus::GetInfo() const
{
    std::stringstream ss;
    ss << "Bus\n  Points: " << points.size();
    return ss.str();
}

std::string BusEntry::GetInfo() const
{
    std::stringstream ss;
    ss << "Bus Entry\n  At: ";
    WritePoint(ss, position);
    return ss.str();
}

std::string Junction::GetInfo() const
{
    std::stringstream ss;
    ss << "Junction\n  At: ";
    WritePoint(ss, position);
    return ss.str();
}

std::string NoConnect::GetInfo() const
{
    std::stringstream ss;
    ss << "No Connect\n  At: ";
    WritePoint(ss, position);
    return ss.str();
}

std::string SchematicPolyline::GetInfo() const
{
    std::stringstream ss;
    ss << "Polyline\n  Points: " << points.size();
    return ss.str();
}

std::string SchematicRectangle::GetInfo() const
{
    std::stringstream ss;
    ss << "Rectangle\n  Corners: ";
    WritePoint(ss, start);
    ss << " ";
    WritePoint(ss, end);
    return ss.str();
}

std::string SchematicCircle::GetInfo() const
{
    std::stringstream ss;
    ss << "Circle\n  Center: ";
    WritePoint(ss, center);
    ss << "\n  Radius: " << radius;
    return ss.str();
}

std::string SchematicArc::GetInfo() const
{
    std::stringstream ss;
    ss << "Arc\n  Start: ";
    WritePoint(ss, start);
    ss << "\n  End: ";
    WritePoint(ss, end);
    return ss.str();
}

std::string SchematicText::GetInfo() const
{
    std::stringstream ss;
    ss << "Text\n  \"" << text << "\" at ";
    WritePoint(ss, position);
    return ss.str();
}

std::string NetLabel::GetInfo() const
{
    std::stringstream ss;
    ss << "Net Label: " << text << "\n  At: ";
    WritePoint(ss, position);
    return ss.str();
}
