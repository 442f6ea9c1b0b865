#include "pcb/elements/Graphics.hpp"

#include <sstream>

std::string GraphicLine::GetInfo() const
{
    std::stringstream ss;
    ss << "Line (" << layer << ")\n";
    ss << "  From: (" << start.x_ax << ", " << start.y_ax << ")\n";
    ss << "  To: (" << end.x_ax << ", " << end.y_ax << ")\n";
    ss << "  Width: " << stroke.width;
    return ss.str();
}

std::string GraphicRect::GetInfo() const
{
    std::stringstream ss;
    ss << "Rectangle (" << layer << ")\n";
    ss << "  Corners: (" << start.x_ax << ", " << start.y_ax << ") (" << end.x_ax << ", " << end.y_ax << ")";
    if (fill) {
        ss << "\n  Filled";
    }
    return ss.str();
}

std::string GraphicCircle::GetInfo() const
{
    std::stringstream ss;
    ss << "Circle (" << layer << ")\n";
    ss << "  Center: (" << center.x_ax << ", " << center.y_ax << ")\n";
    ss << "  Radius: " << GetRadius();
    return ss.str();
}

std::string GraphicArc::GetInfo() const
{
    std::stringstream ss;
    ss << "Arc (" << layer << ")\n";
    ss << "  Start: (" << start.x_ax << ", " << start.y_ax << ")\n";
    ss << "  End: (" << end.x_ax << ", " << end.y_ax << ")";
    return ss.str();
}

std::string GraphicPoly::GetInfo() const
{
    std::stringstream ss;
    ss << "Polygon (" << layer << ")\n";
    ss << "  Points: " << points.size();
    return ss.str();
}

std::string GraphicText::GetInfo() const
{
    std::stringstream ss;
    ss << "Text (" << layer << ")\n";
    ss << "  \"" << text << "\" at (" << position.x_ax << ", " << position.y_ax << ")";
    return ss.str();
}
