#include "pcb/elements/Footprint.hpp"

#include <sstream>

std::vector<const BoardItem*> Footprint::Items() const
{
    std::vector<const BoardItem*> items;
    items.reserve(m_items_.size());
    for (const auto& item : m_items_) {
        items.push_back(item.get());
    }
    return items;
}

std::string Footprint::GetInfo() const
{
    std::stringstream ss;
    ss << "Footprint: " << reference << " (" << value << ")\n";
    ss << "  Position: (" << position.x_ax << ", " << position.y_ax << ")\n";
    ss << "  Rotation: " << rotation << " deg\n";
    ss << "  Side: " << (layer == "B.Cu" ? "Bottom" : "Top") << "\n";
    ss << "  Items: " << m_items_.size();
    return ss.str();
}
