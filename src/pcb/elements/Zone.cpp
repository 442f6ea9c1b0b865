#include "pcb/elements/Zone.hpp"

#include <sstream>

std::string Zone::GetInfo() const
{
    std::stringstream ss;
    ss << "Zone\n";
    ss << "  Layers:";
    for (const auto& name : layers) {
        ss << " " << name;
    }
    ss << "\n  Net: " << (net_name.empty() ? std::to_string(GetNetId()) : net_name) << "\n";
    ss << "  Fill islands: " << filled_polygons.size();
    return ss.str();
}
