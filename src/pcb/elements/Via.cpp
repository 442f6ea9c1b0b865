#include "pcb/elements/Via.hpp"

#include <sstream>

std::string Via::GetInfo() const
{
    std::stringstream ss;
    ss << "Via";
    switch (type) {
        case ViaType::kBlind:
            ss << " (blind/buried)";
            break;
        case ViaType::kMicro:
            ss << " (micro)";
            break;
        case ViaType::kThrough:
            break;
    }
    ss << "\n";
    ss << "  Position: (" << position.x_ax << ", " << position.y_ax << ")\n";
    ss << "  Layers: " << start_layer << " - " << end_layer << "\n";
    ss << "  Size: " << size << " Drill: " << drill << "\n";
    ss << "  Net: " << GetNetId();
    return ss.str();
}
