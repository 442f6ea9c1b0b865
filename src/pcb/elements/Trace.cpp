#include "pcb/elements/Trace.hpp"

#include <sstream>

std::string TraceSegment::GetInfo() const
{
    std::stringstream ss;
    ss << "Trace (" << layer << ")\n";
    ss << "  From: (" << start.x_ax << ", " << start.y_ax << ")\n";
    ss << "  To: (" << end.x_ax << ", " << end.y_ax << ")\n";
    ss << "  Width: " << width << "\n";
    ss << "  Net: " << GetNetId();
    return ss.str();
}

std::string TraceArc::GetInfo() const
{
    std::stringstream ss;
    ss << "Trace Arc (" << layer << ")\n";
    ss << "  From: (" << start.x_ax << ", " << start.y_ax << ")\n";
    ss << "  To: (" << end.x_ax << ", " << end.y_ax << ")\n";
    ss << "  Width: " << width << "\n";
    ss << "  Net: " << GetNetId();
    return ss.str();
}
