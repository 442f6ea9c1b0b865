#include "document/Element.hpp"

const char* ElementTypeName(ElementType type)
{
    switch (type) {
        case ElementType::kGraphicLine:
            return "GraphicLine";
        case ElementType::kGraphicRect:
            return "GraphicRect";
        case ElementType::kGraphicCircle:
            return "GraphicCircle";
        case ElementType::kGraphicArc:
            return "GraphicArc";
        case ElementType::kGraphicPoly:
            return "GraphicPoly";
        case ElementType::kGraphicText:
            return "GraphicText";
        case ElementType::kTraceSegment:
            return "TraceSegment";
        case ElementType::kTraceArc:
            return "TraceArc";
        case ElementType::kVia:
            return "Via";
        case ElementType::kZone:
            return "Zone";
        case ElementType::kPad:
            return "Pad";
        case ElementType::kFootprint:
            return "Footprint";
        case ElementType::kWire:
            return "Wire";
        case ElementType::kBus:
            return "Bus";
        case ElementType::kBusEntry:
            return "BusEntry";
        case ElementType::kJunction:
            return "Junction";
        case ElementType::kNoConnect:
            return "NoConnect";
        case ElementType::kSchematicPolyline:
            return "SchematicPolyline";
        case ElementType::kSchematicRectangle:
            return "SchematicRectangle";
        case ElementType::kSchematicCircle:
            return "SchematicCircle";
        case ElementType::kSchematicArc:
            return "SchematicArc";
        case ElementType::kSchematicText:
            return "SchematicText";
        case ElementType::kNetLabel:
            return "NetLabel";
    }
    return "Unknown";
}
