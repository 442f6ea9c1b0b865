#ifndef ELEMENT_HPP
#define ELEMENT_HPP

#include <string>

// Runtime tag of every paintable item. Painters register against these.
enum class ElementType {
    // Board
    kGraphicLine,
    kGraphicRect,
    kGraphicCircle,
    kGraphicArc,
    kGraphicPoly,
    kGraphicText,
    kTraceSegment,
    kTraceArc,
    kVia,
    kZone,
    kPad,
    kFootprint,
    // Schematic
    kWire,
    kBus,
    kBusEntry,
    kJunction,
    kNoConnect,
    kSchematicPolyline,
    kSchematicRectangle,
    kSchematicCircle,
    kSchematicArc,
    kSchematicText,
    kNetLabel,
};

const char* ElementTypeName(ElementType type);

class Element
{
public:
    explicit Element(ElementType type, int net_id = -1) : m_type_(type), m_net_id_(net_id) {}

    virtual ~Element() = default;

    // Human readable description for the selection log.
    [[nodiscard]] virtual std::string GetInfo() const = 0;

    [[nodiscard]] ElementType GetElementType() const { return m_type_; }
    [[nodiscard]] int GetNetId() const { return m_net_id_; }
    void SetNetId(int net_id) { m_net_id_ = net_id; }

    // Owning container (footprint) if any. Non-owning.
    [[nodiscard]] const Element* GetParent() const { return m_parent_; }
    void SetParent(const Element* parent) { m_parent_ = parent; }

    Element(const Element&) = delete;
    Element& operator=(const Element&) = delete;
    Element(Element&&) = delete;
    Element& operator=(Element&&) = delete;

private:
    ElementType m_type_;
    int m_net_id_;
    const Element* m_parent_ = nullptr;
};

#endif  // ELEMENT_HPP
