#include "sch/SchematicPainter.hpp"

#include <memory>
#include <vector>

#include "sch/elements/SchematicItem.hpp"
#include "utils/Arc.hpp"
#include "utils/Constants.hpp"
#include "utils/Matrix3.hpp"

namespace
{
using namespace schematic_layers;

template <typename T>
const T& As(const Element& item)
{
    return static_cast<const T&>(item);
}

class SchematicItemPainter : public ItemPainter
{
public:
    explicit SchematicItemPainter(SchematicPainter& painter) : ItemPainter(painter, painter.GetRenderer()), m_sch_painter_(painter) {}

protected:
    // Outline in the item's stroke style, then the fill under the same points.
    void StrokeAndFill(const std::vector<Vec2>& points, const SchematicItem& item)
    {
        BLRgba32 const fill = m_sch_painter_.FillColor(item.fill, item.stroke);
        if (!color_utils::IsTransparentBlack(fill)) {
            m_gfx_.DrawPolygon(points, fill);
        }
        StyledLine(points, item.stroke);
    }

    void StyledLine(const std::vector<Vec2>& points, const Stroke& stroke)
    {
        double const width = m_sch_painter_.StrokeWidth(stroke);
        BLRgba32 const color = m_sch_painter_.StrokeColor(stroke);
        StrokePainter::Line(points, width, stroke.type, m_sch_painter_.GetDashRatios(), [this, width, color](const std::vector<Vec2>& part) {
            m_gfx_.DrawLine(part, width, color);
        });
    }

    SchematicPainter& m_sch_painter_;
};

class RectanglePainter : public SchematicItemPainter
{
public:
    using SchematicItemPainter::SchematicItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kSchematicRectangle}; }
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& /*item*/) const override { return {kNotes}; }

    void Paint(ViewLayer& /*layer*/, const Element& item) override
    {
        const auto& rect = As<SchematicRectangle>(item);
        StrokeAndFill(
            {
                rect.start,
                {rect.end.x_ax, rect.start.y_ax},
                rect.end,
                {rect.start.x_ax, rect.end.y_ax},
                rect.start,
            },
            rect);
    }
};

class PolylinePainter : public SchematicItemPainter
{
public:
    using SchematicItemPainter::SchematicItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kSchematicPolyline}; }
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& /*item*/) const override { return {kNotes}; }

    void Paint(ViewLayer& /*layer*/, const Element& item) override
    {
        const auto& poly = As<SchematicPolyline>(item);
        if (poly.points.size() < 2) {
            return;
        }
        StrokeAndFill(poly.points, poly);
    }
};

class CirclePainter : public SchematicItemPainter
{
public:
    using SchematicItemPainter::SchematicItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kSchematicCircle}; }
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& /*item*/) const override { return {kNotes}; }

    void Paint(ViewLayer& /*layer*/, const Element& item) override
    {
        const auto& circle = As<SchematicCircle>(item);

        BLRgba32 const fill = m_sch_painter_.FillColor(circle.fill, circle.stroke);
        if (!color_utils::IsTransparentBlack(fill)) {
            m_gfx_.DrawCircle(circle.center, circle.radius, fill);
        }

        m_gfx_.DrawArc(circle.center,
                       circle.radius,
                       Angle(0.0),
                       Angle(constants::kTwoPi),
                       m_sch_painter_.StrokeWidth(circle.stroke),
                       m_sch_painter_.StrokeColor(circle.stroke));
    }
};

class ArcPainter : public SchematicItemPainter
{
public:
    using SchematicItemPainter::SchematicItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kSchematicArc}; }
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& /*item*/) const override { return {kNotes}; }

    void Paint(ViewLayer& /*layer*/, const Element& item) override
    {
        const auto& arc_item = As<SchematicArc>(item);
        Arc const arc = Arc::FromThreePoints(arc_item.start, arc_item.mid, arc_item.end, m_sch_painter_.StrokeWidth(arc_item.stroke));
        StrokeAndFill(arc.ToPolyline(), arc_item);
    }
};

class WirePainter : public SchematicItemPainter
{
public:
    using SchematicItemPainter::SchematicItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kWire}; }
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& /*item*/) const override { return {kWire}; }

    void Paint(ViewLayer& /*layer*/, const Element& item) override
    {
        const auto& wire = As<Wire>(item);
        double const width = wire.stroke.width > 0 ? wire.stroke.width : m_gfx_.State().GetStrokeWidth();
        m_gfx_.DrawLine(wire.points, width, GetTheme().ColorFor("wire"));
    }
};

class BusPainter : public SchematicItemPainter
{
public:
    using SchematicItemPainter::SchematicItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kBus}; }
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& /*item*/) const override { return {kWire}; }

    void Paint(ViewLayer& /*layer*/, const Element& item) override
    {
        const auto& bus = As<Bus>(item);
        double const width = bus.stroke.width > 0 ? bus.stroke.width : schematic_defaults::kBusWidth;
        m_gfx_.DrawLine(bus.points, width, GetTheme().ColorFor("bus"));
    }
};

class BusEntryPainter : public SchematicItemPainter
{
public:
    using SchematicItemPainter::SchematicItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kBusEntry}; }
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& /*item*/) const override { return {kJunction}; }

    void Paint(ViewLayer& /*layer*/, const Element& item) override
    {
        const auto& entry = As<BusEntry>(item);
        m_gfx_.DrawLine({entry.position, entry.position + entry.size}, schematic_defaults::kWireWidth, GetTheme().ColorFor("wire"));
    }
};

class JunctionPainter : public SchematicItemPainter
{
public:
    using SchematicItemPainter::SchematicItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kJunction}; }
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& /*item*/) const override { return {kJunction}; }

    void Paint(ViewLayer& /*layer*/, const Element& item) override
    {
        const auto& junction = As<Junction>(item);
        double const diameter = junction.diameter > 0 ? junction.diameter : schematic_defaults::kJunctionDiameter;
        BLRgba32 const color = color_utils::IsTransparentBlack(junction.color) ? GetTheme().ColorFor("junction") : junction.color;
        m_gfx_.DrawCircle(junction.position, diameter / 2, color);
    }
};

class NoConnectPainter : public SchematicItemPainter
{
public:
    using SchematicItemPainter::SchematicItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kNoConnect}; }
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& /*item*/) const override { return {kJunction}; }

    void Paint(ViewLayer& /*layer*/, const Element& item) override
    {
        const auto& nc = As<NoConnect>(item);
        double const half = schematic_defaults::kNoConnectSize / 2;
        BLRgba32 const color = GetTheme().ColorFor("no_connect");

        ScopedRenderState state(m_gfx_.State());
        m_gfx_.State().Multiply(Matrix3::Translation(nc.position.x_ax, nc.position.y_ax));
        m_gfx_.DrawLine({{-half, -half}, {half, half}}, schematic_defaults::kLineWidth, color);
        m_gfx_.DrawLine({{half, -half}, {-half, half}}, schematic_defaults::kLineWidth, color);
    }
};

// Notes draw their glyphs on :Notes and a clickable box on :Interactive.
class TextPainter : public SchematicItemPainter
{
public:
    using SchematicItemPainter::SchematicItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kSchematicText}; }

    [[nodiscard]] std::vector<std::string> LayersFor(const Element& item) const override
    {
        if (As<SchematicText>(item).hidden) {
            return {};
        }
        return {kNotes, kInteractive};
    }

    void Paint(ViewLayer& layer, const Element& item) override
    {
        const auto& text = As<SchematicText>(item);
        if (text.text.empty()) {
            return;
        }
        BLRgba32 const color = GetTheme().ColorFor("note");
        if (layer.GetName() == kInteractive) {
            m_sch_painter_.DrawTextBox(text.text, text.position, text.rotation, text.options, color);
        } else {
            m_sch_painter_.DrawText(text.text, text.position, text.rotation, text.options, color);
        }
    }
};

class NetLabelPainter : public SchematicItemPainter
{
public:
    using SchematicItemPainter::SchematicItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kNetLabel}; }

    [[nodiscard]] std::vector<std::string> LayersFor(const Element& item) const override
    {
        if (As<NetLabel>(item).hidden) {
            return {};
        }
        return {kLabel, kInteractive};
    }

    void Paint(ViewLayer& layer, const Element& item) override
    {
        const auto& label = As<NetLabel>(item);
        if (label.text.empty()) {
            return;
        }

        // Labels read left to right or bottom to top; the text sits just above the wire.
        bool const vertical = label.rotation == 90 || label.rotation == 270;
        double const angle = vertical ? 90.0 : 0.0;
        double const dist = schematic_defaults::kTextOffsetRatio * label.options.size.x_ax + label.options.thickness;
        Vec2 const offset = vertical ? Vec2(-dist, 0) : Vec2(0, -dist);
        Vec2 const position = label.position + offset;

        BLRgba32 const color = GetTheme().ColorFor("label_local");
        if (layer.GetName() == kInteractive) {
            m_sch_painter_.DrawTextBox(label.text, position, angle, label.options, color);
        } else {
            m_sch_painter_.DrawText(label.text, position, angle, label.options, color);
        }
    }
};
}  // namespace

SchematicPainter::SchematicPainter(Renderer& gfx, SchematicLayerSet& layers, const Theme& theme, const TextShaper* text_shaper)
    : DocumentPainter(gfx, layers, theme)
{
    SetTextShaper(text_shaper);

    gfx.State().SetFill(theme.ColorFor("note"));
    gfx.State().SetStroke(theme.ColorFor("note"));
    gfx.State().SetStrokeWidth(schematic_defaults::kLineWidth);

    AddPainter(std::make_unique<RectanglePainter>(*this));
    AddPainter(std::make_unique<PolylinePainter>(*this));
    AddPainter(std::make_unique<CirclePainter>(*this));
    AddPainter(std::make_unique<ArcPainter>(*this));
    AddPainter(std::make_unique<WirePainter>(*this));
    AddPainter(std::make_unique<BusPainter>(*this));
    AddPainter(std::make_unique<BusEntryPainter>(*this));
    AddPainter(std::make_unique<JunctionPainter>(*this));
    AddPainter(std::make_unique<NoConnectPainter>(*this));
    AddPainter(std::make_unique<TextPainter>(*this));
    AddPainter(std::make_unique<NetLabelPainter>(*this));
}

BLRgba32 SchematicPainter::StrokeColor(const Stroke& stroke) const
{
    if (!color_utils::IsTransparentBlack(stroke.color)) {
        return stroke.color;
    }
    BLRgba32 const state_color = m_gfx_.State().GetStroke();
    if (!color_utils::IsTransparentBlack(state_color)) {
        return state_color;
    }
    return m_theme_.ColorFor("note");
}

BLRgba32 SchematicPainter::FillColor(const Fill& fill, const Stroke& stroke) const
{
    switch (fill.type) {
    case FillType::kNone:
        return color_utils::kTransparentBlack;
    case FillType::kOutline:
        return StrokeColor(stroke);
    case FillType::kBackground:
        return m_theme_.ColorFor("component_body");
    case FillType::kColor:
        return color_utils::IsTransparentBlack(fill.color) ? m_gfx_.State().GetFill() : fill.color;
    }
    return color_utils::kTransparentBlack;
}

double SchematicPainter::StrokeWidth(const Stroke& stroke) const
{
    return stroke.width > 0 ? stroke.width : m_gfx_.State().GetStrokeWidth();
}
