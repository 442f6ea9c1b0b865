#include "pcb/BoardPainter.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <utility>

#include "pcb/Board.hpp"
#include "pcb/elements/Footprint.hpp"
#include "pcb/elements/Graphics.hpp"
#include "pcb/elements/Pad.hpp"
#include "pcb/elements/Trace.hpp"
#include "pcb/elements/Via.hpp"
#include "pcb/elements/Zone.hpp"
#include "utils/Arc.hpp"
#include "utils/Constants.hpp"
#include "utils/Matrix3.hpp"

namespace
{
bool EndsWith(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool IsOverlay(const ViewLayer& layer)
{
    return layer.GetName() == ViewLayerSet::kOverlayName;
}

double ParentRotation(const Element& item)
{
    const Element* parent = item.GetParent();
    if (parent != nullptr && parent->GetElementType() == ElementType::kFootprint) {
        return static_cast<const Footprint*>(parent)->rotation;
    }
    return 0.0;
}

class BoardItemPainter : public ItemPainter
{
public:
    explicit BoardItemPainter(BoardPainter& painter) : ItemPainter(painter, painter.GetRenderer()), m_board_painter_(painter) {}

protected:
    // Graphic items carry no net and vanish while a net is highlighted.
    [[nodiscard]] bool IsNetFilterActive() const { return m_board_painter_.GetFilterNet().has_value(); }
    [[nodiscard]] bool IsFilteredOut(int net_id) const { return m_board_painter_.IsFilteredOut(net_id); }

    // Splits the line by stroke style and draws each part.
    void StyledLine(const std::vector<Vec2>& points, const Stroke& stroke, BLRgba32 color)
    {
        double const width = stroke.width;
        StrokePainter::Line(points, width, stroke.type, m_board_painter_.GetDashRatios(), [this, width, color](const std::vector<Vec2>& part) {
            m_gfx_.DrawLine(part, width, color);
        });
    }

    BoardPainter& m_board_painter_;
};

template <typename T>
const T& As(const Element& item)
{
    return static_cast<const T&>(item);
}

// --- Graphics ---

class LinePainter : public BoardItemPainter
{
public:
    using BoardItemPainter::BoardItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kGraphicLine}; }
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& item) const override { return {As<GraphicLine>(item).layer}; }

    void Paint(ViewLayer& layer, const Element& item) override
    {
        if (IsNetFilterActive()) {
            return;
        }
        const auto& line = As<GraphicLine>(item);
        StyledLine({line.start, line.end}, line.stroke, layer.GetColor());
    }
};

class RectPainter : public BoardItemPainter
{
public:
    using BoardItemPainter::BoardItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kGraphicRect}; }
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& item) const override { return {As<GraphicRect>(item).layer}; }

    void Paint(ViewLayer& layer, const Element& item) override
    {
        if (IsNetFilterActive()) {
            return;
        }
        const auto& rect = As<GraphicRect>(item);
        BLRgba32 const color = layer.GetColor();

        std::vector<Vec2> const points = {
            rect.start,
            {rect.end.x_ax, rect.start.y_ax},
            rect.end,
            {rect.start.x_ax, rect.end.y_ax},
            rect.start,
        };

        StyledLine(points, rect.stroke, color);

        if (rect.fill) {
            m_gfx_.DrawPolygon(points, color);
        }
    }
};

class PolyPainter : public BoardItemPainter
{
public:
    using BoardItemPainter::BoardItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kGraphicPoly}; }
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& item) const override { return {As<GraphicPoly>(item).layer}; }

    void Paint(ViewLayer& layer, const Element& item) override
    {
        if (IsNetFilterActive()) {
            return;
        }
        const auto& poly = As<GraphicPoly>(item);
        if (poly.points.empty()) {
            return;
        }
        BLRgba32 const color = layer.GetColor();

        if (poly.stroke.width > 0) {
            std::vector<Vec2> outline = poly.points;
            outline.push_back(poly.points.front());
            StyledLine(outline, poly.stroke, color);
        }

        if (poly.fill) {
            m_gfx_.DrawPolygon(poly.points, color);
        }
    }
};

class ArcPainter : public BoardItemPainter
{
public:
    using BoardItemPainter::BoardItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kGraphicArc}; }
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& item) const override { return {As<GraphicArc>(item).layer}; }

    void Paint(ViewLayer& layer, const Element& item) override
    {
        if (IsNetFilterActive()) {
            return;
        }
        const auto& arc_item = As<GraphicArc>(item);
        Arc const arc = Arc::FromThreePoints(arc_item.start, arc_item.mid, arc_item.end, arc_item.stroke.width);
        StyledLine(arc.ToPolyline(), arc_item.stroke, layer.GetColor());
    }
};

class CirclePainter : public BoardItemPainter
{
public:
    using BoardItemPainter::BoardItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kGraphicCircle}; }
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& item) const override { return {As<GraphicCircle>(item).layer}; }

    void Paint(ViewLayer& layer, const Element& item) override
    {
        if (IsNetFilterActive()) {
            return;
        }
        const auto& circle = As<GraphicCircle>(item);
        BLRgba32 const color = layer.GetColor();
        double const radius = circle.GetRadius();

        if (circle.fill) {
            m_gfx_.DrawCircle(circle.center, radius + circle.stroke.width, color);
        } else {
            Arc const arc(circle.center, radius, Angle(0), Angle(constants::kTwoPi), circle.stroke.width);
            m_gfx_.DrawLine(arc.ToPolyline(), circle.stroke.width, color);
        }
    }
};

// --- Copper ---

class TraceSegmentPainter : public BoardItemPainter
{
public:
    using BoardItemPainter::BoardItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kTraceSegment}; }
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& item) const override { return {As<TraceSegment>(item).layer}; }

    void Paint(ViewLayer& layer, const Element& item) override
    {
        const auto& segment = As<TraceSegment>(item);
        if (IsFilteredOut(segment.GetNetId())) {
            return;
        }
        m_gfx_.DrawLine({segment.start, segment.end}, segment.width, layer.GetColor());
    }
};

class TraceArcPainter : public BoardItemPainter
{
public:
    using BoardItemPainter::BoardItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kTraceArc}; }
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& item) const override { return {As<TraceArc>(item).layer}; }

    void Paint(ViewLayer& layer, const Element& item) override
    {
        const auto& trace = As<TraceArc>(item);
        if (IsFilteredOut(trace.GetNetId())) {
            return;
        }
        Arc const arc = Arc::FromThreePoints(trace.start, trace.mid, trace.end, trace.width);
        m_gfx_.DrawLine(arc.ToPolyline(), arc.GetWidth(), layer.GetColor());
    }
};

class ViaPainter : public BoardItemPainter
{
public:
    using BoardItemPainter::BoardItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kVia}; }

    [[nodiscard]] std::vector<std::string> LayersFor(const Element& item) const override
    {
        const auto& via = As<Via>(item);

        // Blind/buried vias are only drawn on the copper layers they span.
        if (via.IsBlindOrBuried()) {
            std::vector<std::string> layers;
            for (const std::string& copper : board_layers::CopperLayersBetween(via.start_layer, via.end_layer)) {
                layers.push_back(board_layers::VirtualLayerFor(copper, board_layers::kBBViaHoles));
                layers.push_back(board_layers::VirtualLayerFor(copper, board_layers::kBBViaHoleWalls));
            }
            return layers;
        }
        return {board_layers::kViaHoles, board_layers::kViaHoleWalls};
    }

    void Paint(ViewLayer& layer, const Element& item) override
    {
        const auto& via = As<Via>(item);
        if (IsFilteredOut(via.GetNetId())) {
            return;
        }

        BLRgba32 const color = layer.GetColor();
        if (EndsWith(layer.GetName(), "HoleWalls") || IsOverlay(layer)) {
            m_gfx_.DrawCircle(via.position, via.size / 2, color);
        } else if (EndsWith(layer.GetName(), "Holes")) {
            m_gfx_.DrawCircle(via.position, via.drill / 2, color);

            // Start and end layer markers
            if (via.type == ViaType::kBlind || via.type == ViaType::kMicro) {
                double const radius = (via.size / 2) - (via.size / 8);
                m_gfx_.DrawArc(via.position, radius, Angle::FromDegrees(180 + 70), Angle::FromDegrees(360 - 70), via.size / 4, LayerColor(via.start_layer));
                m_gfx_.DrawArc(via.position, radius, Angle::FromDegrees(70), Angle::FromDegrees(180 - 70), via.size / 4, LayerColor(via.end_layer));
            }
        }
    }

private:
    [[nodiscard]] BLRgba32 LayerColor(const std::string& name) const
    {
        ViewLayer* layer = m_board_painter_.GetLayers().ByName(name);
        return layer != nullptr ? layer->GetColor() : color_utils::kTransparentBlack;
    }
};

class ZonePainter : public BoardItemPainter
{
public:
    using BoardItemPainter::BoardItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kZone}; }

    [[nodiscard]] std::vector<std::string> LayersFor(const Element& item) const override
    {
        const auto& zone = As<Zone>(item);

        std::vector<std::string> names;
        for (const std::string& name : zone.layers) {
            if (name == "F&B.Cu") {
                names.emplace_back(board_layers::kFrontCopper);
                names.emplace_back(board_layers::kBackCopper);
            } else {
                names.push_back(name);
            }
        }

        std::vector<std::string> layers;
        for (const std::string& name : names) {
            const auto& copper = board_layers::CopperLayerNames();
            if (std::find(copper.begin(), copper.end(), name) != copper.end()) {
                layers.push_back(board_layers::VirtualLayerFor(name, board_layers::kZones));
            } else {
                layers.push_back(name);
            }
        }
        return layers;
    }

    void Paint(ViewLayer& layer, const Element& item) override
    {
        const auto& zone = As<Zone>(item);
        if (IsFilteredOut(zone.GetNetId())) {
            return;
        }

        for (const auto& polygon : zone.filled_polygons) {
            if (IsOverlay(layer) || layer.GetName() == polygon.layer || layer.GetName() == board_layers::VirtualLayerFor(polygon.layer, board_layers::kZones)) {
                m_gfx_.DrawPolygon(polygon.points, layer.GetColor());
            }
        }
    }
};

class PadPainter : public BoardItemPainter
{
public:
    using BoardItemPainter::BoardItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kPad}; }

    [[nodiscard]] std::vector<std::string> LayersFor(const Element& item) const override
    {
        using namespace board_layers;
        const auto& pad = As<Pad>(item);

        std::vector<std::string> layers;
        for (const std::string& name : pad.layers) {
            if (name == "*.Cu") {
                layers.emplace_back(kPadsFront);
                layers.emplace_back(kPadsBack);
            } else if (name == kFrontCopper) {
                layers.emplace_back(kPadsFront);
            } else if (name == kBackCopper) {
                layers.emplace_back(kPadsBack);
            } else if (name == "*.Mask") {
                layers.emplace_back("F.Mask");
                layers.emplace_back("B.Mask");
            } else if (name == "*.Paste") {
                layers.emplace_back("F.Paste");
                layers.emplace_back("B.Paste");
            } else {
                layers.push_back(name);
            }
        }

        auto has = [&layers](const char* name) { return std::find(layers.begin(), layers.end(), name) != layers.end(); };

        switch (pad.type) {
            case PadType::kThruHole:
                layers.emplace_back(kPadHoleWalls);
                layers.emplace_back(kPadHolesNetName);
                layers.emplace_back(kPadHoles);
                break;
            case PadType::kNpThruHole:
                layers.emplace_back(kNonPlatedHoles);
                break;
            case PadType::kSmd:
                // Through-hole pads are labeled on the pad holes netname layer.
                if (has(kPadsFront)) {
                    layers.emplace_back(kPadsFrontNetName);
                } else if (has(kPadsBack)) {
                    layers.emplace_back(kPadsBackNetName);
                }
                break;
            case PadType::kConnect:
                break;
            default:
                std::cerr << "PadPainter: Unhandled pad type " << static_cast<int>(pad.type) << std::endl;
                break;
        }

        return layers;
    }

    void Paint(ViewLayer& layer, const Element& item) override
    {
        using namespace board_layers;
        const auto& pad = As<Pad>(item);
        if (IsFilteredOut(pad.GetNetId())) {
            return;
        }

        BLRgba32 const color = layer.GetColor();
        double const parent_rotation = ParentRotation(pad);

        Matrix3 position_mat = Matrix3::Translation(pad.position.x_ax, pad.position.y_ax);
        position_mat.RotateSelf(-Angle::DegToRad(parent_rotation));
        position_mat.RotateSelf(Angle::DegToRad(pad.rotation));

        ScopedRenderState state(m_gfx_.State());
        m_gfx_.State().Multiply(position_mat);

        const std::string& name = layer.GetName();
        bool const is_hole_layer = name == kPadHoles || name == kNonPlatedHoles;
        bool const is_netname_layer = name == kPadsFrontNetName || name == kPadsBackNetName || name == kPadHolesNetName;

        if (is_netname_layer) {
            PaintNetName(pad, parent_rotation, color);
        } else if (is_hole_layer && pad.drill) {
            PaintDrill(*pad.drill, color);
        } else {
            PaintShape(layer, pad, color);
        }
    }

private:
    // Pad size as seen on screen, with 45 degree bloat removed.
    static Vec2 PadOrthSize(const Pad& pad, double parent_rotation)
    {
        Vec2 size = pad.size;
        if (std::fmod(parent_rotation + 36000, 180) != 0) {
            std::swap(size.x_ax, size.y_ax);
        }

        double const limit = std::min(size.x_ax, size.y_ax) * 1.1;
        if (size.x_ax > limit && size.y_ax > limit) {
            size = {limit, limit};
        }
        return size;
    }

    void PaintNetName(const Pad& pad, double parent_rotation, BLRgba32 color)
    {
        Vec2 const pad_size = PadOrthSize(pad, parent_rotation);
        std::string const net_name = BoardPainter::DisplayedNetName(pad);

        double max_width = pad_size.x_ax;
        double max_font_size = pad_size.y_ax;
        double text_rotation = -parent_rotation;
        if (pad_size.x_ax < pad_size.y_ax * 0.95) {
            text_rotation += 90;
            max_width = pad_size.y_ax;
            max_font_size = pad_size.x_ax;
        }
        max_font_size = std::min(max_font_size, 10.0);

        double num_offset = 0;
        double net_offset = 0;
        if (!net_name.empty() && !pad.number.empty()) {
            max_font_size = max_font_size / 3;
            net_offset = max_font_size / 1.4;
            num_offset = max_font_size / 1.7;
        }

        m_gfx_.State().Multiply(Matrix3::Rotation(Angle::DegToRad(text_rotation)));

        if (!pad.number.empty()) {
            DrawLabel(pad.number, {0, -num_offset}, max_width, max_font_size, color);
        }
        if (!net_name.empty()) {
            DrawLabel(net_name, {0, net_offset}, max_width, max_font_size, color);
        }
    }

    void DrawLabel(const std::string& text, const Vec2& center, double text_width, double max_font_size, BLRgba32 color)
    {
        // Short labels keep the same font size.
        double const char_width = text_width / static_cast<double>(std::max<size_t>(text.size(), 3));
        double const font_size = std::min(max_font_size, char_width) * 0.95;

        TextOptions options;
        options.bold = true;
        options.size = {font_size, font_size};
        options.thickness = font_size / 8;
        m_board_painter_.DrawText(text, center, 0, options, color);
    }

    void PaintDrill(const PadDrill& drill, BLRgba32 color)
    {
        if (!drill.oval) {
            m_gfx_.DrawCircle(drill.offset, drill.diameter / 2, color);
            return;
        }

        Vec2 const half_size(drill.diameter / 2, drill.width / 2);
        double const half_width = std::min(half_size.x_ax, half_size.y_ax);
        Vec2 const half_len(half_size.x_ax - half_width, half_size.y_ax - half_width);

        m_gfx_.DrawLine({drill.offset - half_len, drill.offset + half_len}, half_width * 2, color);
    }

    void PaintShape(ViewLayer& layer, const Pad& pad, BLRgba32 color)
    {
        Vec2 const center(0, 0);

        PadShape shape = pad.shape;
        if (shape == PadShape::kCustom) {
            shape = pad.custom_anchor;
        }

        if (pad.drill) {
            m_gfx_.State().Multiply(Matrix3::Translation(pad.drill->offset.x_ax, pad.drill->offset.y_ax));
        }

        switch (shape) {
            case PadShape::kCircle:
                m_gfx_.DrawCircle(center, pad.size.x_ax / 2, color);
                break;
            case PadShape::kRect: {
                Vec2 const half = pad.size / 2;
                m_gfx_.DrawPolygon({{-half.x_ax, -half.y_ax}, {half.x_ax, -half.y_ax}, {half.x_ax, half.y_ax}, {-half.x_ax, half.y_ax}}, color);
                break;
            }
            case PadShape::kRoundRect:
            case PadShape::kTrapezoid: {
                // Rounded corners are a polygon shrunk by the radius plus an
                // outline twice the radius wide.
                double const rounding = std::min(pad.size.x_ax, pad.size.y_ax) * pad.roundrect_rratio;
                Vec2 const half = (pad.size / 2) - Vec2(rounding, rounding);
                Vec2 const trap = pad.rect_delta * 0.5;

                std::vector<Vec2> points = {
                    {-half.x_ax - trap.y_ax, half.y_ax + trap.x_ax},
                    {half.x_ax + trap.y_ax, half.y_ax - trap.x_ax},
                    {half.x_ax - trap.y_ax, -half.y_ax + trap.x_ax},
                    {-half.x_ax + trap.y_ax, -half.y_ax - trap.x_ax},
                };

                m_gfx_.DrawPolygon(points, color);
                points.push_back(points.front());
                m_gfx_.DrawLine(points, rounding * 2, color);
                break;
            }
            case PadShape::kOval: {
                Vec2 const half = pad.size / 2;
                double const half_width = std::min(half.x_ax, half.y_ax);
                Vec2 const half_len(half.x_ax - half_width, half.y_ax - half_width);

                Vec2 const pad_pos = center + (pad.drill ? pad.drill->offset : Vec2());
                Vec2 const pad_start = pad_pos - half_len;
                Vec2 const pad_end = pad_pos + half_len;

                if (pad_start == pad_end) {
                    m_gfx_.DrawCircle(pad_pos, half_width, color);
                } else {
                    m_gfx_.DrawLine({pad_start, pad_end}, half_width * 2, color);
                }
                break;
            }
            default:
                std::cerr << "PadPainter: Unknown pad shape " << PadShapeName(pad.shape) << std::endl;
                break;
        }

        if (pad.shape == PadShape::kCustom) {
            for (const auto& primitive : pad.GetPrimitives()) {
                m_view_painter_.PaintItem(layer, *primitive);
            }
        }
    }
};

// --- Footprints and text ---

class FootprintPainter : public BoardItemPainter
{
public:
    using BoardItemPainter::BoardItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kFootprint}; }

    [[nodiscard]] std::vector<std::string> LayersFor(const Element& item) const override
    {
        std::vector<std::string> layers;
        for (const BoardItem* child : As<Footprint>(item).Items()) {
            for (std::string& name : m_view_painter_.LayersFor(*child)) {
                if (std::find(layers.begin(), layers.end(), name) == layers.end()) {
                    layers.push_back(std::move(name));
                }
            }
        }
        return layers;
    }

    void Paint(ViewLayer& layer, const Element& item) override
    {
        const auto& footprint = As<Footprint>(item);

        Matrix3 matrix = Matrix3::Translation(footprint.position.x_ax, footprint.position.y_ax);
        matrix.RotateSelf(Angle::DegToRad(footprint.rotation));

        ScopedRenderState state(m_gfx_.State());
        m_gfx_.State().Multiply(matrix);

        for (const BoardItem* child : footprint.Items()) {
            std::vector<std::string> const child_layers = m_view_painter_.LayersFor(*child);
            if (IsOverlay(layer) || std::find(child_layers.begin(), child_layers.end(), layer.GetName()) != child_layers.end()) {
                m_view_painter_.PaintItem(layer, *child);
            }
        }
    }
};

class TextPainter : public BoardItemPainter
{
public:
    using BoardItemPainter::BoardItemPainter;

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kGraphicText}; }

    [[nodiscard]] std::vector<std::string> LayersFor(const Element& item) const override
    {
        const auto& text = As<GraphicText>(item);
        if (text.hidden) {
            return {};
        }
        return {text.layer};
    }

    void Paint(ViewLayer& layer, const Element& item) override
    {
        if (IsNetFilterActive()) {
            return;
        }
        const auto& text = As<GraphicText>(item);
        if (text.hidden || text.text.empty()) {
            return;
        }

        Vec2 position = text.position;
        double angle = text.rotation;
        bool const in_footprint = text.GetParent() != nullptr && text.GetParent()->GetElementType() == ElementType::kFootprint;

        // Footprint text is placed in board coordinates with its own absolute angle.
        if (in_footprint) {
            const auto* footprint = static_cast<const Footprint*>(text.GetParent());
            position = Angle::FromDegrees(footprint->rotation).RotatePoint(position) + footprint->position;
        }

        if (text.keep_upright) {
            while (angle > 90) {
                angle -= 180;
            }
            while (angle <= -90) {
                angle += 180;
            }
        }

        ScopedRenderState state(m_gfx_.State());
        if (in_footprint) {
            m_gfx_.State().SetMatrix(Matrix3::Identity());
        }
        m_board_painter_.DrawText(text.text, position, angle, text.options, layer.GetColor());
    }
};
}  // namespace

BoardPainter::BoardPainter(Renderer& gfx, BoardLayerSet& layers, const Theme& theme, const TextShaper* text_shaper)
    : DocumentPainter(gfx, layers, theme), m_board_layers_(layers)
{
    SetTextShaper(text_shaper);

    AddPainter(std::make_unique<LinePainter>(*this));
    AddPainter(std::make_unique<RectPainter>(*this));
    AddPainter(std::make_unique<PolyPainter>(*this));
    AddPainter(std::make_unique<ArcPainter>(*this));
    AddPainter(std::make_unique<CirclePainter>(*this));
    AddPainter(std::make_unique<TraceSegmentPainter>(*this));
    AddPainter(std::make_unique<TraceArcPainter>(*this));
    AddPainter(std::make_unique<ViaPainter>(*this));
    AddPainter(std::make_unique<ZonePainter>(*this));
    AddPainter(std::make_unique<PadPainter>(*this));
    AddPainter(std::make_unique<FootprintPainter>(*this));
    AddPainter(std::make_unique<TextPainter>(*this));
}

void BoardPainter::PaintNet(const Board& board, int net)
{
    ViewLayer& layer = m_layers_.Overlay();

    layer.Clear();
    layer.SetColor(color_utils::kWhite);
    LayerScope scope(m_gfx_, layer.GetName());

    m_filter_net_ = net;
    for (const Element* item : board.Items()) {
        if (PainterFor(*item) == nullptr) {
            continue;
        }
        TryPaintItem(layer, *item);
    }
    m_filter_net_.reset();

    std::unique_ptr<RenderLayer> graphics = scope.Finish();
    graphics->SetCompositeOperation(CompositeOperation::kOverlay);
    layer.SetGraphics(std::move(graphics));
}

std::string BoardPainter::DisplayedNetName(const Pad& pad)
{
    if (pad.pin_type.find("no_connect") != std::string::npos) {
        return "X";
    }
    std::string::size_type const slash = pad.net_name.rfind('/');
    if (slash == std::string::npos) {
        return pad.net_name;
    }
    return pad.net_name.substr(slash + 1);
}
