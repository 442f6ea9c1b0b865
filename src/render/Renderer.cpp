#include "render/Renderer.hpp"

#include <string>
#include <utility>

#include "render/RenderErrors.hpp"
#include "utils/Arc.hpp"

// --- PaintContext ---

void Renderer::PaintContext::BeginLayer(std::unique_ptr<RenderLayer> layer)
{
    if (m_layer_) {
        throw InvalidStateError("Renderer: cannot start layer '" + layer->GetName() + "' while layer '" + m_layer_->GetName() + "' is active");
    }
    m_layer_ = std::move(layer);
}

RenderLayer& Renderer::PaintContext::ActiveLayer(const char* operation) const
{
    if (!m_layer_) {
        throw InvalidStateError(std::string("Renderer: ") + operation + " called without an active layer");
    }
    return *m_layer_;
}

std::unique_ptr<RenderLayer> Renderer::PaintContext::ReleaseLayer()
{
    if (!m_layer_) {
        throw InvalidStateError("Renderer: no active layer");
    }
    return std::move(m_layer_);
}

void Renderer::PaintContext::BeginBBox()
{
    m_bbox_ = BBox(0, 0, 0, 0);
}

void Renderer::PaintContext::GrowBBox(const BBox& bbox)
{
    if (!m_bbox_) {
        return;
    }
    m_bbox_ = BBox::Combine({*m_bbox_, bbox}, bbox.GetContext());
}

BBox Renderer::PaintContext::ReleaseBBox(const Element* context)
{
    if (!m_bbox_) {
        throw InvalidStateError("Renderer: no current bbox");
    }
    BBox bbox = *m_bbox_;
    bbox.SetContext(context);
    m_bbox_.reset();
    return bbox;
}

// --- Renderer ---

Renderer::Renderer() = default;

Renderer::~Renderer() = default;

void Renderer::StartBBox()
{
    m_context_.BeginBBox();
}

void Renderer::AddBBox(const BBox& bbox)
{
    m_context_.GrowBBox(bbox);
}

BBox Renderer::EndBBox(const Element* context)
{
    return m_context_.ReleaseBBox(context);
}

void Renderer::StartLayer(const std::string& name)
{
    m_context_.BeginLayer(CreateLayer(name));
}

std::unique_ptr<RenderLayer> Renderer::EndLayer()
{
    std::unique_ptr<RenderLayer> layer = m_context_.ReleaseLayer();
    layer->Commit();
    return layer;
}

shapes::Circle Renderer::PrepCircle(shapes::Circle circle)
{
    if (color_utils::IsTransparentBlack(circle.color)) {
        circle.color = m_state_.GetFill();
    }

    circle.center = m_state_.GetMatrix().Transform(circle.center);

    Vec2 const radial(circle.radius, circle.radius);
    AddBBox(BBox::FromPoints({circle.center + radial, circle.center - radial}));

    return circle;
}

shapes::Polyline Renderer::PrepLine(shapes::Polyline line)
{
    if (color_utils::IsTransparentBlack(line.color)) {
        line.color = m_state_.GetStroke();
    }

    line.points = m_state_.GetMatrix().TransformAll(line.points);

    if (!line.points.empty()) {
        AddBBox(BBox::FromPoints(line.points).Grow(line.width));
    }

    return line;
}

shapes::Polygon Renderer::PrepPolygon(shapes::Polygon polygon)
{
    if (color_utils::IsTransparentBlack(polygon.color)) {
        polygon.color = m_state_.GetFill();
    }

    polygon.points = m_state_.GetMatrix().TransformAll(polygon.points);

    if (!polygon.points.empty()) {
        AddBBox(BBox::FromPoints(polygon.points));
    }

    return polygon;
}

void Renderer::DrawCircle(const shapes::Circle& circle)
{
    RenderLayer& layer = m_context_.ActiveLayer("DrawCircle");
    shapes::Circle const prepared = PrepCircle(circle);
    if (color_utils::IsTransparentBlack(prepared.color)) {
        return;
    }
    layer.AddCircle(prepared);
}

void Renderer::DrawCircle(const Vec2& center, double radius, BLRgba32 color)
{
    DrawCircle(shapes::Circle {center, radius, color});
}

void Renderer::DrawArc(const shapes::Arc& arc)
{
    m_context_.ActiveLayer("DrawArc");

    BLRgba32 color = arc.color;
    if (color_utils::IsTransparentBlack(color)) {
        color = m_state_.GetStroke();
    }

    Arc const math_arc(arc.center, arc.radius, arc.start_angle, arc.end_angle, arc.width);
    DrawLine(shapes::Polyline {math_arc.ToPolyline(), arc.width, color});
}

void Renderer::DrawArc(const Vec2& center, double radius, const Angle& start_angle, const Angle& end_angle, std::optional<double> width, BLRgba32 color)
{
    DrawArc(shapes::Arc {center, radius, start_angle, end_angle, width.value_or(m_state_.GetStrokeWidth()), color});
}

void Renderer::DrawLine(const shapes::Polyline& line)
{
    RenderLayer& layer = m_context_.ActiveLayer("DrawLine");
    shapes::Polyline const prepared = PrepLine(line);
    if (color_utils::IsTransparentBlack(prepared.color)) {
        return;
    }
    layer.AddLine(prepared);
}

void Renderer::DrawLine(const std::vector<Vec2>& points, std::optional<double> width, BLRgba32 color)
{
    DrawLine(shapes::Polyline {points, width.value_or(m_state_.GetStrokeWidth()), color});
}

void Renderer::DrawPolygon(const shapes::Polygon& polygon)
{
    RenderLayer& layer = m_context_.ActiveLayer("DrawPolygon");
    shapes::Polygon const prepared = PrepPolygon(polygon);
    if (color_utils::IsTransparentBlack(prepared.color)) {
        return;
    }
    layer.AddPolygon(prepared);
}

void Renderer::DrawPolygon(const std::vector<Vec2>& points, BLRgba32 color)
{
    DrawPolygon(shapes::Polygon {points, color});
}
