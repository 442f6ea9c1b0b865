#include "view/Viewer.hpp"

#include <iostream>

#include "core/Config.hpp"

ViewerSettings ViewerSettings::FromConfig(const Config& config)
{
    ViewerSettings settings;
    settings.dim_alpha = config.GetFloat("viewer.dim_alpha", static_cast<float>(settings.dim_alpha));
    settings.min_zoom = config.GetFloat("viewer.min_zoom", static_cast<float>(settings.min_zoom));
    settings.max_zoom = config.GetFloat("viewer.max_zoom", static_cast<float>(settings.max_zoom));
    settings.dash_ratios.dash = config.GetFloat("stroke.dash_ratio", static_cast<float>(settings.dash_ratios.dash));
    settings.dash_ratios.gap = config.GetFloat("stroke.gap_ratio", static_cast<float>(settings.dash_ratios.gap));
    return settings;
}

Viewer::Viewer(std::unique_ptr<Renderer> renderer, ViewerSettings settings) : m_renderer_(std::move(renderer)), m_settings_(settings)
{
    m_camera_.SetZoomLimits(m_settings_.min_zoom, m_settings_.max_zoom);
}

Viewer::~Viewer()
{
    Dispose();
}

bool Viewer::Setup()
{
    if (!m_renderer_->Setup()) {
        std::cerr << "Viewer: Renderer setup failed" << std::endl;
        return false;
    }
    m_viewport_.SetSize(m_renderer_->GetCanvasWidth(), m_renderer_->GetCanvasHeight());
    m_ready_ = true;
    return true;
}

void Viewer::Dispose()
{
    // Layers hold backend resources, release them before the backend.
    m_layers_.reset();
    if (m_ready_) {
        m_renderer_->Dispose();
        m_ready_ = false;
    }
}

void Viewer::Resize(int width, int height)
{
    if (width <= 0 || height <= 0) {
        return;
    }
    m_renderer_->UpdateCanvasSize(width, height);
    m_viewport_.SetSize(width, height);
    Draw();
}

void Viewer::Draw()
{
    if (!m_ready_) {
        return;
    }
    m_draw_requested_ = true;
}

bool Viewer::FlushPendingDraw()
{
    if (!m_draw_requested_) {
        return false;
    }
    m_draw_requested_ = false;
    OnDraw();
    m_renderer_->Present();
    return true;
}

void Viewer::OnDraw()
{
    m_renderer_->ClearCanvas();

    if (!m_layers_) {
        return;
    }

    // Render all layers in display order (back to front)
    double depth = kFirstLayerDepth;
    Matrix3 const camera = m_camera_.GetMatrix(m_viewport_);
    bool const should_dim = m_layers_->IsAnyLayerHighlighted();

    for (ViewLayer* layer : m_layers_->InDisplayOrder()) {
        if (!layer->IsVisible() || layer->GetGraphics() == nullptr) {
            continue;
        }
        double alpha = layer->GetOpacity();
        if (should_dim && !layer->IsHighlighted()) {
            alpha = m_settings_.dim_alpha;
        }
        layer->GetGraphics()->Render(camera, depth, alpha);
        depth += kLayerDepthStep;
    }
}

void Viewer::SetMousePosition(const Vec2& screen_point)
{
    m_mouse_position_ = m_viewport_.ScreenToWorld(screen_point, m_camera_);
}

void Viewer::Pick(const Vec2& screen_point)
{
    SetMousePosition(screen_point);
    if (!m_layers_) {
        return;
    }
    OnPick(m_layers_->QueryPoint(m_mouse_position_));
}

void Viewer::OnPick(const std::vector<ViewLayerSet::LayerHit>& hits)
{
    if (hits.empty()) {
        Select(std::nullopt);
        return;
    }
    Select(hits.front().bbox);
}

void Viewer::Select(const std::optional<BBox>& bbox)
{
    // A select callback may call Select() again.
    if (m_selecting_) {
        return;
    }
    m_selecting_ = true;

    std::optional<BBox> const previous = m_selected_;
    m_selected_ = bbox;

    if (m_select_callback_) {
        m_select_callback_(GetSelectedItem(), previous ? previous->GetContext() : nullptr);
    }

    m_selecting_ = false;
    PaintSelected();
}

void Viewer::PaintSelected()
{
    if (!m_layers_) {
        return;
    }
    ViewLayer& layer = m_layers_->Overlay();
    layer.Clear();

    if (m_selected_) {
        BBox const bb = m_selected_->Grow(m_selected_->W() * 0.1);
        BLRgba32 const color = GetSelectionColor();

        LayerScope scope(*m_renderer_, layer.GetName());
        m_renderer_->DrawLine(shapes::Polyline::FromBBox(bb, kSelectionOutlineWidth, color));
        m_renderer_->DrawPolygon(shapes::Polygon::FromBBox(bb, color));
        std::unique_ptr<RenderLayer> graphics = scope.Finish();
        graphics->SetCompositeOperation(CompositeOperation::kOverlay);
        layer.SetGraphics(std::move(graphics));
    }

    Draw();
}

void Viewer::PanBy(const Vec2& screen_delta)
{
    m_camera_.Pan(m_viewport_.ScreenDeltaToWorldDelta(screen_delta, m_camera_));
    Draw();
}

void Viewer::ZoomAt(const Vec2& screen_point, double zoom_factor)
{
    m_camera_.ZoomAt(screen_point, zoom_factor, m_viewport_);
    Draw();
}

void Viewer::ZoomToSelection()
{
    if (!m_selected_) {
        return;
    }
    m_camera_.FocusOnRect(m_selected_->Grow(10), m_viewport_);
    Draw();
}

void Viewer::HighlightLayers(const std::vector<std::string>& names)
{
    if (!m_layers_) {
        return;
    }
    m_layers_->Highlight(names);
    Draw();
}

void Viewer::SetLayers(std::unique_ptr<ViewLayerSet> layers)
{
    m_selected_.reset();
    m_layers_ = std::move(layers);
}
