#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <blend2d.h>

#include "render/Renderer.hpp"
#include "utils/BBox.hpp"
#include "view/Camera.hpp"
#include "view/Painter.hpp"
#include "view/ViewLayer.hpp"
#include "view/Viewport.hpp"

class Config;

struct ViewerSettings {
    double dim_alpha = 0.25;
    double min_zoom = Camera::kDefaultMinZoom;
    double max_zoom = Camera::kDefaultMaxZoom;
    DashRatios dash_ratios;

    static ViewerSettings FromConfig(const Config& config);
};

// Owns a renderer, a camera and the current view layer set. Redraws are
// coalesced: Draw() only marks the frame dirty and FlushPendingDraw() does
// the work at most once per frame.
class Viewer
{
public:
    using SelectCallback = std::function<void(const Element* item, const Element* previous)>;

    static constexpr double kFirstLayerDepth = 0.01;
    static constexpr double kLayerDepthStep = 0.01;
    static constexpr double kSelectionOutlineWidth = 0.254;

    explicit Viewer(std::unique_ptr<Renderer> renderer, ViewerSettings settings = {});
    virtual ~Viewer();

    Viewer(const Viewer&) = delete;
    Viewer& operator=(const Viewer&) = delete;
    Viewer(Viewer&&) = delete;
    Viewer& operator=(Viewer&&) = delete;

    bool Setup();
    void Dispose();
    [[nodiscard]] bool IsReady() const { return m_ready_; }

    // Canvas size in pixels.
    void Resize(int width, int height);

    [[nodiscard]] Renderer& GetRenderer() const { return *m_renderer_; }
    [[nodiscard]] Camera& GetCamera() { return m_camera_; }
    [[nodiscard]] const Viewport& GetViewport() const { return m_viewport_; }
    [[nodiscard]] ViewLayerSet* GetLayers() const { return m_layers_.get(); }
    [[nodiscard]] const ViewerSettings& GetSettings() const { return m_settings_; }

    void Draw();
    [[nodiscard]] bool HasPendingDraw() const { return m_draw_requested_; }
    // Returns true if a frame was drawn.
    bool FlushPendingDraw();

    // Mouse position in world coordinates.
    void SetMousePosition(const Vec2& screen_point);
    [[nodiscard]] const Vec2& GetMousePosition() const { return m_mouse_position_; }

    // Selects the first item under the screen point, or clears the selection.
    void Pick(const Vec2& screen_point);
    void Select(const std::optional<BBox>& bbox);
    [[nodiscard]] const std::optional<BBox>& GetSelected() const { return m_selected_; }
    [[nodiscard]] const Element* GetSelectedItem() const { return m_selected_ ? m_selected_->GetContext() : nullptr; }
    void SetSelectCallback(SelectCallback callback) { m_select_callback_ = std::move(callback); }

    [[nodiscard]] virtual BLRgba32 GetSelectionColor() const { return color_utils::kWhite; }

    void PanBy(const Vec2& screen_delta);
    void ZoomAt(const Vec2& screen_point, double zoom_factor);
    void ZoomToSelection();
    virtual void ZoomToPage() = 0;

    // Highlights the named layers and dims the others.
    virtual void HighlightLayers(const std::vector<std::string>& names);

protected:
    virtual void OnDraw();
    void OnPick(const std::vector<ViewLayerSet::LayerHit>& hits);
    void PaintSelected();

    // Replaces the layer set; the previous selection refers to dropped items.
    void SetLayers(std::unique_ptr<ViewLayerSet> layers);

    std::unique_ptr<Renderer> m_renderer_;
    Camera m_camera_;
    Viewport m_viewport_;
    std::unique_ptr<ViewLayerSet> m_layers_;

private:
    ViewerSettings m_settings_;
    SelectCallback m_select_callback_;
    std::optional<BBox> m_selected_;
    Vec2 m_mouse_position_;
    bool m_draw_requested_ = false;
    bool m_selecting_ = false;
    bool m_ready_ = false;
};
