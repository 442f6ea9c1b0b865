#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <blend2d.h>

#include "render/RenderState.hpp"
#include "render/Shapes.hpp"
#include "utils/BBox.hpp"
#include "utils/ColorUtils.hpp"

class Element;
class Renderer;

enum class CompositeOperation {
    kSourceOver,
    kOverlay,
};

// Compiled drawing list for one named layer. Built between Renderer::StartLayer
// and Renderer::EndLayer, immutable afterwards apart from Clear().
class RenderLayer
{
public:
    explicit RenderLayer(std::string name) : m_name_(std::move(name)) {}
    virtual ~RenderLayer() = default;

    RenderLayer(const RenderLayer&) = delete;
    RenderLayer& operator=(const RenderLayer&) = delete;
    RenderLayer(RenderLayer&&) = delete;
    RenderLayer& operator=(RenderLayer&&) = delete;

    [[nodiscard]] const std::string& GetName() const { return m_name_; }

    [[nodiscard]] CompositeOperation GetCompositeOperation() const { return m_composite_operation_; }
    void SetCompositeOperation(CompositeOperation op) { m_composite_operation_ = op; }

    // Drops all geometry and backend resources.
    virtual void Clear() = 0;

    // 'camera' maps world coordinates to canvas pixels.
    virtual void Render(const Matrix3& camera, double depth, double global_alpha = 1.0) = 0;

protected:
    friend class Renderer;

    // Shapes arrive already transformed and with resolved colors.
    virtual void AddCircle(const shapes::Circle& circle) = 0;
    virtual void AddLine(const shapes::Polyline& line) = 0;
    virtual void AddPolygon(const shapes::Polygon& polygon) = 0;
    // Called once by EndLayer.
    virtual void Commit() {}

private:
    std::string m_name_;
    CompositeOperation m_composite_operation_ = CompositeOperation::kSourceOver;
};

// Backend-independent drawing front end. Painters call the Draw* methods
// between StartLayer and EndLayer; the backend turns the accumulated shapes
// into a RenderLayer.
class Renderer
{
public:
    Renderer();
    virtual ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;
    Renderer(Renderer&&) = delete;
    Renderer& operator=(Renderer&&) = delete;

    virtual bool Setup() = 0;
    virtual void Dispose() = 0;
    virtual void UpdateCanvasSize(int width, int height) = 0;
    virtual void ClearCanvas() = 0;
    virtual void Present() {}

    [[nodiscard]] int GetCanvasWidth() const { return m_canvas_width_; }
    [[nodiscard]] int GetCanvasHeight() const { return m_canvas_height_; }

    [[nodiscard]] BLRgba32 GetBackgroundColor() const { return m_background_color_; }
    virtual void SetBackgroundColor(BLRgba32 color) { m_background_color_ = color; }

    RenderStateStack& State() { return m_state_; }
    [[nodiscard]] const RenderStateStack& State() const { return m_state_; }

    // Object bounding box tracking. Every draw call made while a scope is open
    // grows the scope's box.
    void StartBBox();
    void AddBBox(const BBox& bbox);
    BBox EndBBox(const Element* context);
    [[nodiscard]] bool HasOpenBBox() const { return m_context_.HasBBox(); }

    // Throws InvalidStateError if a layer is already active.
    void StartLayer(const std::string& name);
    // Throws InvalidStateError without an active layer.
    std::unique_ptr<RenderLayer> EndLayer();
    [[nodiscard]] bool HasActiveLayer() const { return m_context_.HasLayer(); }
    // Discards the active layer and any open bbox scope.
    void AbortLayer() noexcept { m_context_.Reset(); }

    void DrawCircle(const shapes::Circle& circle);
    void DrawCircle(const Vec2& center, double radius, BLRgba32 color = color_utils::kTransparentBlack);

    // Drawn as a polyline. Throws std::invalid_argument if start > end.
    void DrawArc(const shapes::Arc& arc);
    void DrawArc(const Vec2& center,
                 double radius,
                 const Angle& start_angle,
                 const Angle& end_angle,
                 std::optional<double> width = std::nullopt,
                 BLRgba32 color = color_utils::kTransparentBlack);

    void DrawLine(const shapes::Polyline& line);
    void DrawLine(const std::vector<Vec2>& points, std::optional<double> width = std::nullopt, BLRgba32 color = color_utils::kTransparentBlack);

    void DrawPolygon(const shapes::Polygon& polygon);
    void DrawPolygon(const std::vector<Vec2>& points, BLRgba32 color = color_utils::kTransparentBlack);

protected:
    virtual std::unique_ptr<RenderLayer> CreateLayer(const std::string& name) = 0;

    void SetCanvasSize(int width, int height)
    {
        m_canvas_width_ = width;
        m_canvas_height_ = height;
    }

private:
    // Open layer and bounding box scope of the paint in progress. All misuse
    // is reported with InvalidStateError.
    class PaintContext
    {
    public:
        [[nodiscard]] bool HasLayer() const { return m_layer_ != nullptr; }
        [[nodiscard]] bool HasBBox() const { return m_bbox_.has_value(); }

        void BeginLayer(std::unique_ptr<RenderLayer> layer);
        RenderLayer& ActiveLayer(const char* operation) const;
        std::unique_ptr<RenderLayer> ReleaseLayer();

        void BeginBBox();
        void GrowBBox(const BBox& bbox);
        BBox ReleaseBBox(const Element* context);

        void Reset() noexcept
        {
            m_layer_.reset();
            m_bbox_.reset();
        }

    private:
        std::unique_ptr<RenderLayer> m_layer_;
        std::optional<BBox> m_bbox_;
    };

    shapes::Circle PrepCircle(shapes::Circle circle);
    shapes::Polyline PrepLine(shapes::Polyline line);
    shapes::Polygon PrepPolygon(shapes::Polygon polygon);

    RenderStateStack m_state_;
    PaintContext m_context_;
    BLRgba32 m_background_color_ = color_utils::kBlack;
    int m_canvas_width_ = 0;
    int m_canvas_height_ = 0;
};

// Keeps a layer open on 'gfx' while in scope. Leaving the scope without
// Finish(), normally or by exception, aborts the layer.
class LayerScope
{
public:
    LayerScope(Renderer& gfx, const std::string& name) : m_gfx_(gfx) { m_gfx_.StartLayer(name); }
    ~LayerScope()
    {
        if (m_open_) {
            m_gfx_.AbortLayer();
        }
    }

    LayerScope(const LayerScope&) = delete;
    LayerScope& operator=(const LayerScope&) = delete;
    LayerScope(LayerScope&&) = delete;
    LayerScope& operator=(LayerScope&&) = delete;

    std::unique_ptr<RenderLayer> Finish()
    {
        m_open_ = false;
        return m_gfx_.EndLayer();
    }

private:
    Renderer& m_gfx_;
    bool m_open_ = true;
};
