#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "render/Renderer.hpp"

// Keeps the prepared shapes so they can be inspected. Nothing is drawn.
class NullRenderLayer : public RenderLayer
{
public:
    explicit NullRenderLayer(std::string name) : RenderLayer(std::move(name)) {}

    void Clear() override;
    void Render(const Matrix3& camera, double depth, double global_alpha) override;

    [[nodiscard]] const std::vector<shapes::Circle>& GetCircles() const { return m_circles_; }
    [[nodiscard]] const std::vector<shapes::Polyline>& GetLines() const { return m_lines_; }
    [[nodiscard]] const std::vector<shapes::Polygon>& GetPolygons() const { return m_polygons_; }
    [[nodiscard]] size_t ShapeCount() const { return m_circles_.size() + m_lines_.size() + m_polygons_.size(); }

    [[nodiscard]] int GetRenderCount() const { return m_render_count_; }
    [[nodiscard]] double GetLastDepth() const { return m_last_depth_; }
    [[nodiscard]] double GetLastAlpha() const { return m_last_alpha_; }

protected:
    void AddCircle(const shapes::Circle& circle) override { m_circles_.push_back(circle); }
    void AddLine(const shapes::Polyline& line) override { m_lines_.push_back(line); }
    void AddPolygon(const shapes::Polygon& polygon) override { m_polygons_.push_back(polygon); }

private:
    std::vector<shapes::Circle> m_circles_;
    std::vector<shapes::Polyline> m_lines_;
    std::vector<shapes::Polygon> m_polygons_;
    int m_render_count_ = 0;
    double m_last_depth_ = 0.0;
    double m_last_alpha_ = 0.0;
};

class NullRenderer : public Renderer
{
public:
    bool Setup() override { return true; }
    void Dispose() override {}
    void UpdateCanvasSize(int width, int height) override { SetCanvasSize(width, height); }
    void ClearCanvas() override { m_clear_count_++; }

    [[nodiscard]] int GetClearCount() const { return m_clear_count_; }

protected:
    std::unique_ptr<RenderLayer> CreateLayer(const std::string& name) override { return std::make_unique<NullRenderLayer>(name); }

private:
    int m_clear_count_ = 0;
};
