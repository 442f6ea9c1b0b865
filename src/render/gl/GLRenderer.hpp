#pragma once

#include <memory>
#include <string>

#include <SDL3/SDL.h>

#include "render/PrimitiveSet.hpp"
#include "render/Renderer.hpp"
#include "render/gl/GLHelpers.hpp"

class GLRenderer;

// GPU copy of a committed PrimitiveSet: one vertex array per stream.
class GLPrimitiveBuffers
{
public:
    GLPrimitiveBuffers(const gl::ShaderProgram& shader, const VertexData& data, bool has_caps);

    GLPrimitiveBuffers(const GLPrimitiveBuffers&) = delete;
    GLPrimitiveBuffers& operator=(const GLPrimitiveBuffers&) = delete;
    GLPrimitiveBuffers(GLPrimitiveBuffers&&) = delete;
    GLPrimitiveBuffers& operator=(GLPrimitiveBuffers&&) = delete;

    void Render(const Matrix3& matrix, double depth, double alpha) const;

private:
    const gl::ShaderProgram& m_shader_;
    gl::VertexArray m_vao_;
    gl::Buffer m_position_buf_;
    gl::Buffer m_cap_region_buf_;
    gl::Buffer m_color_buf_;
    GLsizei m_vertex_count_ = 0;
};

class GLRenderLayer : public RenderLayer
{
public:
    GLRenderLayer(GLRenderer& renderer, std::string name);
    ~GLRenderLayer() override;

    void Clear() override;
    void Render(const Matrix3& camera, double depth, double global_alpha) override;

    [[nodiscard]] const PrimitiveSet& GetGeometry() const { return m_geometry_; }

protected:
    void AddCircle(const shapes::Circle& circle) override { m_geometry_.AddCircle(circle); }
    void AddLine(const shapes::Polyline& line) override { m_geometry_.AddLine(line); }
    void AddPolygon(const shapes::Polygon& polygon) override { m_geometry_.AddPolygon(polygon); }
    void Commit() override;

private:
    GLRenderer& m_renderer_;
    PrimitiveSet m_geometry_;
    std::unique_ptr<GLPrimitiveBuffers> m_polygons_;
    std::unique_ptr<GLPrimitiveBuffers> m_circles_;
    std::unique_ptr<GLPrimitiveBuffers> m_polylines_;
};

// OpenGL 3.3 core backend drawing into an SDL window.
class GLRenderer : public Renderer
{
public:
    explicit GLRenderer(SDL_Window* window);
    ~GLRenderer() override;

    bool Setup() override;
    void Dispose() override;
    void UpdateCanvasSize(int width, int height) override;
    void ClearCanvas() override;
    void Present() override;
    void SetBackgroundColor(BLRgba32 color) override;

    [[nodiscard]] const Matrix3& GetProjectionMatrix() const { return m_projection_matrix_; }
    [[nodiscard]] const gl::ShaderProgram& GetPolylineShader() const { return m_polyline_shader_; }
    [[nodiscard]] const gl::ShaderProgram& GetPolygonShader() const { return m_polygon_shader_; }
    [[nodiscard]] bool IsReady() const { return m_gl_context_ != nullptr; }

protected:
    std::unique_ptr<RenderLayer> CreateLayer(const std::string& name) override;

private:
    SDL_Window* m_window_;
    SDL_GLContext m_gl_context_ = nullptr;
    gl::ShaderProgram m_polyline_shader_;
    gl::ShaderProgram m_polygon_shader_;
    Matrix3 m_projection_matrix_;
};
