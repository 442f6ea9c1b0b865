#include "render/gl/GLRenderer.hpp"

#include <iostream>

#include "render/RenderErrors.hpp"
#include "render/gl/GLShaders.hpp"

// --- GLPrimitiveBuffers ---

GLPrimitiveBuffers::GLPrimitiveBuffers(const gl::ShaderProgram& shader, const VertexData& data, bool has_caps) : m_shader_(shader)
{
    m_vao_.AttachBuffer(m_position_buf_, m_shader_.Attribute("a_position"), 2);
    m_vao_.AttachBuffer(m_color_buf_, m_shader_.Attribute("a_color"), 4);
    if (has_caps) {
        m_vao_.AttachBuffer(m_cap_region_buf_, m_shader_.Attribute("a_cap_region"), 1);
    }

    m_position_buf_.Set(data.positions);
    m_color_buf_.Set(data.colors);
    if (has_caps) {
        m_cap_region_buf_.Set(data.caps);
    }
    m_vertex_count_ = static_cast<GLsizei>(data.VertexCount());
    glBindVertexArray(0);
}

void GLPrimitiveBuffers::Render(const Matrix3& matrix, double depth, double alpha) const
{
    if (m_vertex_count_ == 0) {
        return;
    }
    m_shader_.Bind();
    std::array<float, 9> const elements = matrix.ToFloatArray();
    glUniformMatrix3fv(m_shader_.Uniform("u_matrix"), 1, GL_FALSE, elements.data());
    glUniform1f(m_shader_.Uniform("u_depth"), static_cast<GLfloat>(depth));
    glUniform1f(m_shader_.Uniform("u_alpha"), static_cast<GLfloat>(alpha));
    m_vao_.Bind();
    glDrawArrays(GL_TRIANGLES, 0, m_vertex_count_);
}

// --- GLRenderLayer ---

GLRenderLayer::GLRenderLayer(GLRenderer& renderer, std::string name) : RenderLayer(std::move(name)), m_renderer_(renderer) {}

GLRenderLayer::~GLRenderLayer() = default;

void GLRenderLayer::Commit()
{
    m_geometry_.Commit();

    if (!m_geometry_.GetPolygonData().Empty()) {
        m_polygons_ = std::make_unique<GLPrimitiveBuffers>(m_renderer_.GetPolygonShader(), m_geometry_.GetPolygonData(), false);
    }
    if (!m_geometry_.GetCircleData().Empty()) {
        m_circles_ = std::make_unique<GLPrimitiveBuffers>(m_renderer_.GetPolylineShader(), m_geometry_.GetCircleData(), true);
    }
    if (!m_geometry_.GetPolylineData().Empty()) {
        m_polylines_ = std::make_unique<GLPrimitiveBuffers>(m_renderer_.GetPolylineShader(), m_geometry_.GetPolylineData(), true);
    }
    // The GPU holds the only copy from here on
    m_geometry_.Clear();
}

void GLRenderLayer::Clear()
{
    m_polygons_.reset();
    m_circles_.reset();
    m_polylines_.reset();
    m_geometry_.Clear();
}

void GLRenderLayer::Render(const Matrix3& camera, double depth, double global_alpha)
{
    Matrix3 const total_transform = m_renderer_.GetProjectionMatrix().Multiply(camera);
    bool const overlay = GetCompositeOperation() != CompositeOperation::kSourceOver;

    if (overlay) {
        glBlendFunc(GL_ONE_MINUS_DST_COLOR, GL_ONE_MINUS_SRC_ALPHA);
    }

    if (m_polygons_) {
        m_polygons_->Render(total_transform, depth, global_alpha);
    }
    if (m_circles_) {
        m_circles_->Render(total_transform, depth, global_alpha);
    }
    if (m_polylines_) {
        m_polylines_->Render(total_transform, depth, global_alpha);
    }

    if (overlay) {
        glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    }
}

// --- GLRenderer ---

GLRenderer::GLRenderer(SDL_Window* window) : m_window_(window) {}

GLRenderer::~GLRenderer()
{
    Dispose();
}

bool GLRenderer::Setup()
{
    if (m_window_ == nullptr) {
        std::cerr << "GLRenderer: No window to create a context for" << std::endl;
        return false;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 24);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    m_gl_context_ = SDL_GL_CreateContext(m_window_);
    if (m_gl_context_ == nullptr) {
        std::cerr << "GLRenderer: Unable to create OpenGL 3.3 context: " << SDL_GetError() << std::endl;
        return false;
    }
    if (!SDL_GL_MakeCurrent(m_window_, m_gl_context_)) {
        std::cerr << "GLRenderer: SDL_GL_MakeCurrent(): " << SDL_GetError() << std::endl;
        Dispose();
        return false;
    }
    SDL_GL_SetSwapInterval(1);

    std::cout << "GLRenderer: OpenGL " << reinterpret_cast<const char*>(glGetString(GL_VERSION)) << std::endl;

    glEnable(GL_BLEND);
    glBlendEquation(GL_FUNC_ADD);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    glEnable(GL_DEPTH_TEST);
    glDepthFunc(GL_GREATER);

    SetBackgroundColor(GetBackgroundColor());
    glClearDepth(0);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

    if (!m_polyline_shader_.Load("polyline", gl::shaders::kPolylineVertex, gl::shaders::kPolylineFragment) ||
        !m_polygon_shader_.Load("polygon", gl::shaders::kPolygonVertex, gl::shaders::kPolygonFragment)) {
        std::cerr << "GLRenderer: Shader setup failed" << std::endl;
        Dispose();
        return false;
    }

    int width = 0;
    int height = 0;
    SDL_GetWindowSizeInPixels(m_window_, &width, &height);
    UpdateCanvasSize(width, height);
    return true;
}

void GLRenderer::Dispose()
{
    if (m_gl_context_ != nullptr) {
        // Shader programs belong to this context and go first.
        if (SDL_GL_MakeCurrent(m_window_, m_gl_context_)) {
            m_polyline_shader_.Release();
            m_polygon_shader_.Release();
        } else {
            std::cerr << "GLRenderer: Cannot release shaders, SDL_GL_MakeCurrent(): " << SDL_GetError() << std::endl;
        }
        SDL_GL_DestroyContext(m_gl_context_);
        m_gl_context_ = nullptr;
    }
}

void GLRenderer::UpdateCanvasSize(int width, int height)
{
    if (m_gl_context_ == nullptr || width <= 0 || height <= 0) {
        return;
    }
    if (width == GetCanvasWidth() && height == GetCanvasHeight()) {
        return;
    }
    SetCanvasSize(width, height);
    glViewport(0, 0, width, height);
    m_projection_matrix_ = Matrix3::Orthographic(width, height);
}

void GLRenderer::SetBackgroundColor(BLRgba32 color)
{
    Renderer::SetBackgroundColor(color);
    if (m_gl_context_ == nullptr) {
        return;
    }
    std::array<float, 4> const rgba = color_utils::ToFloat4(color);
    glClearColor(rgba[0], rgba[1], rgba[2], rgba[3]);
}

void GLRenderer::ClearCanvas()
{
    if (m_gl_context_ == nullptr) {
        throw InvalidStateError("GLRenderer: ClearCanvas called before Setup");
    }
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
}

void GLRenderer::Present()
{
    if (m_gl_context_ != nullptr) {
        SDL_GL_SwapWindow(m_window_);
    }
}

std::unique_ptr<RenderLayer> GLRenderer::CreateLayer(const std::string& name)
{
    if (m_gl_context_ == nullptr) {
        throw InvalidStateError("GLRenderer: StartLayer called before Setup");
    }
    return std::make_unique<GLRenderLayer>(*this, name);
}
