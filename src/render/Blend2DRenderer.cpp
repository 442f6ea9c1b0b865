#include "render/Blend2DRenderer.hpp"

#include <algorithm>
#include <iostream>

#include "render/RenderErrors.hpp"

namespace
{
BLMatrix2D ToBLMatrix(const Matrix3& matrix)
{
    const Matrix3::Elements& e = matrix.GetElements();
    return BLMatrix2D(e[0], e[1], e[3], e[4], e[6], e[7]);
}

BLPath PathFromPoints(const std::vector<Vec2>& points, bool close)
{
    BLPath path;
    bool started = false;
    for (const Vec2& point : points) {
        if (!started) {
            path.moveTo(point.x_ax, point.y_ax);
            started = true;
        } else {
            path.lineTo(point.x_ax, point.y_ax);
        }
    }
    if (close && started) {
        path.close();
    }
    return path;
}
}  // namespace

// --- DrawCommand ---

void DrawCommand::Render(BLContext& ctx) const
{
    if (fill) {
        ctx.setFillStyle(*fill);
        ctx.fillPath(path);
    }
    if (stroke) {
        ctx.setStrokeStyle(*stroke);
        ctx.setStrokeWidth(stroke_width);
        ctx.strokePath(path);
    }
}

// --- Blend2DRenderLayer ---

Blend2DRenderLayer::Blend2DRenderLayer(Blend2DRenderer& renderer, std::string name) : RenderLayer(std::move(name)), m_renderer_(renderer) {}

void Blend2DRenderLayer::AddCircle(const shapes::Circle& circle)
{
    BLPath path;
    path.addCircle(BLCircle(circle.center.x_ax, circle.center.y_ax, circle.radius));
    PushPath(path, circle.color, std::nullopt, 0);
}

void Blend2DRenderLayer::AddLine(const shapes::Polyline& line)
{
    PushPath(PathFromPoints(line.points, false), std::nullopt, line.color, line.width);
}

void Blend2DRenderLayer::AddPolygon(const shapes::Polygon& polygon)
{
    PushPath(PathFromPoints(polygon.points, true), polygon.color, std::nullopt, 0);
}

void Blend2DRenderLayer::PushPath(const BLPath& path, std::optional<BLRgba32> fill, std::optional<BLRgba32> stroke, double stroke_width)
{
    if (!m_commands_.empty()) {
        DrawCommand& last = m_commands_.back();
        if (last.path_count < kMaxPathsPerCommand && last.fill == fill && last.stroke == stroke && last.stroke_width == stroke_width) {
            last.path.addPath(path);
            last.path_count++;
            return;
        }
    }
    m_commands_.push_back(DrawCommand {path, fill, stroke, stroke_width, 1});
}

void Blend2DRenderLayer::Render(const Matrix3& camera, double /*depth*/, double global_alpha)
{
    BLContext& ctx = m_renderer_.GetContext();

    ctx.save();
    ctx.setCompOp(GetCompositeOperation() == CompositeOperation::kOverlay ? BL_COMP_OP_OVERLAY : BL_COMP_OP_SRC_OVER);
    ctx.setGlobalAlpha(global_alpha);
    ctx.applyTransform(ToBLMatrix(camera));
    ctx.setStrokeStartCap(BL_STROKE_CAP_ROUND);
    ctx.setStrokeEndCap(BL_STROKE_CAP_ROUND);
    ctx.setStrokeJoin(BL_STROKE_JOIN_ROUND);

    for (const DrawCommand& command : m_commands_) {
        command.Render(ctx);
    }

    ctx.restore();
}

// --- Blend2DRenderer ---

Blend2DRenderer::Blend2DRenderer(SDL_Window* window) : m_window_(window) {}

Blend2DRenderer::~Blend2DRenderer()
{
    Dispose();
}

bool Blend2DRenderer::Setup()
{
    int width = GetCanvasWidth();
    int height = GetCanvasHeight();

    if (m_window_ != nullptr) {
        m_sdl_renderer_ = SDL_CreateRenderer(m_window_, nullptr);
        if (m_sdl_renderer_ == nullptr) {
            std::cerr << "Blend2DRenderer: SDL_CreateRenderer(): " << SDL_GetError() << std::endl;
            return false;
        }
        SDL_GetWindowSizeInPixels(m_window_, &width, &height);
    }

    m_ready_ = true;
    SetCanvasSize(0, 0);
    UpdateCanvasSize(std::max(1, width), std::max(1, height));
    if (m_image_.empty()) {
        Dispose();
        return false;
    }
    std::cout << "Blend2DRenderer: Initialized " << GetCanvasWidth() << "x" << GetCanvasHeight() << (m_window_ ? "" : " (offscreen)") << std::endl;
    return true;
}

void Blend2DRenderer::Dispose()
{
    if (m_context_.isValid()) {
        m_context_.end();
    }
    m_image_.reset();
    ReleaseTexture();
    if (m_sdl_renderer_ != nullptr) {
        SDL_DestroyRenderer(m_sdl_renderer_);
        m_sdl_renderer_ = nullptr;
    }
    m_ready_ = false;
}

bool Blend2DRenderer::CreateImage(int width, int height)
{
    if (m_context_.isValid()) {
        m_context_.end();
    }
    BLImage image;
    BLResult const err = image.create(width, height, BL_FORMAT_PRGB32);
    if (err != BL_SUCCESS) {
        std::cerr << "Blend2DRenderer: Failed to create " << width << "x" << height << " BLImage: " << err << std::endl;
        return false;
    }
    m_image_ = image;
    return true;
}

bool Blend2DRenderer::CreateTexture(int width, int height)
{
    ReleaseTexture();
    if (m_sdl_renderer_ == nullptr) {
        return true;
    }
    // ARGB8888 matches BL_FORMAT_PRGB32
    m_texture_ = SDL_CreateTexture(m_sdl_renderer_, SDL_PIXELFORMAT_ARGB8888, SDL_TEXTUREACCESS_STREAMING, width, height);
    if (m_texture_ == nullptr) {
        std::cerr << "Blend2DRenderer: Failed to create texture: " << SDL_GetError() << std::endl;
        return false;
    }
    if (!SDL_SetTextureBlendMode(m_texture_, SDL_BLENDMODE_BLEND_PREMULTIPLIED)) {
        std::cerr << "Blend2DRenderer: Failed to set blend mode: " << SDL_GetError() << std::endl;
    }
    return true;
}

void Blend2DRenderer::ReleaseTexture()
{
    if (m_texture_ != nullptr) {
        SDL_DestroyTexture(m_texture_);
        m_texture_ = nullptr;
    }
}

void Blend2DRenderer::UpdateCanvasSize(int width, int height)
{
    if (!m_ready_ || width <= 0 || height <= 0) {
        return;
    }
    if (width == GetCanvasWidth() && height == GetCanvasHeight() && !m_image_.empty()) {
        return;
    }
    if (!CreateImage(width, height) || !CreateTexture(width, height)) {
        return;
    }
    SetCanvasSize(width, height);
}

void Blend2DRenderer::ClearCanvas()
{
    if (!m_ready_ || m_image_.empty()) {
        throw InvalidStateError("Blend2DRenderer: ClearCanvas called before Setup");
    }
    if (!m_context_.isValid()) {
        BLResult const err = m_context_.begin(m_image_);
        if (err != BL_SUCCESS) {
            std::cerr << "Blend2DRenderer: Failed to begin BLContext: " << err << std::endl;
            return;
        }
    }
    m_context_.setCompOp(BL_COMP_OP_SRC_COPY);
    m_context_.fillAll(GetBackgroundColor());
    m_context_.setCompOp(BL_COMP_OP_SRC_OVER);
}

BLContext& Blend2DRenderer::GetContext()
{
    if (!m_context_.isValid()) {
        throw InvalidStateError("Blend2DRenderer: no frame in progress, call ClearCanvas first");
    }
    return m_context_;
}

void Blend2DRenderer::Present()
{
    if (m_context_.isValid()) {
        m_context_.end();
    }
    if (m_sdl_renderer_ == nullptr || m_texture_ == nullptr) {
        return;
    }

    BLImageData image_data;
    if (m_image_.getData(&image_data) != BL_SUCCESS) {
        std::cerr << "Blend2DRenderer: Failed to access image data" << std::endl;
        return;
    }
    if (!SDL_UpdateTexture(m_texture_, nullptr, image_data.pixelData, static_cast<int>(image_data.stride))) {
        std::cerr << "Blend2DRenderer: Failed to update texture: " << SDL_GetError() << std::endl;
        return;
    }
    SDL_RenderClear(m_sdl_renderer_);
    SDL_RenderTexture(m_sdl_renderer_, m_texture_, nullptr, nullptr);
    SDL_RenderPresent(m_sdl_renderer_);
}

std::unique_ptr<RenderLayer> Blend2DRenderer::CreateLayer(const std::string& name)
{
    return std::make_unique<Blend2DRenderLayer>(*this, name);
}
