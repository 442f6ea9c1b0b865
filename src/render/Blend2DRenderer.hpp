#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <SDL3/SDL.h>
#include <blend2d.h>

#include "render/Renderer.hpp"

class Blend2DRenderer;

// One path plus the style it is filled and/or stroked with.
struct DrawCommand {
    BLPath path;
    std::optional<BLRgba32> fill;
    std::optional<BLRgba32> stroke;
    double stroke_width = 0.0;
    int path_count = 1;

    void Render(BLContext& ctx) const;
};

class Blend2DRenderLayer : public RenderLayer
{
public:
    static constexpr int kMaxPathsPerCommand = 20;

    Blend2DRenderLayer(Blend2DRenderer& renderer, std::string name);

    void Clear() override { m_commands_.clear(); }
    void Render(const Matrix3& camera, double depth, double global_alpha) override;

    [[nodiscard]] const std::vector<DrawCommand>& GetCommands() const { return m_commands_; }

protected:
    void AddCircle(const shapes::Circle& circle) override;
    void AddLine(const shapes::Polyline& line) override;
    void AddPolygon(const shapes::Polygon& polygon) override;

private:
    // Appends to the previous command when the style matches.
    void PushPath(const BLPath& path, std::optional<BLRgba32> fill, std::optional<BLRgba32> stroke, double stroke_width);

    Blend2DRenderer& m_renderer_;
    std::vector<DrawCommand> m_commands_;
};

// Software backend: rasterizes into a BLImage which is uploaded to an SDL
// texture on Present(). Without a window it renders offscreen only.
class Blend2DRenderer : public Renderer
{
public:
    explicit Blend2DRenderer(SDL_Window* window = nullptr);
    ~Blend2DRenderer() override;

    bool Setup() override;
    void Dispose() override;
    void UpdateCanvasSize(int width, int height) override;
    void ClearCanvas() override;
    void Present() override;

    // Throws InvalidStateError when no frame is in progress.
    BLContext& GetContext();
    [[nodiscard]] const BLImage& GetImage() const { return m_image_; }

protected:
    std::unique_ptr<RenderLayer> CreateLayer(const std::string& name) override;

private:
    bool CreateImage(int width, int height);
    bool CreateTexture(int width, int height);
    void ReleaseTexture();

    SDL_Window* m_window_;
    SDL_Renderer* m_sdl_renderer_ = nullptr;
    SDL_Texture* m_texture_ = nullptr;
    BLImage m_image_;
    BLContext m_context_;
    bool m_ready_ = false;
};
