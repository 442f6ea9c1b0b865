#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "document/Document.hpp"
#include "document/Element.hpp"
#include "document/Stroke.hpp"
#include "render/Renderer.hpp"
#include "text/TextShaper.hpp"
#include "view/Theme.hpp"
#include "view/ViewLayer.hpp"

class DocumentPainter;

// Draws one or more element types. LayersFor decides which view layers an
// element lands on; Paint is then called once per layer.
class ItemPainter
{
public:
    ItemPainter(DocumentPainter& view_painter, Renderer& gfx) : m_view_painter_(view_painter), m_gfx_(gfx) {}
    virtual ~ItemPainter() = default;

    ItemPainter(const ItemPainter&) = delete;
    ItemPainter& operator=(const ItemPainter&) = delete;
    ItemPainter(ItemPainter&&) = delete;
    ItemPainter& operator=(ItemPainter&&) = delete;

    // Element types this painter is registered for.
    [[nodiscard]] virtual std::vector<ElementType> Classes() const = 0;
    [[nodiscard]] virtual std::vector<std::string> LayersFor(const Element& item) const = 0;
    virtual void Paint(ViewLayer& layer, const Element& item) = 0;

protected:
    [[nodiscard]] const Theme& GetTheme() const;

    DocumentPainter& m_view_painter_;
    Renderer& m_gfx_;
};

struct DashRatios {
    double dash = 12.0;
    double gap = 3.0;
};

// Paints a whole document: items are first sorted into view layers, then each
// layer is painted back to front into its own RenderLayer.
class DocumentPainter
{
public:
    DocumentPainter(Renderer& gfx, ViewLayerSet& layers, const Theme& theme);
    virtual ~DocumentPainter();

    DocumentPainter(const DocumentPainter&) = delete;
    DocumentPainter& operator=(const DocumentPainter&) = delete;
    DocumentPainter(DocumentPainter&&) = delete;
    DocumentPainter& operator=(DocumentPainter&&) = delete;

    void Paint(const PaintableDocument& document);
    void PaintLayer(ViewLayer& layer);
    // Dispatches to the registered painter; unknown types draw nothing.
    void PaintItem(ViewLayer& layer, const Element& item);
    // PaintItem that logs a failing item and restores the render state
    // instead of throwing. Returns false if the item failed.
    bool TryPaintItem(ViewLayer& layer, const Element& item);

    [[nodiscard]] ItemPainter* PainterFor(const Element& item) const;
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& item) const;
    [[nodiscard]] size_t PainterCount() const { return m_painters_.size(); }

    [[nodiscard]] Renderer& GetRenderer() const { return m_gfx_; }
    [[nodiscard]] ViewLayerSet& GetLayers() const { return m_layers_; }
    [[nodiscard]] const Theme& GetTheme() const { return m_theme_; }

    [[nodiscard]] const DashRatios& GetDashRatios() const { return m_dash_ratios_; }
    void SetDashRatios(const DashRatios& ratios) { m_dash_ratios_ = ratios; }

    // Glyph source for text items. Without one, text is skipped but items
    // keep their layers and clickable boxes.
    [[nodiscard]] const TextShaper* GetTextShaper() const { return m_text_shaper_; }
    void SetTextShaper(const TextShaper* shaper) { m_text_shaper_ = shaper; }

    // Strokes 'text' with its anchor at 'position', rotated by 'angle_deg'.
    void DrawText(const std::string& text, const Vec2& position, double angle_deg, const TextOptions& options, BLRgba32 color);
    // Fills the area the text covers, used to make text clickable.
    void DrawTextBox(const std::string& text, const Vec2& position, double angle_deg, const TextOptions& options, BLRgba32 color);
    // Local extent of the shaped text, estimated from the glyph size without a shaper.
    [[nodiscard]] BBox TextExtent(const std::string& text, const TextOptions& options) const;

protected:
    // Registers the painter for every type in its Classes(); later painters
    // replace earlier ones for the same type.
    void AddPainter(std::unique_ptr<ItemPainter> painter);

    [[nodiscard]] virtual std::vector<ViewLayer*> PaintableLayers() const { return m_layers_.InDisplayOrder(); }

    Renderer& m_gfx_;
    ViewLayerSet& m_layers_;
    const Theme& m_theme_;

private:
    std::vector<std::unique_ptr<ItemPainter>> m_painter_list_;
    std::unordered_map<ElementType, ItemPainter*> m_painters_;
    DashRatios m_dash_ratios_;
    const TextShaper* m_text_shaper_ = nullptr;
};

// Splits polylines into dash/dot patterns the way KiCad strokes them.
class StrokePainter
{
public:
    using DrawLineFn = std::function<void(const std::vector<Vec2>&)>;

    static double DotLength(double width) { return width * 0.2; }
    static double DashLength(double width, const DashRatios& ratios) { return width * ratios.dash; }
    static double GapLength(double width, const DashRatios& ratios) { return width * ratios.gap; }

    // Solid and default strokes pass the points through in one call; patterned
    // strokes call draw_line once per visible dash or dot.
    static void Line(const std::vector<Vec2>& points, double width, StrokeType type, const DashRatios& ratios, const DrawLineFn& draw_line);

private:
    static void LineHelper(const Vec2& start, const Vec2& end, const std::vector<double>& pattern, const DrawLineFn& draw_line);
};
