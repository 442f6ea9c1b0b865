#include "view/Painter.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

// --- ItemPainter ---

const Theme& ItemPainter::GetTheme() const
{
    return m_view_painter_.GetTheme();
}

// --- DocumentPainter ---

DocumentPainter::DocumentPainter(Renderer& gfx, ViewLayerSet& layers, const Theme& theme) : m_gfx_(gfx), m_layers_(layers), m_theme_(theme) {}

DocumentPainter::~DocumentPainter() = default;

void DocumentPainter::AddPainter(std::unique_ptr<ItemPainter> painter)
{
    for (ElementType type : painter->Classes()) {
        m_painters_[type] = painter.get();
    }
    m_painter_list_.push_back(std::move(painter));
}

ItemPainter* DocumentPainter::PainterFor(const Element& item) const
{
    auto it = m_painters_.find(item.GetElementType());
    return it == m_painters_.end() ? nullptr : it->second;
}

std::vector<std::string> DocumentPainter::LayersFor(const Element& item) const
{
    ItemPainter* painter = PainterFor(item);
    if (painter == nullptr) {
        return {};
    }
    return painter->LayersFor(item);
}

void DocumentPainter::Paint(const PaintableDocument& document)
{
    // Sort paintable items into layers
    for (const Element* item : document.Items()) {
        ItemPainter* painter = PainterFor(*item);
        if (painter == nullptr) {
            std::cerr << "DocumentPainter: No painter found for " << ElementTypeName(item->GetElementType()) << std::endl;
            continue;
        }

        for (const std::string& layer_name : painter->LayersFor(*item)) {
            if (ViewLayer* layer = m_layers_.ByName(layer_name)) {
                layer->AddItem(item);
            }
        }
    }

    for (ViewLayer* layer : PaintableLayers()) {
        PaintLayer(*layer);
    }
}

void DocumentPainter::PaintLayer(ViewLayer& layer)
{
    std::vector<BBox> bboxes;
    bboxes.reserve(layer.GetItems().size());

    LayerScope scope(m_gfx_, layer.GetName());

    for (const Element* item : layer.GetItems()) {
        m_gfx_.StartBBox();
        TryPaintItem(layer, *item);
        bboxes.push_back(m_gfx_.EndBBox(item));
    }

    layer.SetGraphics(scope.Finish());
    layer.SetBBoxes(std::move(bboxes));
}

void DocumentPainter::PaintItem(ViewLayer& layer, const Element& item)
{
    if (ItemPainter* painter = PainterFor(item)) {
        painter->Paint(layer, item);
    }
}

bool DocumentPainter::TryPaintItem(ViewLayer& layer, const Element& item)
{
    size_t const depth = m_gfx_.State().Depth();
    try {
        PaintItem(layer, item);
    } catch (const std::exception& e) {
        m_gfx_.State().Truncate(depth);
        std::cerr << "DocumentPainter: Failed to paint " << ElementTypeName(item.GetElementType()) << " on " << layer.GetName() << ": " << e.what()
                  << std::endl;
        return false;
    }
    return true;
}

void DocumentPainter::DrawText(const std::string& text, const Vec2& position, double angle_deg, const TextOptions& options, BLRgba32 color)
{
    if (m_text_shaper_ == nullptr || text.empty()) {
        return;
    }

    Matrix3 matrix = Matrix3::Translation(position.x_ax, position.y_ax);
    matrix.RotateSelf(Angle::DegToRad(angle_deg));

    ScopedRenderState state(m_gfx_.State());
    m_gfx_.State().Multiply(matrix);
    for (const auto& stroke : m_text_shaper_->Shape(text, options)) {
        m_gfx_.DrawLine(stroke, options.thickness, color);
    }
}

void DocumentPainter::DrawTextBox(const std::string& text, const Vec2& position, double angle_deg, const TextOptions& options, BLRgba32 color)
{
    BBox const extent = TextExtent(text, options);
    if (!extent.IsValid()) {
        return;
    }

    Matrix3 matrix = Matrix3::Translation(position.x_ax, position.y_ax);
    matrix.RotateSelf(Angle::DegToRad(angle_deg));

    ScopedRenderState state(m_gfx_.State());
    m_gfx_.State().Multiply(matrix);
    m_gfx_.DrawPolygon(shapes::Polygon::FromBBox(extent, color));
}

BBox DocumentPainter::TextExtent(const std::string& text, const TextOptions& options) const
{
    if (text.empty()) {
        return {};
    }

    if (m_text_shaper_ != nullptr) {
        std::vector<Vec2> points;
        for (const auto& stroke : m_text_shaper_->Shape(text, options)) {
            points.insert(points.end(), stroke.begin(), stroke.end());
        }
        if (!points.empty()) {
            return BBox::FromPoints(points).Grow(options.thickness / 2);
        }
    }

    // One glyph cell per character.
    double const w = options.size.x_ax * static_cast<double>(text.size());
    double const h = options.size.y_ax;

    double x = -w / 2;
    if (options.h_align == TextHAlign::kLeft) {
        x = 0;
    } else if (options.h_align == TextHAlign::kRight) {
        x = -w;
    }

    double y = -h / 2;
    if (options.v_align == TextVAlign::kTop) {
        y = 0;
    } else if (options.v_align == TextVAlign::kBottom) {
        y = -h;
    }

    return {x, y, w, h};
}

// --- StrokePainter ---

void StrokePainter::Line(const std::vector<Vec2>& points, double width, StrokeType type, const DashRatios& ratios, const DrawLineFn& draw_line)
{
    double const dot_len = DotLength(width);
    double const dash_len = DashLength(width, ratios);
    double const gap_len = GapLength(width, ratios);

    std::vector<double> pattern;
    switch (type) {
        case StrokeType::kDash:
            pattern = {dash_len, gap_len};
            break;
        case StrokeType::kDot:
            pattern = {dot_len, gap_len};
            break;
        case StrokeType::kDashDot:
            pattern = {dash_len, gap_len, dot_len, gap_len};
            break;
        case StrokeType::kDashDotDot:
            pattern = {dash_len, gap_len, dot_len, gap_len, dot_len, gap_len};
            break;
        case StrokeType::kDefault:
        case StrokeType::kSolid:
        default:
            draw_line(points);
            return;
    }

    // A zero width would never advance along the line.
    if (width <= 0) {
        draw_line(points);
        return;
    }

    for (size_t i = 0; i + 1 < points.size(); ++i) {
        LineHelper(points[i], points[i + 1], pattern, draw_line);
    }
}

void StrokePainter::LineHelper(const Vec2& start, const Vec2& end, const std::vector<double>& pattern, const DrawLineFn& draw_line)
{
    Vec2 const line_vec = end - start;
    double const line_len = line_vec.Length();
    if (line_len == 0) {
        return;
    }
    Vec2 const line_dir = line_vec.Normalized();

    double draw_len = 0.0;
    size_t pattern_index = 0;
    while (draw_len < line_len) {
        double const segment_len = std::min(pattern[pattern_index], line_len - draw_len);

        // Even entries are drawn, odd entries are gaps.
        if (pattern_index % 2 == 0 && segment_len > 0) {
            Vec2 const seg_start = start + (line_dir * draw_len);
            Vec2 const seg_end = seg_start + (line_dir * segment_len);
            draw_line({seg_start, seg_end});
        }

        draw_len += segment_len;
        pattern_index = (pattern_index + 1) % pattern.size();
    }
}
