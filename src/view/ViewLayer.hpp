#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <blend2d.h>

#include "render/Renderer.hpp"
#include "utils/BBox.hpp"
#include "utils/ColorUtils.hpp"

class Element;

// Either a fixed flag or a predicate evaluated on every query, typically one
// that follows the visibility of other layers.
using Visibility = std::variant<bool, std::function<bool()>>;

// A named slot in the draw order. Owns the items assigned to it by the
// painters, the compiled graphics for those items and one bounding box per
// item for hit-testing.
class ViewLayer
{
public:
    explicit ViewLayer(std::string name, Visibility visible = true, bool interactive = false, BLRgba32 color = color_utils::kWhite);

    ViewLayer(const ViewLayer&) = delete;
    ViewLayer& operator=(const ViewLayer&) = delete;
    ViewLayer(ViewLayer&&) = delete;
    ViewLayer& operator=(ViewLayer&&) = delete;

    [[nodiscard]] const std::string& GetName() const { return m_name_; }

    [[nodiscard]] bool IsVisible() const;
    void SetVisible(Visibility visible) { m_visible_ = std::move(visible); }

    [[nodiscard]] bool IsHighlighted() const { return m_highlighted_; }
    void SetHighlighted(bool highlighted) { m_highlighted_ = highlighted; }

    // Interactive layers take part in point queries.
    [[nodiscard]] bool IsInteractive() const { return m_interactive_; }
    void SetInteractive(bool interactive) { m_interactive_ = interactive; }

    // Default item color for painters.
    [[nodiscard]] BLRgba32 GetColor() const { return m_color_; }
    void SetColor(BLRgba32 color) { m_color_ = color; }

    [[nodiscard]] double GetOpacity() const { return m_opacity_; }
    void SetOpacity(double opacity) { m_opacity_ = opacity; }

    [[nodiscard]] const std::vector<const Element*>& GetItems() const { return m_items_; }
    void AddItem(const Element* item) { m_items_.push_back(item); }

    [[nodiscard]] RenderLayer* GetGraphics() const { return m_graphics_.get(); }
    void SetGraphics(std::unique_ptr<RenderLayer> graphics) { m_graphics_ = std::move(graphics); }

    // Boxes are in paint order; each box's context is its item.
    [[nodiscard]] const std::vector<BBox>& GetBBoxes() const { return m_bboxes_; }
    void SetBBoxes(std::vector<BBox> bboxes) { m_bboxes_ = std::move(bboxes); }
    [[nodiscard]] const BBox* FindBBox(const Element* item) const;

    // Union of every item box on this layer.
    [[nodiscard]] BBox GetBBox() const { return BBox::Combine(m_bboxes_); }

    [[nodiscard]] std::vector<BBox> QueryPoint(const Vec2& point) const;

    // Drops items, boxes and graphics.
    void Clear();

private:
    std::string m_name_;
    Visibility m_visible_;
    bool m_interactive_;
    BLRgba32 m_color_;
    double m_opacity_ = 1.0;
    bool m_highlighted_ = false;

    std::vector<const Element*> m_items_;
    std::unique_ptr<RenderLayer> m_graphics_;
    std::vector<BBox> m_bboxes_;
};

// Ordered collection of view layers plus the overlay layer. Layers are added
// front to back.
class ViewLayerSet
{
public:
    static constexpr const char* kOverlayName = ":Overlay";

    struct LayerHit {
        ViewLayer* layer;
        BBox bbox;
    };

    ViewLayerSet();
    virtual ~ViewLayerSet();

    ViewLayerSet(const ViewLayerSet&) = delete;
    ViewLayerSet& operator=(const ViewLayerSet&) = delete;
    ViewLayerSet(ViewLayerSet&&) = delete;
    ViewLayerSet& operator=(ViewLayerSet&&) = delete;

    ViewLayer& Add(std::unique_ptr<ViewLayer> layer);
    ViewLayer& Add(const std::string& name, Visibility visible = true, bool interactive = false, BLRgba32 color = color_utils::kWhite);

    [[nodiscard]] size_t Size() const { return m_layer_list_.size(); }

    // Insertion order (front to back), without the overlay.
    [[nodiscard]] std::vector<ViewLayer*> InOrder() const;
    // Drawing order (back to front): regular layers, then highlighted layers,
    // then the overlay.
    [[nodiscard]] std::vector<ViewLayer*> InDisplayOrder() const;

    // nullptr when there is no such layer.
    [[nodiscard]] ViewLayer* ByName(const std::string& name) const;
    [[nodiscard]] std::vector<ViewLayer*> Query(const std::function<bool(const ViewLayer&)>& predicate) const;

    // Always visible, always drawn last.
    [[nodiscard]] ViewLayer& Overlay() const { return *m_overlay_; }

    // Highlights exactly the named layers; an empty list clears highlighting.
    virtual void Highlight(const std::vector<std::string>& names);
    void Highlight(const std::string& name) { Highlight(std::vector<std::string> {name}); }
    void ClearHighlight() { Highlight(std::vector<std::string> {}); }
    [[nodiscard]] bool IsAnyLayerHighlighted() const;

    // Visible interactive layers in insertion order.
    [[nodiscard]] virtual std::vector<ViewLayer*> InteractiveLayers() const;

    // Hits on interactive layers, front layer first, paint order within a layer.
    [[nodiscard]] std::vector<LayerHit> QueryPoint(const Vec2& point) const;
    [[nodiscard]] std::vector<BBox> QueryItemBBoxes(const Element* item) const;

    // Union of every layer's box.
    [[nodiscard]] BBox GetBBox() const;

    void Clear();

private:
    std::vector<std::unique_ptr<ViewLayer>> m_layer_list_;
    std::unordered_map<std::string, ViewLayer*> m_layer_map_;
    std::unique_ptr<ViewLayer> m_overlay_;
};
