#include "view/ViewLayer.hpp"

#include <algorithm>

// --- ViewLayer ---

ViewLayer::ViewLayer(std::string name, Visibility visible, bool interactive, BLRgba32 color)
    : m_name_(std::move(name)), m_visible_(std::move(visible)), m_interactive_(interactive), m_color_(color)
{
}

bool ViewLayer::IsVisible() const
{
    if (const auto* predicate = std::get_if<std::function<bool()>>(&m_visible_)) {
        return *predicate && (*predicate)();
    }
    return std::get<bool>(m_visible_);
}

const BBox* ViewLayer::FindBBox(const Element* item) const
{
    for (const BBox& bbox : m_bboxes_) {
        if (bbox.GetContext() == item) {
            return &bbox;
        }
    }
    return nullptr;
}

std::vector<BBox> ViewLayer::QueryPoint(const Vec2& point) const
{
    std::vector<BBox> hits;
    for (const BBox& bbox : m_bboxes_) {
        if (bbox.ContainsPoint(point)) {
            hits.push_back(bbox);
        }
    }
    return hits;
}

void ViewLayer::Clear()
{
    if (m_graphics_) {
        m_graphics_->Clear();
    }
    m_graphics_.reset();
    m_items_.clear();
    m_bboxes_.clear();
}

// --- ViewLayerSet ---

ViewLayerSet::ViewLayerSet() : m_overlay_(std::make_unique<ViewLayer>(kOverlayName, true, false, color_utils::kWhite)) {}

ViewLayerSet::~ViewLayerSet()
{
    Clear();
}

ViewLayer& ViewLayerSet::Add(std::unique_ptr<ViewLayer> layer)
{
    ViewLayer& added = *layer;
    m_layer_map_[added.GetName()] = layer.get();
    m_layer_list_.push_back(std::move(layer));
    return added;
}

ViewLayer& ViewLayerSet::Add(const std::string& name, Visibility visible, bool interactive, BLRgba32 color)
{
    return Add(std::make_unique<ViewLayer>(name, std::move(visible), interactive, color));
}

std::vector<ViewLayer*> ViewLayerSet::InOrder() const
{
    std::vector<ViewLayer*> layers;
    layers.reserve(m_layer_list_.size());
    for (const auto& layer : m_layer_list_) {
        layers.push_back(layer.get());
    }
    return layers;
}

std::vector<ViewLayer*> ViewLayerSet::InDisplayOrder() const
{
    std::vector<ViewLayer*> layers;
    layers.reserve(m_layer_list_.size() + 1);

    for (auto it = m_layer_list_.rbegin(); it != m_layer_list_.rend(); ++it) {
        if (!(*it)->IsHighlighted()) {
            layers.push_back(it->get());
        }
    }

    // Highlighted layers are drawn above the regular ones.
    for (auto it = m_layer_list_.rbegin(); it != m_layer_list_.rend(); ++it) {
        if ((*it)->IsHighlighted()) {
            layers.push_back(it->get());
        }
    }

    layers.push_back(m_overlay_.get());
    return layers;
}

ViewLayer* ViewLayerSet::ByName(const std::string& name) const
{
    auto it = m_layer_map_.find(name);
    return it == m_layer_map_.end() ? nullptr : it->second;
}

std::vector<ViewLayer*> ViewLayerSet::Query(const std::function<bool(const ViewLayer&)>& predicate) const
{
    std::vector<ViewLayer*> layers;
    for (const auto& layer : m_layer_list_) {
        if (predicate(*layer)) {
            layers.push_back(layer.get());
        }
    }
    return layers;
}

void ViewLayerSet::Highlight(const std::vector<std::string>& names)
{
    for (const auto& layer : m_layer_list_) {
        layer->SetHighlighted(std::find(names.begin(), names.end(), layer->GetName()) != names.end());
    }
}

bool ViewLayerSet::IsAnyLayerHighlighted() const
{
    return std::any_of(m_layer_list_.begin(), m_layer_list_.end(), [](const auto& layer) { return layer->IsHighlighted(); });
}

std::vector<ViewLayer*> ViewLayerSet::InteractiveLayers() const
{
    return Query([](const ViewLayer& layer) { return layer.IsInteractive() && layer.IsVisible(); });
}

std::vector<ViewLayerSet::LayerHit> ViewLayerSet::QueryPoint(const Vec2& point) const
{
    std::vector<LayerHit> hits;
    for (ViewLayer* layer : InteractiveLayers()) {
        for (const BBox& bbox : layer->QueryPoint(point)) {
            hits.push_back({layer, bbox});
        }
    }
    return hits;
}

std::vector<BBox> ViewLayerSet::QueryItemBBoxes(const Element* item) const
{
    std::vector<BBox> bboxes;
    for (ViewLayer* layer : InteractiveLayers()) {
        if (const BBox* bbox = layer->FindBBox(item)) {
            bboxes.push_back(*bbox);
        }
    }
    return bboxes;
}

BBox ViewLayerSet::GetBBox() const
{
    std::vector<BBox> bboxes;
    bboxes.reserve(m_layer_list_.size());
    for (const auto& layer : m_layer_list_) {
        bboxes.push_back(layer->GetBBox());
    }
    return BBox::Combine(bboxes);
}

void ViewLayerSet::Clear()
{
    m_overlay_->Clear();
    for (const auto& layer : m_layer_list_) {
        layer->Clear();
    }
    m_layer_list_.clear();
    m_layer_map_.clear();
}
