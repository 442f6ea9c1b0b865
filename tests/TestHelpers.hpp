#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "document/Document.hpp"
#include "render/NullRenderer.hpp"
#include "text/TextShaper.hpp"
#include "view/ViewLayer.hpp"

namespace test_helpers
{
// One vertical stroke per character, one glyph cell apart, starting at the anchor.
class FakeTextShaper : public TextShaper
{
public:
    [[nodiscard]] Strokes Shape(const std::string& text, const TextOptions& options) const override
    {
        Strokes strokes;
        for (size_t i = 0; i < text.size(); ++i) {
            double const x = options.size.x_ax * static_cast<double>(i);
            strokes.push_back({{x, 0}, {x, -options.size.y_ax}});
        }
        return strokes;
    }
};

// Compiled graphics of a layer painted with a NullRenderer.
inline const NullRenderLayer* Graphics(const ViewLayer* layer)
{
    if (layer == nullptr) {
        return nullptr;
    }
    return dynamic_cast<const NullRenderLayer*>(layer->GetGraphics());
}

inline size_t ShapeCount(const ViewLayer* layer)
{
    const NullRenderLayer* graphics = Graphics(layer);
    return graphics != nullptr ? graphics->ShapeCount() : 0;
}

inline bool SameColor(BLRgba32 a, BLRgba32 b)
{
    return a.value == b.value;
}

class TestItem : public Element
{
public:
    explicit TestItem(ElementType type) : Element(type) {}

    [[nodiscard]] std::string GetInfo() const override { return "TestItem"; }
};

class TestDocument : public PaintableDocument
{
public:
    TestItem& Add(ElementType type)
    {
        m_items_.push_back(std::make_unique<TestItem>(type));
        return *m_items_.back();
    }

    [[nodiscard]] std::vector<const Element*> Items() const override
    {
        std::vector<const Element*> items;
        for (const auto& item : m_items_) {
            items.push_back(item.get());
        }
        return items;
    }

private:
    std::vector<std::unique_ptr<TestItem>> m_items_;
};
}  // namespace test_helpers
