#include "sch/SchematicViewer.hpp"

#include <iostream>
#include <stdexcept>

SchematicViewer::SchematicViewer(std::unique_ptr<Renderer> renderer, Theme theme, ViewerSettings settings)
    : DocumentViewer(std::move(renderer), std::move(theme), settings)
{
}

const Schematic* SchematicViewer::GetSchematic() const
{
    return dynamic_cast<const Schematic*>(GetDocument());
}

std::unique_ptr<ViewLayerSet> SchematicViewer::CreateLayerSet(const PaintableDocument& document)
{
    if (dynamic_cast<const Schematic*>(&document) == nullptr) {
        throw std::invalid_argument("SchematicViewer: document is not a schematic");
    }
    return std::make_unique<SchematicLayerSet>(GetTheme());
}

std::unique_ptr<DocumentPainter> SchematicViewer::CreatePainter(ViewLayerSet& layers)
{
    return std::make_unique<SchematicPainter>(*m_renderer_, static_cast<SchematicLayerSet&>(layers), GetTheme(), GetTextShaper());
}

bool SchematicViewer::SelectLabel(const std::string& text)
{
    const Schematic* schematic = GetSchematic();
    const NetLabel* label = schematic != nullptr ? schematic->FindLabel(text) : nullptr;
    if (label == nullptr || !m_layers_) {
        std::cerr << "SchematicViewer: No label " << text << std::endl;
        return false;
    }

    BBox const bbox = BBox::Combine(m_layers_->QueryItemBBoxes(label), label);
    if (!bbox.IsValid()) {
        return false;
    }
    Select(bbox);
    return true;
}
