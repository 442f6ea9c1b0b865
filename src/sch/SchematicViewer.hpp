#pragma once

#include <memory>
#include <string>

#include "sch/Schematic.hpp"
#include "sch/SchematicLayers.hpp"
#include "sch/SchematicPainter.hpp"
#include "view/DocumentViewer.hpp"

class SchematicViewer : public DocumentViewer
{
public:
    explicit SchematicViewer(std::unique_ptr<Renderer> renderer, Theme theme = Theme::DefaultSchematic(), ViewerSettings settings = {});

    // nullptr until a schematic is loaded.
    [[nodiscard]] const Schematic* GetSchematic() const;

    // Selects the first net label with this text. Returns false if there is none.
    bool SelectLabel(const std::string& text);

    [[nodiscard]] BLRgba32 GetSelectionColor() const override { return GetTheme().ColorFor("brightened"); }

protected:
    [[nodiscard]] std::unique_ptr<ViewLayerSet> CreateLayerSet(const PaintableDocument& document) override;
    [[nodiscard]] std::unique_ptr<DocumentPainter> CreatePainter(ViewLayerSet& layers) override;
};
