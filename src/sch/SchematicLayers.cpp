#include "sch/SchematicLayers.hpp"

SchematicLayerSet::SchematicLayerSet(const Theme& theme)
{
    using namespace schematic_layers;

    for (const char* name : {kInteractive, kMarks, kSymbolField, kLabel, kJunction, kWire, kSymbolForeground, kNotes, kBitmap, kSymbolPin, kSymbolBackground}) {
        Add(name, true, false, theme.ColorFor("note"));
    }

    ViewLayer* interactive = ByName(kInteractive);
    interactive->SetVisible(false);
    interactive->SetInteractive(true);
}

std::vector<ViewLayer*> SchematicLayerSet::InteractiveLayers() const
{
    return {ByName(schematic_layers::kInteractive)};
}
