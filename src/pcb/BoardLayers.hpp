#pragma once

#include <string>
#include <vector>

#include <blend2d.h>

#include "view/Theme.hpp"
#include "view/ViewLayer.hpp"

class Board;

// View layer names of the board viewer. Names starting with ':' are virtual
// layers with no physical counterpart on the board.
namespace board_layers
{
inline constexpr const char* kEdgeCuts = "Edge.Cuts";
inline constexpr const char* kAnchors = ":Anchors";
inline constexpr const char* kNonPlatedHoles = ":NonPlatedHoles";
inline constexpr const char* kViaHoles = ":Via:Holes";
inline constexpr const char* kPadHolesNetName = ":Pad:Holes:NetName";
inline constexpr const char* kPadHoles = ":Pad:Holes";
inline constexpr const char* kPadHoleWalls = ":Pad:HoleWalls";
inline constexpr const char* kViaHoleWalls = ":Via:HoleWalls";
inline constexpr const char* kPadsFrontNetName = ":Pads:Front:NetName";
inline constexpr const char* kPadsFront = ":Pads:Front";
inline constexpr const char* kPadsBackNetName = ":Pads:Back:NetName";
inline constexpr const char* kPadsBack = ":Pads:Back";
inline constexpr const char* kFrontCopper = "F.Cu";
inline constexpr const char* kBackCopper = "B.Cu";

// Per-copper virtual layers.
inline constexpr const char* kBBViaHoles = "BBViaHoles";
inline constexpr const char* kBBViaHoleWalls = "BBViaHoleWalls";
inline constexpr const char* kZones = "Zones";

// Every view layer, front to back.
const std::vector<std::string>& AllLayerNames();
// F.Cu, In1.Cu .. In30.Cu, B.Cu
const std::vector<std::string>& CopperLayerNames();
const std::vector<std::string>& HoleLayerNames();

// ":<physical>:<virtual>"
std::string VirtualLayerFor(const std::string& physical_layer, const std::string& virtual_name);
bool IsVirtual(const std::string& name);
bool IsVirtualFor(const std::string& physical_layer, const std::string& layer_name);
bool IsCopper(const std::string& name);

// Copper layers from start to end inclusive, in stack order. Empty if start is unknown.
std::vector<std::string> CopperLayersBetween(const std::string& start_layer, const std::string& end_layer);
}  // namespace board_layers

// Layer set of a board. Physical layers the board does not define are left out.
class BoardLayerSet : public ViewLayerSet
{
public:
    BoardLayerSet(const Board& board, const Theme& theme);

    // Theme color for a view layer.
    [[nodiscard]] BLRgba32 ColorFor(const std::string& layer_name) const;

    [[nodiscard]] std::vector<ViewLayer*> CopperLayers() const;
    [[nodiscard]] std::vector<ViewLayer*> ViaLayers() const;
    [[nodiscard]] std::vector<ViewLayer*> ZoneLayers() const;
    [[nodiscard]] std::vector<ViewLayer*> PadLayers() const;
    [[nodiscard]] std::vector<ViewLayer*> PadHoleLayers() const;

    [[nodiscard]] bool IsAnyCopperLayerVisible() const;

    using ViewLayerSet::Highlight;
    // Highlighting a physical layer also highlights its virtual layers.
    void Highlight(const std::vector<std::string>& names) override;

private:
    [[nodiscard]] bool IsLayerVisible(const std::string& name) const;
    [[nodiscard]] std::vector<ViewLayer*> ByNames(const std::vector<std::string>& names) const;

    const Theme& m_theme_;
};
