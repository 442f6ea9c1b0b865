#include "pcb/BoardLayers.hpp"

#include <algorithm>
#include <cctype>

#include "pcb/Board.hpp"
#include "utils/ColorUtils.hpp"

namespace board_layers
{
namespace
{
std::vector<std::string> BuildCopperLayerNames()
{
    std::vector<std::string> names = {kFrontCopper};
    for (int i = 1; i <= 30; ++i) {
        names.push_back("In" + std::to_string(i) + ".Cu");
    }
    names.emplace_back(kBackCopper);
    return names;
}

std::vector<std::string> BuildAllLayerNames()
{
    std::vector<std::string> names = {"Dwgs.User", "Cmts.User", "Eco1.User", "Eco2.User", kEdgeCuts, "Margin"};
    for (int i = 1; i <= 9; ++i) {
        names.push_back("User." + std::to_string(i));
    }
    names.insert(names.end(), {kAnchors, kNonPlatedHoles, kViaHoles, kPadHolesNetName, kPadHoles, kPadHoleWalls, kViaHoleWalls, kPadsFrontNetName, kPadsFront});
    names.insert(names.end(), {kFrontCopper, "F.Mask", "F.SilkS", "F.Adhes", "F.Paste", "F.CrtYd", "F.Fab"});
    for (int i = 1; i <= 30; ++i) {
        names.push_back("In" + std::to_string(i) + ".Cu");
    }
    names.insert(names.end(), {kPadsBackNetName, kPadsBack});
    names.insert(names.end(), {kBackCopper, "B.Mask", "B.SilkS", "B.Adhes", "B.Paste", "B.CrtYd", "B.Fab"});
    return names;
}
}  // namespace

const std::vector<std::string>& AllLayerNames()
{
    static const std::vector<std::string> kNames = BuildAllLayerNames();
    return kNames;
}

const std::vector<std::string>& CopperLayerNames()
{
    static const std::vector<std::string> kNames = BuildCopperLayerNames();
    return kNames;
}

const std::vector<std::string>& HoleLayerNames()
{
    static const std::vector<std::string> kNames = {kNonPlatedHoles, kViaHoles, kPadHoles, kPadHoleWalls, kViaHoleWalls};
    return kNames;
}

std::string VirtualLayerFor(const std::string& physical_layer, const std::string& virtual_name)
{
    return ":" + physical_layer + ":" + virtual_name;
}

bool IsVirtual(const std::string& name)
{
    return !name.empty() && name.front() == ':';
}

bool IsVirtualFor(const std::string& physical_layer, const std::string& layer_name)
{
    std::string const prefix = ":" + physical_layer + ":";
    return IsVirtual(layer_name) && layer_name.compare(0, prefix.size(), prefix) == 0;
}

bool IsCopper(const std::string& name)
{
    return name.size() >= 3 && name.compare(name.size() - 3, 3, ".Cu") == 0;
}

std::vector<std::string> CopperLayersBetween(const std::string& start_layer, const std::string& end_layer)
{
    std::vector<std::string> layers;
    bool found_start = false;
    for (const std::string& name : CopperLayerNames()) {
        if (name == start_layer) {
            found_start = true;
        }
        if (found_start) {
            layers.push_back(name);
        }
        if (name == end_layer) {
            break;
        }
    }
    return layers;
}
}  // namespace board_layers

namespace
{
Visibility Follow(std::function<bool()> predicate)
{
    return Visibility(std::move(predicate));
}
}  // namespace

BoardLayerSet::BoardLayerSet(const Board& board, const Theme& theme) : m_theme_(theme)
{
    using namespace board_layers;

    const auto& holes = HoleLayerNames();

    for (const std::string& layer_name : AllLayerNames()) {
        // Skip physical layers that aren't present on the board.
        if (!IsVirtual(layer_name) && !board.HasLayer(layer_name)) {
            continue;
        }

        Visibility visible = true;
        bool interactive = false;

        if (std::find(holes.begin(), holes.end(), layer_name) != holes.end()) {
            visible = Follow([this]() { return IsAnyCopperLayerVisible(); });
            interactive = true;
        }

        if (layer_name == kPadsFront || layer_name == kPadsFrontNetName) {
            visible = Follow([this]() { return IsLayerVisible(kFrontCopper); });
            interactive = true;
        }

        if (layer_name == kPadsBack || layer_name == kPadsBackNetName) {
            visible = Follow([this]() { return IsLayerVisible(kBackCopper); });
            interactive = true;
        }

        if (layer_name == kPadHolesNetName) {
            visible = Follow([this]() { return IsLayerVisible(kPadHoles); });
            interactive = true;
        }

        // Copper layers get virtual layers for zones and blind/buried vias,
        // all following the copper layer's visibility.
        if (IsCopper(layer_name)) {
            interactive = true;

            Add(VirtualLayerFor(layer_name, kBBViaHoles), Follow([this, layer_name]() { return IsLayerVisible(layer_name); }), false, ColorFor(kViaHoles));
            Add(VirtualLayerFor(layer_name, kBBViaHoleWalls), Follow([this, layer_name]() { return IsLayerVisible(layer_name); }), false, ColorFor(kViaHoleWalls));
            Add(VirtualLayerFor(layer_name, kZones), Follow([this, layer_name]() { return IsLayerVisible(layer_name); }), false, ColorFor(layer_name));
        }

        Add(layer_name, std::move(visible), interactive, ColorFor(layer_name));
    }
}

BLRgba32 BoardLayerSet::ColorFor(const std::string& layer_name) const
{
    using namespace board_layers;

    if (layer_name == kPadsFront) {
        return m_theme_.ColorFor("copper.f");
    }
    if (layer_name == kPadsBack) {
        return m_theme_.ColorFor("copper.b");
    }
    if (layer_name == kNonPlatedHoles) {
        return m_theme_.ColorFor("non_plated_hole");
    }
    if (layer_name == kViaHoles) {
        return m_theme_.ColorFor("via_hole");
    }
    if (layer_name == kViaHoleWalls) {
        return m_theme_.ColorFor("via_through");
    }
    if (layer_name == kPadHoles) {
        return m_theme_.ColorFor("background");
    }
    if (layer_name == kPadHoleWalls) {
        return m_theme_.ColorFor("pad_through_hole");
    }
    if (layer_name == kPadsFrontNetName || layer_name == kPadsBackNetName || layer_name == kPadHolesNetName) {
        return color_utils::WithAlpha(color_utils::kWhite, 0.8);
    }

    // "F.SilkS" -> "f_silks", "In3.Cu" -> "copper.in3"
    std::string name = layer_name;
    std::replace(name.begin(), name.end(), '.', '_');
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name.size() > 3 && name.compare(name.size() - 3, 3, "_cu") == 0) {
        return m_theme_.ColorFor("copper." + name.substr(0, name.size() - 3));
    }
    return m_theme_.ColorFor(name);
}

bool BoardLayerSet::IsLayerVisible(const std::string& name) const
{
    ViewLayer* layer = ByName(name);
    return layer != nullptr && layer->IsVisible();
}

std::vector<ViewLayer*> BoardLayerSet::ByNames(const std::vector<std::string>& names) const
{
    std::vector<ViewLayer*> layers;
    for (const std::string& name : names) {
        if (ViewLayer* layer = ByName(name)) {
            layers.push_back(layer);
        }
    }
    return layers;
}

std::vector<ViewLayer*> BoardLayerSet::CopperLayers() const
{
    return ByNames(board_layers::CopperLayerNames());
}

std::vector<ViewLayer*> BoardLayerSet::ViaLayers() const
{
    using namespace board_layers;

    std::vector<std::string> names = {kViaHoles, kViaHoleWalls};
    for (const std::string& copper : CopperLayerNames()) {
        names.push_back(VirtualLayerFor(copper, kBBViaHoleWalls));
        names.push_back(VirtualLayerFor(copper, kBBViaHoles));
    }
    return ByNames(names);
}

std::vector<ViewLayer*> BoardLayerSet::ZoneLayers() const
{
    std::vector<std::string> names;
    for (const std::string& copper : board_layers::CopperLayerNames()) {
        names.push_back(board_layers::VirtualLayerFor(copper, board_layers::kZones));
    }
    return ByNames(names);
}

std::vector<ViewLayer*> BoardLayerSet::PadLayers() const
{
    using namespace board_layers;
    return ByNames({kPadsFrontNetName, kPadsFront, kPadsBackNetName, kPadsBack});
}

std::vector<ViewLayer*> BoardLayerSet::PadHoleLayers() const
{
    using namespace board_layers;
    return ByNames({kPadHoles, kPadHolesNetName, kPadHoleWalls});
}

bool BoardLayerSet::IsAnyCopperLayerVisible() const
{
    auto copper = CopperLayers();
    return std::any_of(copper.begin(), copper.end(), [](const ViewLayer* layer) { return layer->IsVisible(); });
}

void BoardLayerSet::Highlight(const std::vector<std::string>& names)
{
    std::vector<std::string> matching;
    for (ViewLayer* layer : InOrder()) {
        for (const std::string& name : names) {
            if (layer->GetName() == name || board_layers::IsVirtualFor(name, layer->GetName())) {
                matching.push_back(layer->GetName());
                break;
            }
        }
    }
    ViewLayerSet::Highlight(matching);
}
