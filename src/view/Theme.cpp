#include "view/Theme.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/Config.hpp"
#include "utils/ColorUtils.hpp"

namespace
{
using ColorTable = std::vector<std::pair<const char*, const char*>>;

const ColorTable kBoardColors = {
    {"anchor", "rgb(100, 203, 150)"},
    {"aux_items", "rgb(255, 98, 0)"},
    {"b_adhes", "rgb(0, 0, 132)"},
    {"b_crtyd", "rgb(174, 129, 255)"},
    {"b_fab", "rgb(113, 103, 153)"},
    {"b_mask", "rgba(78, 129, 137, 0.800)"},
    {"b_paste", "rgba(167, 234, 255, 0.502)"},
    {"b_silks", "rgb(136, 100, 203)"},
    {"background", "rgb(19, 18, 24)"},
    {"cmts_user", "rgb(129, 255, 190)"},
    {"copper.f", "rgb(226, 114, 153)"},
    {"copper.b", "rgb(111, 204, 219)"},
    {"copper.in1", "rgb(127, 200, 127)"},
    {"copper.in2", "rgb(206, 125, 44)"},
    {"copper.in3", "rgb(79, 203, 203)"},
    {"copper.in4", "rgb(219, 98, 139)"},
    {"dwgs_user", "rgb(248, 248, 240)"},
    {"eco1_user", "rgb(129, 238, 255)"},
    {"eco2_user", "rgb(255, 129, 173)"},
    {"edge_cuts", "rgb(129, 255, 190)"},
    {"f_adhes", "rgb(132, 0, 132)"},
    {"f_crtyd", "rgb(174, 129, 255)"},
    {"f_fab", "rgb(113, 103, 153)"},
    {"f_mask", "rgb(137, 78, 99)"},
    {"f_paste", "rgba(252, 249, 255, 0.502)"},
    {"f_silks", "rgb(220, 200, 255)"},
    {"grid", "rgb(113, 103, 153)"},
    {"margin", "rgb(78, 137, 107)"},
    {"no_connect", "rgb(255, 148, 0)"},
    {"non_plated_hole", "rgb(26, 196, 210)"},
    {"pad_plated_hole", "rgb(194, 194, 0)"},
    {"pad_through_hole", "rgb(227, 209, 46)"},
    {"ratsnest", "rgb(128, 119, 168)"},
    {"user_1", "rgb(194, 118, 0)"},
    {"user_2", "rgb(89, 148, 220)"},
    {"user_3", "rgb(180, 219, 210)"},
    {"user_4", "rgb(216, 200, 82)"},
    {"user_5", "rgb(194, 194, 194)"},
    {"user_6", "rgb(89, 148, 220)"},
    {"user_7", "rgb(180, 219, 210)"},
    {"user_8", "rgb(216, 200, 82)"},
    {"user_9", "rgb(232, 178, 167)"},
    {"via_blind_buried", "rgb(203, 196, 100)"},
    {"via_hole", "rgb(40, 38, 52)"},
    {"via_micro", "rgb(255, 148, 0)"},
    {"via_through", "rgb(227, 209, 46)"},
    {"worksheet", "rgb(99, 78, 137)"},
};

const ColorTable kSchematicColors = {
    {"anchor", "rgb(174, 129, 255)"},
    {"aux_items", "rgb(255, 160, 0)"},
    {"background", "rgb(19, 18, 24)"},
    {"brightened", "rgb(200, 255, 227)"},
    {"bus", "rgb(129, 238, 255)"},
    {"bus_junction", "rgb(163, 243, 255)"},
    {"component_body", "rgb(67, 62, 86)"},
    {"component_outline", "rgb(197, 163, 255)"},
    {"fields", "rgb(174, 129, 255)"},
    {"grid", "rgb(113, 103, 153)"},
    {"hidden", "rgb(67, 62, 86)"},
    {"junction", "rgb(220, 200, 255)"},
    {"label_global", "rgb(255, 247, 129)"},
    {"label_hier", "rgb(163, 255, 207)"},
    {"label_local", "rgb(220, 200, 255)"},
    {"no_connect", "rgb(255, 129, 173)"},
    {"note", "rgb(248, 248, 240)"},
    {"pin", "rgb(129, 255, 190)"},
    {"reference", "rgb(129, 238, 255)"},
    {"sheet", "rgb(174, 129, 255)"},
    {"value", "rgb(129, 238, 255)"},
    {"wire", "rgb(174, 129, 255)"},
    {"worksheet", "rgb(99, 78, 137)"},
};

constexpr int kInnerCopperLayers = 30;

Theme FromTable(const ColorTable& table)
{
    Theme theme;
    for (const auto& [name, css] : table) {
        theme.Set(name, color_utils::ParseCssColor(css));
    }
    return theme;
}
}  // namespace

Theme Theme::DefaultBoard()
{
    Theme theme = FromTable(kBoardColors);

    // Inner layers without a listed color get hues rotated off In1.
    BLRgba32 const base = theme.ColorFor("copper.in1");
    for (int i = 1; i <= kInnerCopperLayers; ++i) {
        std::string const name = "copper.in" + std::to_string(i);
        if (!theme.Has(name)) {
            theme.Set(name, color_utils::GenerateLayerColor(i - 1, kInnerCopperLayers, base, 0.0F));
        }
    }
    return theme;
}

Theme Theme::DefaultSchematic()
{
    return FromTable(kSchematicColors);
}

BLRgba32 Theme::ColorFor(const std::string& name) const
{
    auto it = m_colors_.find(name);
    if (it == m_colors_.end()) {
        return color_utils::kWhite;
    }
    return it->second;
}

int Theme::LoadOverrides(const Config& config)
{
    int applied = 0;
    for (const std::string& key : config.KeysWithPrefix(kConfigPrefix)) {
        std::string const name = key.substr(std::char_traits<char>::length(kConfigPrefix));
        try {
            Set(name, color_utils::ParseCssColor(config.GetString(key)));
            applied++;
        } catch (const std::invalid_argument& e) {
            std::cerr << "Theme: Ignoring override '" << key << "': " << e.what() << std::endl;
        }
    }
    return applied;
}
