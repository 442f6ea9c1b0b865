#pragma once

#include <string>
#include <utility>
#include <vector>

#include "pcb/elements/BoardItem.hpp"
#include "utils/Vec2.hpp"

// Copper pour. Only the filled result is drawn, one polygon per fill island.
class Zone : public BoardItem
{
public:
    struct FilledPolygon {
        std::string layer;
        std::vector<Vec2> points;
    };

    // 'layers' may hold "F&B.Cu" for zones on both outer layers.
    Zone(std::vector<std::string> layers, int net_id = -1, std::string net_name = {})
        : BoardItem(ElementType::kZone, layers.empty() ? std::string() : layers.front(), net_id), layers(std::move(layers)), net_name(std::move(net_name))
    {
    }

    [[nodiscard]] std::string GetInfo() const override;

    std::vector<std::string> layers;
    std::string net_name;
    std::vector<FilledPolygon> filled_polygons;
};
