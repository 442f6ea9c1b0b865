#pragma once

#include <string>
#include <utility>

#include "pcb/elements/BoardItem.hpp"
#include "utils/Vec2.hpp"

enum class ViaType {
    kThrough,
    kBlind,
    kMicro,
};

class Via : public BoardItem
{
public:
    Via(Vec2 position, double size, double drill, std::string start_layer = "F.Cu", std::string end_layer = "B.Cu", int net_id = -1, ViaType type = ViaType::kThrough)
        : BoardItem(ElementType::kVia, start_layer, net_id),
          position(position),
          size(size),
          drill(drill),
          start_layer(std::move(start_layer)),
          end_layer(std::move(end_layer)),
          type(type)
    {
    }

    [[nodiscard]] std::string GetInfo() const override;

    // Anything that does not span the whole stack.
    [[nodiscard]] bool IsBlindOrBuried() const { return type != ViaType::kThrough; }

    Vec2 position;
    double size;
    double drill;
    std::string start_layer;
    std::string end_layer;
    ViaType type;
};
