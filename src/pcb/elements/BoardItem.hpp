#pragma once

#include <string>
#include <utility>

#include "document/Element.hpp"

// Base of everything placed on a board. 'layer' is the canonical KiCad layer
// name ("F.Cu", "Edge.Cuts"); items spanning several layers keep their own list.
class BoardItem : public Element
{
public:
    BoardItem(ElementType type, std::string layer, int net_id = -1) : Element(type, net_id), layer(std::move(layer)) {}

    [[nodiscard]] const std::string& GetLayer() const { return layer; }

    std::string layer;
};
