#include "pcb/Board.hpp"

#include <algorithm>

#include "pcb/elements/Footprint.hpp"

void Board::AddLayer(LayerInfo layer)
{
    m_layers_.push_back(std::move(layer));
}

bool Board::HasLayer(const std::string& name) const
{
    return std::any_of(m_layers_.begin(), m_layers_.end(), [&name](const LayerInfo& layer) { return layer.name == name; });
}

void Board::AddNet(Net net)
{
    int const id = net.GetId();
    m_nets_.insert_or_assign(id, std::move(net));
}

const Net* Board::GetNetById(int net_id) const
{
    auto it = m_nets_.find(net_id);
    if (it != m_nets_.end()) {
        return &it->second;
    }
    return nullptr;
}

std::string Board::GetNetName(int net_id) const
{
    const Net* net = GetNetById(net_id);
    return net != nullptr ? net->GetName() : std::string();
}

std::vector<const Element*> Board::Items() const
{
    std::vector<const Element*> items;
    items.reserve(m_items_.size());
    for (const auto& item : m_items_) {
        items.push_back(item.get());
    }
    return items;
}

std::vector<const Footprint*> Board::Footprints() const
{
    std::vector<const Footprint*> footprints;
    for (const auto& item : m_items_) {
        if (item->GetElementType() == ElementType::kFootprint) {
            footprints.push_back(static_cast<const Footprint*>(item.get()));
        }
    }
    return footprints;
}

const Footprint* Board::FindFootprint(const std::string& reference) const
{
    for (const Footprint* footprint : Footprints()) {
        if (footprint->reference == reference) {
            return footprint;
        }
    }
    return nullptr;
}
