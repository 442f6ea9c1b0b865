#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "pcb/elements/BoardItem.hpp"
#include "utils/Vec2.hpp"

// Placed footprint. Children (pads, fp_* drawings, text) use coordinates
// relative to 'position' and are owned by the footprint.
class Footprint : public BoardItem
{
public:
    Footprint(std::string reference, std::string value, Vec2 position, double rotation = 0.0, std::string layer = "F.Cu")
        : BoardItem(ElementType::kFootprint, std::move(layer)), reference(std::move(reference)), value(std::move(value)), position(position), rotation(rotation)
    {
    }

    [[nodiscard]] std::string GetInfo() const override;

    // Takes ownership and sets the child's parent. Returns the added item.
    template <typename T>
    T& Add(std::unique_ptr<T> item)
    {
        T& added = *item;
        item->SetParent(this);
        m_items_.push_back(std::move(item));
        return added;
    }

    [[nodiscard]] std::vector<const BoardItem*> Items() const;
    [[nodiscard]] size_t ItemCount() const { return m_items_.size(); }

    std::string reference;
    std::string value;
    Vec2 position;
    double rotation;  // degrees

private:
    std::vector<std::unique_ptr<BoardItem>> m_items_;
};
