#include "sch/Schematic.hpp"

std::vector<const Element*> Schematic::Items() const
{
    std::vector<const Element*> items;
    items.reserve(m_items_.size());
    for (const auto& item : m_items_) {
        items.push_back(item.get());
    }
    return items;
}

const NetLabel* Schematic::FindLabel(const std::string& text) const
{
    for (const auto& item : m_items_) {
        if (item->GetElementType() != ElementType::kNetLabel) {
            continue;
        }
        const auto* label = static_cast<const NetLabel*>(item.get());
        if (label->text == text) {
            return label;
        }
    }
    return nullptr;
}
