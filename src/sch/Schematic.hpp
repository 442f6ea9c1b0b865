#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "document/Document.hpp"
#include "sch/elements/SchematicItem.hpp"

// One schematic sheet.
class Schematic : public PaintableDocument
{
public:
    Schematic() = default;

    Schematic(const Schematic&) = delete;
    Schematic& operator=(const Schematic&) = delete;
    Schematic(Schematic&&) = delete;
    Schematic& operator=(Schematic&&) = delete;

    std::string title;

    // Takes ownership. Returns the added item.
    template <typename T>
    T& Add(std::unique_ptr<T> item)
    {
        T& added = *item;
        m_items_.push_back(std::move(item));
        return added;
    }

    [[nodiscard]] std::vector<const Element*> Items() const override;
    [[nodiscard]] size_t ItemCount() const { return m_items_.size(); }

    // First label with this text, nullptr if absent.
    [[nodiscard]] const NetLabel* FindLabel(const std::string& text) const;

private:
    std::vector<std::unique_ptr<SchematicItem>> m_items_;
};
