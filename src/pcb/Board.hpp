#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "document/Document.hpp"
#include "pcb/elements/BoardItem.hpp"
#include "pcb/elements/Net.hpp"

class Footprint;

// A parsed .kicad_pcb: the layer stack, the net table and the top-level items.
// Footprint children are reached through their footprint.
class Board : public PaintableDocument
{
public:
    struct LayerInfo {
        enum class LayerType : uint8_t {
            kSignal,
            kPower,
            kMixed,
            kJumper,
            kUser,
        };

        int ordinal = 0;
        std::string name;  // canonical, e.g. "F.Cu"
        LayerType type = LayerType::kUser;
        std::string user_name;

        LayerInfo(int ordinal, std::string name, LayerType type, std::string user_name = {})
            : ordinal(ordinal), name(std::move(name)), type(type), user_name(std::move(user_name))
        {
        }
    };

    Board() = default;

    Board(const Board&) = delete;
    Board& operator=(const Board&) = delete;
    Board(Board&&) = delete;
    Board& operator=(Board&&) = delete;

    std::string board_name;

    // --- Layers ---
    void AddLayer(LayerInfo layer);
    [[nodiscard]] const std::vector<LayerInfo>& GetLayers() const { return m_layers_; }
    [[nodiscard]] bool HasLayer(const std::string& name) const;
    [[nodiscard]] int GetLayerCount() const { return static_cast<int>(m_layers_.size()); }

    // --- Nets ---
    void AddNet(Net net);
    [[nodiscard]] const Net* GetNetById(int net_id) const;
    [[nodiscard]] std::string GetNetName(int net_id) const;
    [[nodiscard]] size_t GetNetCount() const { return m_nets_.size(); }

    // --- Items ---
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

    [[nodiscard]] std::vector<const Footprint*> Footprints() const;
    // By reference designator, nullptr if absent.
    [[nodiscard]] const Footprint* FindFootprint(const std::string& reference) const;

private:
    std::vector<LayerInfo> m_layers_;
    std::unordered_map<int, Net> m_nets_;
    std::vector<std::unique_ptr<BoardItem>> m_items_;
};
