#pragma once

#include <optional>
#include <string>
#include <vector>

#include <blend2d.h>

#include "pcb/BoardLayers.hpp"
#include "view/Painter.hpp"

class Board;
class Pad;

// Painter for KiCad boards. Every board item type has its own ItemPainter.
class BoardPainter : public DocumentPainter
{
public:
    BoardPainter(Renderer& gfx, BoardLayerSet& layers, const Theme& theme, const TextShaper* text_shaper = nullptr);

    // Repaints every item on 'net' into the overlay layer, composited as an overlay.
    void PaintNet(const Board& board, int net);

    // Set only while PaintNet runs. Painters skip items of other nets, and
    // items without a net, while it is set.
    [[nodiscard]] const std::optional<int>& GetFilterNet() const { return m_filter_net_; }
    [[nodiscard]] bool IsFilteredOut(int net_id) const { return m_filter_net_ && *m_filter_net_ != net_id; }

    [[nodiscard]] BoardLayerSet& GetBoardLayers() const { return m_board_layers_; }

    // "Sheet/Name" -> "Name"; "X" for no-connect pads; empty for unnamed nets.
    static std::string DisplayedNetName(const Pad& pad);

private:
    BoardLayerSet& m_board_layers_;
    std::optional<int> m_filter_net_;
};
