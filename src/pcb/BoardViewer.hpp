#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pcb/Board.hpp"
#include "pcb/BoardLayers.hpp"
#include "pcb/BoardPainter.hpp"
#include "view/DocumentViewer.hpp"

class BoardViewer : public DocumentViewer
{
public:
    explicit BoardViewer(std::unique_ptr<Renderer> renderer, Theme theme = Theme::DefaultBoard(), ViewerSettings settings = {});

    // nullptr until a board is loaded.
    [[nodiscard]] const Board* GetBoard() const;
    [[nodiscard]] BoardLayerSet* GetBoardLayers() const;

    // Selects a footprint by reference designator. Returns false if there is no such footprint.
    bool SelectFootprint(const std::string& reference);

    void HighlightNet(int net);
    void ClearNetHighlight();
    [[nodiscard]] const std::optional<int>& GetHighlightedNet() const { return m_highlighted_net_; }

    void SetTrackOpacity(double opacity);
    void SetViaOpacity(double opacity);
    void SetZoneOpacity(double opacity);
    void SetPadOpacity(double opacity);
    void SetPadHoleOpacity(double opacity);

protected:
    [[nodiscard]] std::unique_ptr<ViewLayerSet> CreateLayerSet(const PaintableDocument& document) override;
    [[nodiscard]] std::unique_ptr<DocumentPainter> CreatePainter(ViewLayerSet& layers) override;
    // The board outline when there is one.
    [[nodiscard]] BBox GetPageBBox() const override;

private:
    void SetLayersOpacity(const std::vector<ViewLayer*>& layers, double opacity);

    std::optional<int> m_highlighted_net_;
};
