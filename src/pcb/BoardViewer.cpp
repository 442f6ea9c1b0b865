#include "pcb/BoardViewer.hpp"

#include <iostream>
#include <stdexcept>

#include "pcb/elements/Footprint.hpp"

BoardViewer::BoardViewer(std::unique_ptr<Renderer> renderer, Theme theme, ViewerSettings settings)
    : DocumentViewer(std::move(renderer), std::move(theme), settings)
{
}

const Board* BoardViewer::GetBoard() const
{
    return dynamic_cast<const Board*>(GetDocument());
}

BoardLayerSet* BoardViewer::GetBoardLayers() const
{
    return static_cast<BoardLayerSet*>(m_layers_.get());
}

std::unique_ptr<ViewLayerSet> BoardViewer::CreateLayerSet(const PaintableDocument& document)
{
    const auto* board = dynamic_cast<const Board*>(&document);
    if (board == nullptr) {
        throw std::invalid_argument("BoardViewer: document is not a board");
    }
    m_highlighted_net_.reset();
    return std::make_unique<BoardLayerSet>(*board, GetTheme());
}

std::unique_ptr<DocumentPainter> BoardViewer::CreatePainter(ViewLayerSet& layers)
{
    return std::make_unique<BoardPainter>(*m_renderer_, static_cast<BoardLayerSet&>(layers), GetTheme(), GetTextShaper());
}

BBox BoardViewer::GetPageBBox() const
{
    if (m_layers_) {
        if (ViewLayer* edge_cuts = m_layers_->ByName(board_layers::kEdgeCuts)) {
            BBox const outline = edge_cuts->GetBBox();
            if (outline.IsValid()) {
                return outline;
            }
        }
    }
    return DocumentViewer::GetPageBBox();
}

bool BoardViewer::SelectFootprint(const std::string& reference)
{
    const Board* board = GetBoard();
    const Footprint* footprint = board != nullptr ? board->FindFootprint(reference) : nullptr;
    if (footprint == nullptr || !m_layers_) {
        std::cerr << "BoardViewer: No footprint " << reference << std::endl;
        return false;
    }

    BBox const bbox = BBox::Combine(m_layers_->QueryItemBBoxes(footprint), footprint);
    if (!bbox.IsValid()) {
        return false;
    }
    Select(bbox);
    return true;
}

void BoardViewer::HighlightNet(int net)
{
    const Board* board = GetBoard();
    auto* painter = static_cast<BoardPainter*>(GetPainter());
    if (board == nullptr || painter == nullptr) {
        return;
    }
    painter->PaintNet(*board, net);
    m_highlighted_net_ = net;
    std::cout << "BoardViewer: Highlighting net " << net << " (" << board->GetNetName(net) << ")" << std::endl;
    Draw();
}

void BoardViewer::ClearNetHighlight()
{
    if (!m_highlighted_net_ || !m_layers_) {
        return;
    }
    m_layers_->Overlay().Clear();
    m_highlighted_net_.reset();
    Draw();
}

void BoardViewer::SetLayersOpacity(const std::vector<ViewLayer*>& layers, double opacity)
{
    for (ViewLayer* layer : layers) {
        layer->SetOpacity(opacity);
    }
    Draw();
}

void BoardViewer::SetTrackOpacity(double opacity)
{
    if (BoardLayerSet* layers = GetBoardLayers()) {
        SetLayersOpacity(layers->CopperLayers(), opacity);
    }
}

void BoardViewer::SetViaOpacity(double opacity)
{
    if (BoardLayerSet* layers = GetBoardLayers()) {
        SetLayersOpacity(layers->ViaLayers(), opacity);
    }
}

void BoardViewer::SetZoneOpacity(double opacity)
{
    if (BoardLayerSet* layers = GetBoardLayers()) {
        SetLayersOpacity(layers->ZoneLayers(), opacity);
    }
}

void BoardViewer::SetPadOpacity(double opacity)
{
    if (BoardLayerSet* layers = GetBoardLayers()) {
        SetLayersOpacity(layers->PadLayers(), opacity);
    }
}

void BoardViewer::SetPadHoleOpacity(double opacity)
{
    if (BoardLayerSet* layers = GetBoardLayers()) {
        SetLayersOpacity(layers->PadHoleLayers(), opacity);
    }
}
