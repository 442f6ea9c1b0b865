#include "view/DocumentViewer.hpp"

#include <chrono>
#include <exception>
#include <iostream>

DocumentViewer::DocumentViewer(std::unique_ptr<Renderer> renderer, Theme theme, ViewerSettings settings)
    : Viewer(std::move(renderer), settings), m_theme_(std::move(theme))
{
    m_renderer_->SetBackgroundColor(m_theme_.ColorFor("background"));
}

DocumentViewer::~DocumentViewer()
{
    // The painter and layers point into the document.
    m_painter_.reset();
    m_layers_.reset();
}

void DocumentViewer::Load(DocumentPtr document)
{
    if (document == m_document_) {
        return;
    }
    ++m_generation_;
    Commit(std::move(document));
}

uint64_t DocumentViewer::LoadAsync(std::future<DocumentPtr> pending)
{
    uint64_t const generation = ++m_generation_;
    m_pending_loads_.push_back({generation, std::move(pending)});
    return generation;
}

size_t DocumentViewer::PollPendingLoads()
{
    size_t committed = 0;

    for (auto it = m_pending_loads_.begin(); it != m_pending_loads_.end();) {
        if (it->future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++it;
            continue;
        }

        uint64_t const generation = it->generation;
        DocumentPtr document;
        try {
            document = it->future.get();
        } catch (const std::exception& e) {
            std::cerr << "DocumentViewer: Document load " << generation << " failed: " << e.what() << std::endl;
        }
        it = m_pending_loads_.erase(it);

        if (!document) {
            continue;
        }
        if (generation != m_generation_) {
            std::cout << "DocumentViewer: Discarding stale document load " << generation << " (current is " << m_generation_ << ")" << std::endl;
            continue;
        }
        Commit(std::move(document));
        committed++;
    }

    return committed;
}

void DocumentViewer::Commit(DocumentPtr document)
{
    if (!document) {
        return;
    }

    // Paint into a fresh layer set before dropping the old one.
    std::unique_ptr<ViewLayerSet> layers = CreateLayerSet(*document);
    std::unique_ptr<DocumentPainter> painter = CreatePainter(*layers);
    painter->SetDashRatios(GetSettings().dash_ratios);
    painter->Paint(*document);

    m_painter_ = std::move(painter);
    SetLayers(std::move(layers));
    m_document_ = std::move(document);

    ZoomToPage();
}

BBox DocumentViewer::GetPageBBox() const
{
    if (!m_layers_) {
        return {};
    }
    return m_layers_->GetBBox();
}

void DocumentViewer::ZoomToPage()
{
    BBox const page = GetPageBBox();
    if (page.IsValid()) {
        m_camera_.FocusOnRect(page.Grow(10), m_viewport_);
    }
    Draw();
}
