#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <vector>

#include "document/Document.hpp"
#include "view/Theme.hpp"
#include "view/Viewer.hpp"

class TextShaper;

// Viewer for one painted document at a time. Documents may be produced on
// another thread and handed over as futures; only the newest request is ever
// committed.
class DocumentViewer : public Viewer
{
public:
    using DocumentPtr = std::shared_ptr<const PaintableDocument>;

    DocumentViewer(std::unique_ptr<Renderer> renderer, Theme theme, ViewerSettings settings = {});
    ~DocumentViewer() override;

    // Paints synchronously. Supersedes any load still in flight.
    void Load(DocumentPtr document);

    // Returns the generation token assigned to this request.
    uint64_t LoadAsync(std::future<DocumentPtr> pending);
    // Commits completed loads on the calling thread. Returns the number committed.
    size_t PollPendingLoads();
    [[nodiscard]] size_t PendingLoadCount() const { return m_pending_loads_.size(); }
    [[nodiscard]] uint64_t GetGeneration() const { return m_generation_; }

    [[nodiscard]] const PaintableDocument* GetDocument() const { return m_document_.get(); }
    [[nodiscard]] const Theme& GetTheme() const { return m_theme_; }

    // Glyph source for text items; may stay null.
    void SetTextShaper(const TextShaper* shaper) { m_text_shaper_ = shaper; }
    [[nodiscard]] const TextShaper* GetTextShaper() const { return m_text_shaper_; }

    void ZoomToPage() override;

protected:
    [[nodiscard]] virtual std::unique_ptr<ViewLayerSet> CreateLayerSet(const PaintableDocument& document) = 0;
    [[nodiscard]] virtual std::unique_ptr<DocumentPainter> CreatePainter(ViewLayerSet& layers) = 0;
    // Bounds used by ZoomToPage. Defaults to everything painted.
    [[nodiscard]] virtual BBox GetPageBBox() const;

    [[nodiscard]] DocumentPainter* GetPainter() const { return m_painter_.get(); }

private:
    struct PendingLoad {
        uint64_t generation;
        std::future<DocumentPtr> future;
    };

    void Commit(DocumentPtr document);

    Theme m_theme_;
    DocumentPtr m_document_;
    std::unique_ptr<DocumentPainter> m_painter_;
    const TextShaper* m_text_shaper_ = nullptr;
    std::vector<PendingLoad> m_pending_loads_;
    uint64_t m_generation_ = 0;
};
