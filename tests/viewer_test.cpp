#include <gtest/gtest.h>

#include <cstdint>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>

#include "TestHelpers.hpp"
#include "render/NullRenderer.hpp"
#include "sch/SampleSchematic.hpp"
#include "sch/SchematicLayers.hpp"
#include "sch/SchematicViewer.hpp"

using test_helpers::Graphics;

namespace
{
class ViewerTest : public ::testing::Test
{
protected:
    ViewerTest()
    {
        auto renderer = std::make_unique<NullRenderer>();
        m_renderer = renderer.get();
        m_viewer = std::make_unique<SchematicViewer>(std::move(renderer));
    }

    void Ready()
    {
        ASSERT_TRUE(m_viewer->Setup());
        m_viewer->Resize(640, 480);
    }

    NullRenderer* m_renderer = nullptr;
    std::unique_ptr<SchematicViewer> m_viewer;
};
}  // namespace

TEST_F(ViewerTest, NothingIsDrawnBeforeSetup)
{
    m_viewer->Draw();
    EXPECT_FALSE(m_viewer->HasPendingDraw());
    EXPECT_FALSE(m_viewer->FlushPendingDraw());
    EXPECT_EQ(m_renderer->GetClearCount(), 0);
}

TEST_F(ViewerTest, DrawRequestsAreCoalesced)
{
    Ready();
    m_viewer->FlushPendingDraw();
    int const clears = m_renderer->GetClearCount();

    m_viewer->Draw();
    m_viewer->Draw();
    m_viewer->Draw();

    EXPECT_TRUE(m_viewer->FlushPendingDraw());
    EXPECT_FALSE(m_viewer->FlushPendingDraw());
    EXPECT_EQ(m_renderer->GetClearCount(), clears + 1);
}

TEST_F(ViewerTest, ResizeIgnoresEmptyCanvases)
{
    Ready();
    m_viewer->Resize(0, 100);
    EXPECT_EQ(m_viewer->GetViewport().GetWidth(), 640);
    EXPECT_EQ(m_renderer->GetCanvasWidth(), 640);
}

TEST_F(ViewerTest, HiddenLayersAreSkippedAndOthersDimmed)
{
    Ready();
    m_viewer->Load(CreateSampleSchematic());
    m_viewer->FlushPendingDraw();

    ViewLayerSet* layers = m_viewer->GetLayers();
    const NullRenderLayer* wires = Graphics(layers->ByName(schematic_layers::kWire));
    const NullRenderLayer* notes = Graphics(layers->ByName(schematic_layers::kNotes));
    const NullRenderLayer* interactive = Graphics(layers->ByName(schematic_layers::kInteractive));
    ASSERT_NE(wires, nullptr);
    ASSERT_NE(notes, nullptr);
    ASSERT_NE(interactive, nullptr);

    EXPECT_EQ(wires->GetRenderCount(), 1);
    EXPECT_EQ(interactive->GetRenderCount(), 0);
    EXPECT_DOUBLE_EQ(wires->GetLastAlpha(), 1.0);

    // Later layers are drawn nearer.
    EXPECT_GT(wires->GetLastDepth(), notes->GetLastDepth());

    m_viewer->HighlightLayers({schematic_layers::kNotes});
    m_viewer->FlushPendingDraw();

    EXPECT_DOUBLE_EQ(wires->GetLastAlpha(), m_viewer->GetSettings().dim_alpha);
    EXPECT_DOUBLE_EQ(notes->GetLastAlpha(), 1.0);
    EXPECT_GT(notes->GetLastDepth(), wires->GetLastDepth());
}

TEST_F(ViewerTest, OnlyTheNewestAsyncLoadIsCommitted)
{
    Ready();

    std::promise<DocumentViewer::DocumentPtr> first;
    std::promise<DocumentViewer::DocumentPtr> second;
    uint64_t const first_generation = m_viewer->LoadAsync(first.get_future());
    uint64_t const second_generation = m_viewer->LoadAsync(second.get_future());
    EXPECT_LT(first_generation, second_generation);
    EXPECT_EQ(m_viewer->PendingLoadCount(), 2U);

    EXPECT_EQ(m_viewer->PollPendingLoads(), 0U);

    first.set_value(CreateSampleSchematic());
    testing::internal::CaptureStdout();
    EXPECT_EQ(m_viewer->PollPendingLoads(), 0U);
    EXPECT_NE(testing::internal::GetCapturedStdout().find("Discarding stale document load"), std::string::npos);
    EXPECT_EQ(m_viewer->GetDocument(), nullptr);
    EXPECT_EQ(m_viewer->PendingLoadCount(), 1U);

    auto newest = CreateSampleSchematic();
    second.set_value(newest);
    EXPECT_EQ(m_viewer->PollPendingLoads(), 1U);
    EXPECT_EQ(m_viewer->GetDocument(), newest.get());
    EXPECT_EQ(m_viewer->PendingLoadCount(), 0U);
    EXPECT_NE(m_viewer->GetLayers(), nullptr);
}

TEST_F(ViewerTest, SynchronousLoadSupersedesPendingLoads)
{
    Ready();

    std::promise<DocumentViewer::DocumentPtr> pending;
    m_viewer->LoadAsync(pending.get_future());

    auto loaded = CreateSampleSchematic();
    m_viewer->Load(loaded);
    EXPECT_EQ(m_viewer->GetDocument(), loaded.get());

    pending.set_value(CreateSampleSchematic());
    EXPECT_EQ(m_viewer->PollPendingLoads(), 0U);
    EXPECT_EQ(m_viewer->GetDocument(), loaded.get());
}

TEST_F(ViewerTest, FailedLoadsAreReported)
{
    Ready();
    auto loaded = CreateSampleSchematic();
    m_viewer->Load(loaded);

    std::promise<DocumentViewer::DocumentPtr> failing;
    m_viewer->LoadAsync(failing.get_future());
    failing.set_exception(std::make_exception_ptr(std::runtime_error("unexpected token")));

    testing::internal::CaptureStderr();
    EXPECT_EQ(m_viewer->PollPendingLoads(), 0U);
    EXPECT_NE(testing::internal::GetCapturedStderr().find("unexpected token"), std::string::npos);
    EXPECT_EQ(m_viewer->GetDocument(), loaded.get());
    EXPECT_EQ(m_viewer->PendingLoadCount(), 0U);
}

TEST_F(ViewerTest, SelectionCallbackSeesThePreviousItem)
{
    Ready();
    m_viewer->Load(CreateSampleSchematic());

    const Element* current = nullptr;
    const Element* previous = nullptr;
    int calls = 0;
    m_viewer->SetSelectCallback([&](const Element* item, const Element* prev) {
        current = item;
        previous = prev;
        calls++;
        // Re-entrant selection is ignored.
        m_viewer->Select(std::nullopt);
    });

    ASSERT_TRUE(m_viewer->SelectLabel("VCC"));
    const Element* vcc = current;
    ASSERT_NE(vcc, nullptr);
    EXPECT_EQ(previous, nullptr);
    EXPECT_EQ(m_viewer->GetSelectedItem(), vcc);

    ASSERT_TRUE(m_viewer->SelectLabel("CLK"));
    EXPECT_EQ(previous, vcc);
    EXPECT_EQ(calls, 2);

    m_viewer->Select(std::nullopt);
    EXPECT_EQ(current, nullptr);
    EXPECT_EQ(m_viewer->GetLayers()->Overlay().GetGraphics(), nullptr);
}

TEST_F(ViewerTest, LoadingClearsTheSelection)
{
    Ready();
    m_viewer->Load(CreateSampleSchematic());
    ASSERT_TRUE(m_viewer->SelectLabel("VCC"));

    m_viewer->Load(CreateSampleSchematic());
    EXPECT_FALSE(m_viewer->GetSelected().has_value());
}

TEST_F(ViewerTest, CameraMovesRequestRedraws)
{
    Ready();
    m_viewer->Load(CreateSampleSchematic());
    m_viewer->FlushPendingDraw();

    Vec2 const center = m_viewer->GetViewport().GetScreenCenter();
    Vec2 const before = m_viewer->GetViewport().ScreenToWorld(center, m_viewer->GetCamera());

    m_viewer->PanBy({50, 0});
    EXPECT_TRUE(m_viewer->HasPendingDraw());
    Vec2 const after = m_viewer->GetViewport().ScreenToWorld(center, m_viewer->GetCamera());
    EXPECT_NE(before.x_ax, after.x_ax);

    m_viewer->FlushPendingDraw();
    double const zoom = m_viewer->GetCamera().GetZoom();
    m_viewer->ZoomAt(center, 2.0);
    EXPECT_TRUE(m_viewer->HasPendingDraw());
    EXPECT_GT(m_viewer->GetCamera().GetZoom(), zoom);
}

TEST_F(ViewerTest, DisposeReleasesLayers)
{
    Ready();
    m_viewer->Load(CreateSampleSchematic());
    m_viewer->Dispose();

    EXPECT_FALSE(m_viewer->IsReady());
    EXPECT_EQ(m_viewer->GetLayers(), nullptr);
    m_viewer->Draw();
    EXPECT_FALSE(m_viewer->HasPendingDraw());
}
