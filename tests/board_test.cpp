#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "TestHelpers.hpp"
#include "pcb/Board.hpp"
#include "pcb/BoardLayers.hpp"
#include "pcb/BoardPainter.hpp"
#include "pcb/BoardViewer.hpp"
#include "pcb/SampleBoard.hpp"
#include "pcb/elements/Footprint.hpp"
#include "pcb/elements/Pad.hpp"
#include "pcb/elements/Via.hpp"
#include "pcb/elements/Zone.hpp"
#include "render/NullRenderer.hpp"
#include "sch/SampleSchematic.hpp"

using test_helpers::Graphics;
using test_helpers::SameColor;
using test_helpers::ShapeCount;

namespace
{
template <typename T>
std::vector<const T*> ItemsOfType(const Board& board, ElementType type)
{
    std::vector<const T*> items;
    for (const Element* item : board.Items()) {
        if (item->GetElementType() == type) {
            items.push_back(static_cast<const T*>(item));
        }
    }
    return items;
}

size_t IndexOf(const ViewLayerSet& layers, const std::string& name)
{
    auto order = layers.InOrder();
    auto it = std::find_if(order.begin(), order.end(), [&name](const ViewLayer* layer) { return layer->GetName() == name; });
    return static_cast<size_t>(it - order.begin());
}

struct BoardFixture : public ::testing::Test {
    BoardFixture() : board(CreateSampleBoard()), theme(Theme::DefaultBoard()), layers(*board, theme), painter(gfx, layers, theme) {}

    std::shared_ptr<Board> board;
    Theme theme;
    NullRenderer gfx;
    BoardLayerSet layers;
    BoardPainter painter;
};
}  // namespace

TEST(BoardLayerNamesTest, VirtualLayerNaming)
{
    using namespace board_layers;

    EXPECT_EQ(VirtualLayerFor("F.Cu", kZones), ":F.Cu:Zones");
    EXPECT_TRUE(IsVirtual(":Pads:Front"));
    EXPECT_FALSE(IsVirtual("F.Cu"));
    EXPECT_TRUE(IsVirtualFor("F.Cu", ":F.Cu:BBViaHoles"));
    EXPECT_FALSE(IsVirtualFor("F.Cu", ":B.Cu:BBViaHoles"));
    EXPECT_FALSE(IsVirtualFor("F.Cu", "F.Cu"));
    EXPECT_TRUE(IsCopper("In12.Cu"));
    EXPECT_FALSE(IsCopper("F.SilkS"));
}

TEST(BoardLayerNamesTest, CopperStackOrder)
{
    using namespace board_layers;

    ASSERT_EQ(CopperLayerNames().size(), 32U);
    EXPECT_EQ(CopperLayerNames().front(), "F.Cu");
    EXPECT_EQ(CopperLayerNames().back(), "B.Cu");

    EXPECT_EQ(CopperLayersBetween("In1.Cu", "In2.Cu"), (std::vector<std::string> {"In1.Cu", "In2.Cu"}));
    EXPECT_EQ(CopperLayersBetween("F.Cu", "F.Cu"), (std::vector<std::string> {"F.Cu"}));
    EXPECT_EQ(CopperLayersBetween("In30.Cu", "B.Cu").size(), 2U);
    EXPECT_TRUE(CopperLayersBetween("Top", "B.Cu").empty());
}

TEST_F(BoardFixture, OnlyLayersPresentOnTheBoardAreCreated)
{
    EXPECT_NE(layers.ByName("F.Cu"), nullptr);
    EXPECT_NE(layers.ByName("In2.Cu"), nullptr);
    EXPECT_NE(layers.ByName("Edge.Cuts"), nullptr);
    EXPECT_NE(layers.ByName(":Pads:Front"), nullptr);
    EXPECT_NE(layers.ByName(":In1.Cu:BBViaHoles"), nullptr);

    EXPECT_EQ(layers.ByName("In3.Cu"), nullptr);
    EXPECT_EQ(layers.ByName(":In3.Cu:Zones"), nullptr);
    EXPECT_EQ(layers.ByName("Cmts.User"), nullptr);

    EXPECT_EQ(layers.CopperLayers().size(), 4U);
    EXPECT_EQ(layers.ZoneLayers().size(), 4U);
}

TEST_F(BoardFixture, VirtualCopperLayersSitInFrontOfTheirCopperLayer)
{
    size_t const copper = IndexOf(layers, "F.Cu");
    EXPECT_LT(IndexOf(layers, ":F.Cu:Zones"), copper);
    EXPECT_LT(IndexOf(layers, ":F.Cu:BBViaHoles"), copper);
    EXPECT_LT(IndexOf(layers, ":Pads:Front"), copper);
    EXPECT_LT(copper, IndexOf(layers, "B.Cu"));
}

TEST_F(BoardFixture, DerivedLayersFollowCopperVisibility)
{
    ViewLayer* front = layers.ByName("F.Cu");
    ASSERT_NE(front, nullptr);

    front->SetVisible(false);
    EXPECT_FALSE(layers.ByName(":Pads:Front")->IsVisible());
    EXPECT_FALSE(layers.ByName(":F.Cu:Zones")->IsVisible());
    EXPECT_TRUE(layers.ByName(":Pads:Back")->IsVisible());
    EXPECT_TRUE(layers.ByName(":Via:Holes")->IsVisible());

    for (ViewLayer* copper : layers.CopperLayers()) {
        copper->SetVisible(false);
    }
    EXPECT_FALSE(layers.IsAnyCopperLayerVisible());
    EXPECT_FALSE(layers.ByName(":Via:Holes")->IsVisible());
    EXPECT_FALSE(layers.ByName(":Pad:Holes:NetName")->IsVisible());

    layers.ByName("B.Cu")->SetVisible(true);
    EXPECT_TRUE(layers.ByName(":Via:Holes")->IsVisible());
}

TEST_F(BoardFixture, LayerColorsComeFromTheTheme)
{
    EXPECT_TRUE(SameColor(layers.ColorFor("In2.Cu"), theme.ColorFor("copper.in2")));
    EXPECT_TRUE(SameColor(layers.ColorFor("F.SilkS"), theme.ColorFor("f_silks")));
    EXPECT_TRUE(SameColor(layers.ColorFor(":Pads:Front"), theme.ColorFor("copper.f")));
    EXPECT_TRUE(SameColor(layers.ColorFor(":Via:HoleWalls"), theme.ColorFor("via_through")));
    EXPECT_TRUE(SameColor(layers.ByName("Edge.Cuts")->GetColor(), theme.ColorFor("edge_cuts")));
}

TEST_F(BoardFixture, HighlightingCopperIncludesItsVirtualLayers)
{
    layers.Highlight("F.Cu");

    EXPECT_TRUE(layers.ByName("F.Cu")->IsHighlighted());
    EXPECT_TRUE(layers.ByName(":F.Cu:Zones")->IsHighlighted());
    EXPECT_TRUE(layers.ByName(":F.Cu:BBViaHoleWalls")->IsHighlighted());
    EXPECT_FALSE(layers.ByName("B.Cu")->IsHighlighted());
    EXPECT_FALSE(layers.ByName(":B.Cu:Zones")->IsHighlighted());

    auto order = layers.InDisplayOrder();
    ASSERT_GE(order.size(), 2U);
    EXPECT_TRUE(order[order.size() - 2]->IsHighlighted());
}

TEST_F(BoardFixture, ViasLandOnTheLayersTheySpan)
{
    auto vias = ItemsOfType<Via>(*board, ElementType::kVia);
    ASSERT_FALSE(vias.empty());

    for (const Via* via : vias) {
        std::vector<std::string> const names = painter.LayersFor(*via);
        if (via->type == ViaType::kThrough) {
            EXPECT_EQ(names, (std::vector<std::string> {":Via:Holes", ":Via:HoleWalls"}));
        } else if (via->start_layer == "F.Cu" && via->end_layer == "In1.Cu") {
            EXPECT_EQ(names, (std::vector<std::string> {":F.Cu:BBViaHoles", ":F.Cu:BBViaHoleWalls", ":In1.Cu:BBViaHoles", ":In1.Cu:BBViaHoleWalls"}));
        }
    }
}

TEST_F(BoardFixture, ZonesOnBothOuterLayersUseBothZoneLayers)
{
    auto zones = ItemsOfType<Zone>(*board, ElementType::kZone);
    auto both = std::find_if(zones.begin(), zones.end(), [](const Zone* zone) { return zone->layers == std::vector<std::string> {"F&B.Cu"}; });
    ASSERT_NE(both, zones.end());

    EXPECT_EQ(painter.LayersFor(**both), (std::vector<std::string> {":F.Cu:Zones", ":B.Cu:Zones"}));
}

TEST_F(BoardFixture, PaintingFillsTheBoardLayers)
{
    painter.Paint(*board);

    EXPECT_EQ(layers.ByName(":Via:Holes")->GetItems().size(), 3U);
    EXPECT_EQ(layers.ByName(":In1.Cu:BBViaHoles")->GetItems().size(), 2U);
    EXPECT_GT(ShapeCount(layers.ByName(":F.Cu:Zones")), 0U);
    EXPECT_GT(ShapeCount(layers.ByName("Edge.Cuts")), 0U);
    EXPECT_GT(ShapeCount(layers.ByName(":Pads:Front")), 0U);
    EXPECT_EQ(gfx.State().Depth(), 1U);

    // The outline is the Edge.Cuts rectangle grown by its stroke width.
    BBox const outline = layers.ByName("Edge.Cuts")->GetBBox();
    EXPECT_LE(outline.X(), 0.0);
    EXPECT_GE(outline.X2(), 50.0);
    EXPECT_LT(outline.X2(), 51.0);
}

TEST_F(BoardFixture, NetPaintingGoesToTheOverlay)
{
    painter.Paint(*board);
    painter.PaintNet(*board, 2);

    const NullRenderLayer* overlay = Graphics(&layers.Overlay());
    ASSERT_NE(overlay, nullptr);
    EXPECT_EQ(overlay->GetCompositeOperation(), CompositeOperation::kOverlay);
    EXPECT_GT(overlay->ShapeCount(), 0U);
    EXPECT_FALSE(painter.GetFilterNet().has_value());

    painter.PaintNet(*board, 99);
    overlay = Graphics(&layers.Overlay());
    ASSERT_NE(overlay, nullptr);
    EXPECT_EQ(overlay->ShapeCount(), 0U);
}

TEST(BoardPainterTest, DisplayedNetNameIsTheLastPathSegment)
{
    Pad pad("1", PadType::kSmd, PadShape::kRect, Vec2(0, 0), Vec2(1, 1), {"F.Cu"}, 3, "/MCU/CLK");
    EXPECT_EQ(BoardPainter::DisplayedNetName(pad), "CLK");

    pad.net_name = "GND";
    EXPECT_EQ(BoardPainter::DisplayedNetName(pad), "GND");

    pad.net_name.clear();
    EXPECT_EQ(BoardPainter::DisplayedNetName(pad), "");

    pad.net_name = "unconnected-(U1-Pad3)";
    pad.pin_type = "no_connect";
    EXPECT_EQ(BoardPainter::DisplayedNetName(pad), "X");
}

class BoardViewerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto renderer = std::make_unique<NullRenderer>();
        m_renderer = renderer.get();
        m_viewer = std::make_unique<BoardViewer>(std::move(renderer));
        ASSERT_TRUE(m_viewer->Setup());
        m_viewer->Resize(800, 600);
        m_viewer->Load(CreateSampleBoard());
    }

    NullRenderer* m_renderer = nullptr;
    std::unique_ptr<BoardViewer> m_viewer;
};

TEST_F(BoardViewerTest, LoadBuildsTheLayerSet)
{
    ASSERT_NE(m_viewer->GetBoard(), nullptr);
    ASSERT_NE(m_viewer->GetBoardLayers(), nullptr);
    EXPECT_TRUE(m_viewer->HasPendingDraw());
    EXPECT_TRUE(SameColor(m_renderer->GetBackgroundColor(), m_viewer->GetTheme().ColorFor("background")));
}

TEST_F(BoardViewerTest, SelectFootprintByReference)
{
    EXPECT_TRUE(m_viewer->SelectFootprint("U1"));
    const Element* selected = m_viewer->GetSelectedItem();
    ASSERT_NE(selected, nullptr);
    ASSERT_EQ(selected->GetElementType(), ElementType::kFootprint);
    EXPECT_EQ(static_cast<const Footprint*>(selected)->reference, "U1");

    EXPECT_FALSE(m_viewer->SelectFootprint("U99"));
}

TEST_F(BoardViewerTest, PickSelectsTheFootprintUnderTheCursor)
{
    const Element* picked = nullptr;
    m_viewer->SetSelectCallback([&picked](const Element* item, const Element* /*previous*/) { picked = item; });

    Vec2 const screen = m_viewer->GetViewport().WorldToScreen({20, 12}, m_viewer->GetCamera());
    m_viewer->Pick(screen);

    ASSERT_NE(picked, nullptr);
    EXPECT_EQ(picked, m_viewer->GetBoard()->FindFootprint("U1"));
    EXPECT_NE(Graphics(&m_viewer->GetLayers()->Overlay()), nullptr);

    // Far outside the board
    m_viewer->Pick(m_viewer->GetViewport().WorldToScreen({-500, -500}, m_viewer->GetCamera()));
    EXPECT_EQ(picked, nullptr);
    EXPECT_EQ(m_viewer->GetLayers()->Overlay().GetGraphics(), nullptr);
}

TEST_F(BoardViewerTest, NetHighlightCanBeCleared)
{
    m_viewer->HighlightNet(2);
    ASSERT_TRUE(m_viewer->GetHighlightedNet().has_value());
    EXPECT_EQ(*m_viewer->GetHighlightedNet(), 2);
    EXPECT_NE(m_viewer->GetLayers()->Overlay().GetGraphics(), nullptr);

    m_viewer->ClearNetHighlight();
    EXPECT_FALSE(m_viewer->GetHighlightedNet().has_value());
    EXPECT_EQ(m_viewer->GetLayers()->Overlay().GetGraphics(), nullptr);
}

TEST_F(BoardViewerTest, OpacityAppliesToLayerGroups)
{
    m_viewer->SetViaOpacity(0.5);
    m_viewer->SetZoneOpacity(0.3);

    EXPECT_DOUBLE_EQ(m_viewer->GetLayers()->ByName(":Via:Holes")->GetOpacity(), 0.5);
    EXPECT_DOUBLE_EQ(m_viewer->GetLayers()->ByName(":In1.Cu:BBViaHoles")->GetOpacity(), 0.5);
    EXPECT_DOUBLE_EQ(m_viewer->GetLayers()->ByName(":B.Cu:Zones")->GetOpacity(), 0.3);
    EXPECT_DOUBLE_EQ(m_viewer->GetLayers()->ByName("F.Cu")->GetOpacity(), 1.0);
}

TEST_F(BoardViewerTest, RejectsOtherDocuments)
{
    EXPECT_THROW(m_viewer->Load(CreateSampleSchematic()), std::invalid_argument);
    EXPECT_NE(m_viewer->GetBoard(), nullptr);
}
