#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <vector>

#include "TestHelpers.hpp"
#include "pcb/SampleBoard.hpp"
#include "render/NullRenderer.hpp"
#include "sch/SampleSchematic.hpp"
#include "sch/Schematic.hpp"
#include "sch/SchematicLayers.hpp"
#include "sch/SchematicPainter.hpp"
#include "sch/SchematicViewer.hpp"

using test_helpers::FakeTextShaper;
using test_helpers::Graphics;
using test_helpers::SameColor;

namespace
{
struct SchematicFixture : public ::testing::Test {
    SchematicFixture() : theme(Theme::DefaultSchematic()), layers(theme), painter(gfx, layers, theme) {}

    Theme theme;
    NullRenderer gfx;
    SchematicLayerSet layers;
    SchematicPainter painter;
};
}  // namespace

TEST(SchematicLayerSetTest, OnlyTheHiddenInteractiveLayerIsClickable)
{
    Theme const theme = Theme::DefaultSchematic();
    SchematicLayerSet layers(theme);

    EXPECT_EQ(layers.Size(), 11U);
    ViewLayer* interactive = layers.ByName(schematic_layers::kInteractive);
    ASSERT_NE(interactive, nullptr);
    EXPECT_FALSE(interactive->IsVisible());
    EXPECT_TRUE(interactive->IsInteractive());

    auto clickable = layers.InteractiveLayers();
    ASSERT_EQ(clickable.size(), 1U);
    EXPECT_EQ(clickable[0], interactive);

    // Symbol backgrounds are drawn first.
    EXPECT_EQ(layers.InDisplayOrder().front()->GetName(), schematic_layers::kSymbolBackground);
}

TEST_F(SchematicFixture, PainterDefaultsComeFromTheRendererState)
{
    BLRgba32 const note = theme.ColorFor("note");

    EXPECT_TRUE(SameColor(gfx.State().GetStroke(), note));
    EXPECT_DOUBLE_EQ(painter.StrokeWidth(Stroke()), schematic_defaults::kLineWidth);
    EXPECT_TRUE(SameColor(painter.StrokeColor(Stroke()), note));

    Stroke red;
    red.width = 0.3;
    red.color = BLRgba32(255, 0, 0, 255);
    EXPECT_DOUBLE_EQ(painter.StrokeWidth(red), 0.3);
    EXPECT_TRUE(SameColor(painter.StrokeColor(red), red.color));
}

TEST_F(SchematicFixture, FillColorFollowsTheFillType)
{
    Stroke red;
    red.color = BLRgba32(255, 0, 0, 255);

    Fill fill;
    EXPECT_TRUE(color_utils::IsTransparentBlack(painter.FillColor(fill, red)));

    fill.type = FillType::kOutline;
    EXPECT_TRUE(SameColor(painter.FillColor(fill, red), red.color));

    fill.type = FillType::kBackground;
    EXPECT_TRUE(SameColor(painter.FillColor(fill, red), theme.ColorFor("component_body")));

    fill.type = FillType::kColor;
    EXPECT_TRUE(SameColor(painter.FillColor(fill, red), theme.ColorFor("note")));
    fill.color = BLRgba32(0, 0, 255, 255);
    EXPECT_TRUE(SameColor(painter.FillColor(fill, red), fill.color));
}

TEST_F(SchematicFixture, SampleItemsLandOnTheirLayers)
{
    auto schematic = CreateSampleSchematic();
    painter.Paint(*schematic);

    using namespace schematic_layers;
    EXPECT_EQ(layers.ByName(kWire)->GetItems().size(), 5U);
    EXPECT_EQ(layers.ByName(kJunction)->GetItems().size(), 5U);
    EXPECT_EQ(layers.ByName(kLabel)->GetItems().size(), 4U);
    // Hidden text is left out.
    EXPECT_EQ(layers.ByName(kNotes)->GetItems().size(), 7U);
    EXPECT_EQ(layers.ByName(kInteractive)->GetItems().size(), 6U);
    EXPECT_TRUE(layers.ByName(kSymbolPin)->GetItems().empty());
}

TEST_F(SchematicFixture, JunctionsUseTheirOwnSizeAndColor)
{
    Schematic schematic;
    schematic.Add(std::make_unique<Junction>(Vec2(0, 0)));
    auto& custom = schematic.Add(std::make_unique<Junction>(Vec2(10, 0), 1.27));
    custom.color = BLRgba32(255, 128, 0, 255);

    painter.Paint(schematic);

    const NullRenderLayer* graphics = Graphics(layers.ByName(schematic_layers::kJunction));
    ASSERT_NE(graphics, nullptr);
    ASSERT_EQ(graphics->GetCircles().size(), 2U);
    EXPECT_DOUBLE_EQ(graphics->GetCircles()[0].radius, schematic_defaults::kJunctionDiameter / 2);
    EXPECT_TRUE(SameColor(graphics->GetCircles()[0].color, theme.ColorFor("junction")));
    EXPECT_DOUBLE_EQ(graphics->GetCircles()[1].radius, 0.635);
    EXPECT_TRUE(SameColor(graphics->GetCircles()[1].color, custom.color));
}

TEST_F(SchematicFixture, NoConnectIsACrossAtItsPosition)
{
    Schematic schematic;
    schematic.Add(std::make_unique<NoConnect>(Vec2(5, 5)));

    painter.Paint(schematic);

    const NullRenderLayer* graphics = Graphics(layers.ByName(schematic_layers::kJunction));
    ASSERT_NE(graphics, nullptr);
    ASSERT_EQ(graphics->GetLines().size(), 2U);

    double const half = schematic_defaults::kNoConnectSize / 2;
    const auto& first = graphics->GetLines()[0];
    EXPECT_NEAR(first.points[0].x_ax, 5 - half, 1e-9);
    EXPECT_NEAR(first.points[1].y_ax, 5 + half, 1e-9);
    EXPECT_TRUE(SameColor(first.color, theme.ColorFor("no_connect")));
}

TEST_F(SchematicFixture, LabelsSitAboveTheWire)
{
    FakeTextShaper shaper;
    painter.SetTextShaper(&shaper);

    Schematic schematic;
    auto& label = schematic.Add(std::make_unique<NetLabel>("A", Vec2(10, 10)));
    schematic.Add(std::make_unique<NetLabel>("B", Vec2(20, 10), 270.0));

    painter.Paint(schematic);

    const NullRenderLayer* graphics = Graphics(layers.ByName(schematic_layers::kLabel));
    ASSERT_NE(graphics, nullptr);
    ASSERT_EQ(graphics->GetLines().size(), 2U);

    double const dist = (schematic_defaults::kTextOffsetRatio * label.options.size.x_ax) + label.options.thickness;

    const Vec2& horizontal = graphics->GetLines()[0].points[0];
    EXPECT_NEAR(horizontal.x_ax, 10, 1e-9);
    EXPECT_NEAR(horizontal.y_ax, 10 - dist, 1e-9);

    const Vec2& vertical = graphics->GetLines()[1].points[0];
    EXPECT_NEAR(vertical.x_ax, 20 - dist, 1e-9);
    EXPECT_NEAR(vertical.y_ax, 10, 1e-9);
    EXPECT_TRUE(SameColor(graphics->GetLines()[0].color, theme.ColorFor("label_local")));
}

TEST_F(SchematicFixture, DashedNotesAreSplit)
{
    Stroke dashed;
    dashed.type = StrokeType::kDash;

    Schematic schematic;
    schematic.Add(std::make_unique<SchematicPolyline>(std::vector<Vec2> {{0, 0}, {100, 0}}, dashed));
    schematic.Add(std::make_unique<SchematicPolyline>(std::vector<Vec2> {{0, 0}}));

    painter.Paint(schematic);

    const NullRenderLayer* graphics = Graphics(layers.ByName(schematic_layers::kNotes));
    ASSERT_NE(graphics, nullptr);
    EXPECT_GT(graphics->GetLines().size(), 1U);
    EXPECT_DOUBLE_EQ(graphics->GetLines()[0].width, schematic_defaults::kLineWidth);
}

TEST(SchematicTest, FindLabelReturnsTheFirstMatch)
{
    auto schematic = CreateSampleSchematic();

    const NetLabel* label = schematic->FindLabel("CLK");
    ASSERT_NE(label, nullptr);
    EXPECT_DOUBLE_EQ(label->rotation, 90.0);
    EXPECT_EQ(schematic->FindLabel("RESET"), nullptr);
}

class SchematicViewerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_viewer = std::make_unique<SchematicViewer>(std::make_unique<NullRenderer>());
        ASSERT_TRUE(m_viewer->Setup());
        m_viewer->Resize(1024, 768);
        m_viewer->Load(CreateSampleSchematic());
    }

    std::unique_ptr<SchematicViewer> m_viewer;
};

TEST_F(SchematicViewerTest, SelectLabelByText)
{
    ASSERT_NE(m_viewer->GetSchematic(), nullptr);

    EXPECT_TRUE(m_viewer->SelectLabel("VCC"));
    const Element* selected = m_viewer->GetSelectedItem();
    ASSERT_NE(selected, nullptr);
    ASSERT_EQ(selected->GetElementType(), ElementType::kNetLabel);
    EXPECT_EQ(static_cast<const NetLabel*>(selected)->text, "VCC");

    testing::internal::CaptureStderr();
    EXPECT_FALSE(m_viewer->SelectLabel("RESET"));
    EXPECT_NE(testing::internal::GetCapturedStderr().find("No label RESET"), std::string::npos);
}

TEST_F(SchematicViewerTest, SelectionIsOutlinedInTheBrightenedColor)
{
    ASSERT_TRUE(m_viewer->SelectLabel("D0"));

    const NullRenderLayer* overlay = Graphics(&m_viewer->GetLayers()->Overlay());
    ASSERT_NE(overlay, nullptr);
    ASSERT_EQ(overlay->GetLines().size(), 1U);
    EXPECT_TRUE(SameColor(overlay->GetLines()[0].color, m_viewer->GetTheme().ColorFor("brightened")));
    EXPECT_EQ(overlay->GetCompositeOperation(), CompositeOperation::kOverlay);
}

TEST_F(SchematicViewerTest, RejectsBoards)
{
    EXPECT_THROW(m_viewer->Load(CreateSampleBoard()), std::invalid_argument);
}
