#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "TestHelpers.hpp"
#include "render/NullRenderer.hpp"
#include "view/Painter.hpp"

using test_helpers::FakeTextShaper;
using test_helpers::Graphics;
using test_helpers::ShapeCount;
using test_helpers::TestDocument;

namespace
{
const BLRgba32 kRed(255, 0, 0, 255);

// Draws one unit circle per item on both layers named by the test.
class CirclePainter : public ItemPainter
{
public:
    CirclePainter(DocumentPainter& painter, Renderer& gfx) : ItemPainter(painter, gfx) {}

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kVia}; }
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& /*item*/) const override { return {"a", "b", "missing"}; }

    void Paint(ViewLayer& layer, const Element& /*item*/) override
    {
        paint_calls.push_back(layer.GetName());
        m_gfx_.DrawCircle({static_cast<double>(paint_calls.size()), 0}, 1.0, kRed);
    }

    std::vector<std::string> paint_calls;
};

// Draws a circle on "a", then fails with a state frame still pushed.
class FailingPainter : public ItemPainter
{
public:
    FailingPainter(DocumentPainter& painter, Renderer& gfx) : ItemPainter(painter, gfx) {}

    [[nodiscard]] std::vector<ElementType> Classes() const override { return {ElementType::kTraceSegment}; }
    [[nodiscard]] std::vector<std::string> LayersFor(const Element& /*item*/) const override { return {"a"}; }

    void Paint(ViewLayer& /*layer*/, const Element& /*item*/) override
    {
        m_gfx_.DrawCircle({-5, 0}, 1.0, kRed);
        m_gfx_.State().Push();
        throw std::invalid_argument("bad geometry");
    }
};

class TestPainter : public DocumentPainter
{
public:
    TestPainter(Renderer& gfx, ViewLayerSet& layers, const Theme& theme) : DocumentPainter(gfx, layers, theme)
    {
        auto circles = std::make_unique<CirclePainter>(*this, gfx);
        circle_painter = circles.get();
        AddPainter(std::move(circles));
    }

    void AddFailingPainter() { AddPainter(std::make_unique<FailingPainter>(*this, m_gfx_)); }

    CirclePainter* circle_painter;
};

struct PainterFixture : public ::testing::Test {
    PainterFixture() : painter(gfx, layers, theme)
    {
        layers.Add("a");
        layers.Add("b");
        layers.Add("empty");
    }

    NullRenderer gfx;
    ViewLayerSet layers;
    Theme theme;
    TestPainter painter;
};
}  // namespace

TEST_F(PainterFixture, ItemsAreSortedIntoTheirLayers)
{
    TestDocument document;
    const Element& via = document.Add(ElementType::kVia);

    painter.Paint(document);

    EXPECT_EQ(layers.ByName("a")->GetItems().size(), 1U);
    EXPECT_EQ(layers.ByName("b")->GetItems().size(), 1U);
    EXPECT_TRUE(layers.ByName("empty")->GetItems().empty());

    // Every layer gets graphics, even without items.
    EXPECT_NE(layers.ByName("empty")->GetGraphics(), nullptr);
    EXPECT_EQ(ShapeCount(layers.ByName("a")), 1U);

    // One bbox per item per layer, tagged with the item.
    ASSERT_EQ(layers.ByName("a")->GetBBoxes().size(), 1U);
    EXPECT_EQ(layers.ByName("a")->GetBBoxes()[0].GetContext(), &via);
}

TEST_F(PainterFixture, LayersArePaintedBackToFront)
{
    TestDocument document;
    document.Add(ElementType::kVia);

    painter.Paint(document);

    EXPECT_EQ(painter.circle_painter->paint_calls, (std::vector<std::string> {"b", "a"}));
}

TEST_F(PainterFixture, MissingPainterIsReportedAndSkipped)
{
    TestDocument document;
    document.Add(ElementType::kZone);
    document.Add(ElementType::kVia);

    testing::internal::CaptureStderr();
    painter.Paint(document);
    std::string const output = testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find("No painter found for Zone"), std::string::npos);
    EXPECT_EQ(layers.ByName("a")->GetItems().size(), 1U);
    EXPECT_EQ(painter.PainterFor(*document.Items()[0]), nullptr);
    EXPECT_TRUE(painter.LayersFor(*document.Items()[0]).empty());
}

TEST_F(PainterFixture, FailingItemIsLoggedAndPaintingContinues)
{
    painter.AddFailingPainter();

    TestDocument document;
    const Element& broken = document.Add(ElementType::kTraceSegment);
    const Element& via = document.Add(ElementType::kVia);

    testing::internal::CaptureStderr();
    painter.Paint(document);
    std::string const output = testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find("Failed to paint TraceSegment on a: bad geometry"), std::string::npos);
    EXPECT_FALSE(gfx.HasActiveLayer());
    EXPECT_FALSE(gfx.HasOpenBBox());
    EXPECT_EQ(gfx.State().Depth(), 1U);

    // The good item is painted and both keep their boxes.
    const ViewLayer* a = layers.ByName("a");
    ASSERT_EQ(a->GetBBoxes().size(), 2U);
    EXPECT_EQ(a->GetBBoxes()[0].GetContext(), &broken);
    EXPECT_EQ(a->GetBBoxes()[1].GetContext(), &via);
    EXPECT_EQ(ShapeCount(a), 2U);
    EXPECT_NE(layers.ByName("b")->GetGraphics(), nullptr);

    // A later paint on the same renderer still works.
    TestDocument next;
    next.Add(ElementType::kVia);
    testing::internal::CaptureStderr();
    EXPECT_NO_THROW(painter.Paint(next));
    testing::internal::GetCapturedStderr();
}

TEST_F(PainterFixture, TextWithoutShaperDrawsNothing)
{
    gfx.StartLayer("text");
    painter.DrawText("ABC", {0, 0}, 0, TextOptions(), kRed);
    auto layer = gfx.EndLayer();

    EXPECT_EQ(static_cast<const NullRenderLayer&>(*layer).ShapeCount(), 0U);
}

TEST_F(PainterFixture, TextIsStrokedAtItsPosition)
{
    FakeTextShaper shaper;
    painter.SetTextShaper(&shaper);

    TextOptions options;
    options.size = {1, 2};
    options.thickness = 0.2;

    gfx.StartLayer("text");
    painter.DrawText("AB", {10, 10}, 0, options, kRed);
    auto layer = gfx.EndLayer();

    const auto& lines = static_cast<const NullRenderLayer&>(*layer).GetLines();
    ASSERT_EQ(lines.size(), 2U);
    EXPECT_EQ(lines[1].points[0], Vec2(11, 10));
    EXPECT_EQ(lines[1].points[1], Vec2(11, 8));
    EXPECT_DOUBLE_EQ(lines[1].width, 0.2);
    EXPECT_EQ(gfx.State().Depth(), 1U);
}

TEST_F(PainterFixture, TextExtentIsEstimatedWithoutShaper)
{
    TextOptions options;
    options.size = {1, 2};
    options.h_align = TextHAlign::kLeft;
    options.v_align = TextVAlign::kBottom;

    EXPECT_EQ(painter.TextExtent("ABCD", options), BBox(0, -2, 4, 2));

    options.h_align = TextHAlign::kCenter;
    options.v_align = TextVAlign::kCenter;
    EXPECT_EQ(painter.TextExtent("ABCD", options), BBox(-2, -1, 4, 2));

    EXPECT_FALSE(painter.TextExtent("", options).IsValid());
}

TEST(StrokePainterTest, SolidLinesPassThrough)
{
    std::vector<std::vector<Vec2>> parts;
    StrokePainter::Line({{0, 0}, {10, 0}, {10, 10}}, 1.0, StrokeType::kSolid, DashRatios(), [&parts](const std::vector<Vec2>& part) {
        parts.push_back(part);
    });

    ASSERT_EQ(parts.size(), 1U);
    EXPECT_EQ(parts[0].size(), 3U);
}

TEST(StrokePainterTest, DashesFollowTheRatios)
{
    DashRatios ratios;
    ratios.dash = 4;
    ratios.gap = 2;

    std::vector<std::vector<Vec2>> parts;
    StrokePainter::Line({{0, 0}, {10, 0}}, 1.0, StrokeType::kDash, ratios, [&parts](const std::vector<Vec2>& part) {
        parts.push_back(part);
    });

    ASSERT_EQ(parts.size(), 2U);
    EXPECT_EQ(parts[0][0], Vec2(0, 0));
    EXPECT_EQ(parts[0][1], Vec2(4, 0));
    EXPECT_EQ(parts[1][0], Vec2(6, 0));
    EXPECT_EQ(parts[1][1], Vec2(10, 0));
}

TEST(StrokePainterTest, PatternRestartsOnEverySegment)
{
    DashRatios ratios;
    ratios.dash = 4;
    ratios.gap = 2;

    size_t count = 0;
    StrokePainter::Line({{0, 0}, {5, 0}, {5, 5}}, 1.0, StrokeType::kDash, ratios, [&count](const std::vector<Vec2>& /*part*/) { count++; });

    // One dash per segment; the trailing gap is cut short.
    EXPECT_EQ(count, 2U);
}

TEST(StrokePainterTest, ZeroWidthPatternsFallBackToSolid)
{
    size_t count = 0;
    StrokePainter::Line({{0, 0}, {10, 0}}, 0.0, StrokeType::kDot, DashRatios(), [&count](const std::vector<Vec2>& /*part*/) { count++; });
    EXPECT_EQ(count, 1U);
}
