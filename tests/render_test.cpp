#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include "TestHelpers.hpp"
#include "render/NullRenderer.hpp"
#include "render/RenderErrors.hpp"
#include "render/RenderState.hpp"
#include "render/Tesselator.hpp"
#include "render/gl/GLRenderer.hpp"
#include "utils/Constants.hpp"

using test_helpers::SameColor;
using test_helpers::TestItem;

namespace
{
const BLRgba32 kRed(255, 0, 0, 255);
const BLRgba32 kGreen(0, 255, 0, 255);
}  // namespace

// --- RenderStateStack ---

TEST(RenderStateStackTest, PushedFramesAreIndependentCopies)
{
    RenderStateStack stack;
    stack.SetStroke(kRed);
    stack.SetStrokeWidth(0.5);

    stack.Push();
    EXPECT_TRUE(SameColor(stack.GetStroke(), kRed));
    stack.SetStroke(kGreen);
    stack.SetStrokeWidth(2.0);
    EXPECT_EQ(stack.Depth(), 2U);

    stack.Pop();
    EXPECT_TRUE(SameColor(stack.GetStroke(), kRed));
    EXPECT_DOUBLE_EQ(stack.GetStrokeWidth(), 0.5);
}

TEST(RenderStateStackTest, PoppingTheBaseFrameThrows)
{
    RenderStateStack stack;
    EXPECT_THROW(stack.Pop(), InvalidStateError);
    EXPECT_EQ(stack.Depth(), 1U);
}

TEST(RenderStateStackTest, ScopedStateDropsFramesLeftPushed)
{
    RenderStateStack stack;
    stack.SetStrokeWidth(1);

    {
        ScopedRenderState state(stack);
        stack.SetStrokeWidth(3);
        stack.Push();
        stack.Push();
        EXPECT_EQ(stack.Depth(), 4U);
    }

    EXPECT_EQ(stack.Depth(), 1U);
    EXPECT_DOUBLE_EQ(stack.GetStrokeWidth(), 1);

    stack.Truncate(0);
    EXPECT_EQ(stack.Depth(), 1U);
}

TEST(RenderStateStackTest, MultiplyAppliesBeforeExistingTransform)
{
    RenderStateStack stack;
    stack.SetMatrix(Matrix3::Translation(10, 0));
    stack.Multiply(Matrix3::Scaling(2, 2));
    EXPECT_EQ(stack.GetMatrix().Transform({1, 0}), Vec2(12, 0));
}

// --- Tesselator ---

TEST(TesselatorTest, PolylineMakesOneQuadPerSegment)
{
    shapes::Polyline line {{{0, 0}, {10, 0}, {10, 0}, {10, 5}}, 1.0, kRed};
    VertexData const data = tesselator::TesselatePolyline(line);

    // The zero-length middle segment is skipped.
    EXPECT_EQ(data.VertexCount(), 2 * tesselator::kVerticesPerQuad);
    EXPECT_EQ(data.caps.size(), 2 * tesselator::kVerticesPerQuad);
    EXPECT_EQ(data.colors.size(), 2 * tesselator::kVerticesPerQuad * 4);

    EXPECT_FLOAT_EQ(data.caps.front(), static_cast<float>(1.0 / 11.0));
    EXPECT_FLOAT_EQ(data.colors[0], 1.0F);
    EXPECT_FLOAT_EQ(data.colors[1], 0.0F);
}

TEST(TesselatorTest, SegmentQuadIsPaddedForCaps)
{
    tesselator::Quad const quad = tesselator::TesselateSegment({0, 0}, {10, 0}, 2.0);

    BBox const bounds = BBox::FromPoints({quad[0], quad[1], quad[2], quad[3]});
    EXPECT_DOUBLE_EQ(bounds.X(), -1);
    EXPECT_DOUBLE_EQ(bounds.X2(), 11);
    EXPECT_DOUBLE_EQ(bounds.Y(), -1);
    EXPECT_DOUBLE_EQ(bounds.Y2(), 1);
}

TEST(TesselatorTest, ShortPolylineGivesNothing)
{
    EXPECT_TRUE(tesselator::TesselatePolyline(shapes::Polyline {{{1, 1}}, 1.0, kRed}).Empty());
}

TEST(TesselatorTest, NaNQuadIsRejected)
{
    double const nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<float> out;
    tesselator::Quad const quad = {Vec2(0, 0), Vec2(nan, 0), Vec2(1, 1), Vec2(0, 1)};

    EXPECT_FALSE(tesselator::QuadToTriangles(quad, out));
    EXPECT_TRUE(out.empty());
}

TEST(TesselatorTest, InfiniteQuadIsRejected)
{
    double const inf = std::numeric_limits<double>::infinity();
    std::vector<float> out;
    tesselator::Quad const quad = {Vec2(0, 0), Vec2(1, 0), Vec2(1, -inf), Vec2(0, 1)};

    EXPECT_FALSE(tesselator::QuadToTriangles(quad, out));
    EXPECT_TRUE(out.empty());
}

TEST(TesselatorTest, NonFinitePolygonsAreSkipped)
{
    double const nan = std::numeric_limits<double>::quiet_NaN();
    double const inf = std::numeric_limits<double>::infinity();

    testing::internal::CaptureStderr();
    VertexData const triangle = tesselator::TriangulatePolygon({{{0, 0}, {nan, 0}, {0, 1}}, kRed});
    VertexData const square = tesselator::TriangulatePolygon({{{0, 0}, {1, 0}, {1, inf}, {0, 1}}, kRed});
    std::string const output = testing::internal::GetCapturedStderr();

    EXPECT_TRUE(triangle.Empty());
    EXPECT_TRUE(triangle.colors.empty());
    EXPECT_TRUE(square.Empty());
    EXPECT_NE(output.find("non-finite vertex"), std::string::npos);
}

TEST(TesselatorTest, CirclesUseFullCapRegion)
{
    VertexData const data = tesselator::TesselateCircles({{{0, 0}, 2.0, kRed}, {{5, 5}, 1.0, kGreen}});

    EXPECT_EQ(data.VertexCount(), 2 * tesselator::kVerticesPerQuad);
    for (float cap : data.caps) {
        EXPECT_FLOAT_EQ(cap, 1.0F);
    }
}

TEST(TesselatorTest, PolygonTriangulation)
{
    VertexData const square = tesselator::TriangulatePolygon({{{0, 0}, {1, 0}, {1, 1}, {0, 1}}, kRed});
    EXPECT_EQ(square.VertexCount(), 6U);
    EXPECT_TRUE(square.caps.empty());
    EXPECT_EQ(square.colors.size(), 6U * 4);

    VertexData const triangle = tesselator::TriangulatePolygon({{{0, 0}, {1, 0}, {0, 1}}, kRed});
    EXPECT_EQ(triangle.VertexCount(), 3U);

    EXPECT_TRUE(tesselator::TriangulatePolygon({{{0, 0}, {1, 0}}, kRed}).Empty());
}

// --- Renderer ---

TEST(RendererTest, DrawingOutsideALayerThrows)
{
    NullRenderer gfx;
    EXPECT_THROW(gfx.DrawLine({{0, 0}, {1, 1}}, 1.0, kRed), InvalidStateError);
    EXPECT_THROW(gfx.DrawCircle({0, 0}, 1.0, kRed), InvalidStateError);
    EXPECT_THROW(gfx.DrawPolygon({{0, 0}, {1, 0}, {0, 1}}, kRed), InvalidStateError);
    EXPECT_THROW(gfx.EndLayer(), InvalidStateError);
}

TEST(RendererTest, NestedLayersThrow)
{
    NullRenderer gfx;
    gfx.StartLayer("a");
    EXPECT_THROW(gfx.StartLayer("b"), InvalidStateError);

    auto layer = gfx.EndLayer();
    EXPECT_EQ(layer->GetName(), "a");
    EXPECT_FALSE(gfx.HasActiveLayer());
}

TEST(RendererTest, EndBBoxWithoutScopeThrows)
{
    NullRenderer gfx;
    EXPECT_THROW(gfx.EndBBox(nullptr), InvalidStateError);
}

TEST(RendererTest, BBoxScopeCoversDrawnShapes)
{
    NullRenderer gfx;
    TestItem item(ElementType::kGraphicCircle);

    gfx.StartLayer("layer");
    gfx.StartBBox();
    gfx.DrawCircle({0, 0}, 1.0, kRed);
    gfx.DrawPolygon({{2, 2}, {4, 2}, {4, 3}}, kRed);
    BBox const bbox = gfx.EndBBox(&item);
    gfx.EndLayer();

    EXPECT_EQ(bbox, BBox(-1, -1, 5, 4, &item));
    EXPECT_FALSE(gfx.HasOpenBBox());
}

TEST(RendererTest, LineBBoxCoversItsWidth)
{
    NullRenderer gfx;
    TestItem item(ElementType::kGraphicLine);

    gfx.StartLayer("layer");
    gfx.StartBBox();
    gfx.DrawLine({{0, 0}, {10, 0}}, 2.0, kRed);
    BBox const bbox = gfx.EndBBox(&item);
    gfx.EndLayer();

    EXPECT_LE(bbox.X(), 0);
    EXPECT_GE(bbox.X2(), 10);
    EXPECT_LE(bbox.Y(), -1);
    EXPECT_GE(bbox.Y2(), 1);
    EXPECT_EQ(bbox.GetContext(), &item);
}

TEST(RendererTest, LayerScopeAbortsWhenPaintingThrows)
{
    NullRenderer gfx;

    EXPECT_THROW(
        {
            LayerScope scope(gfx, "layer");
            gfx.StartBBox();
            gfx.DrawCircle({0, 0}, 1.0, kRed);
            throw std::runtime_error("paint failed");
        },
        std::runtime_error);

    EXPECT_FALSE(gfx.HasActiveLayer());
    EXPECT_FALSE(gfx.HasOpenBBox());

    LayerScope next(gfx, "next");
    gfx.DrawCircle({0, 0}, 1.0, kRed);
    auto layer = next.Finish();
    ASSERT_NE(layer, nullptr);
    EXPECT_EQ(layer->GetName(), "next");
    EXPECT_EQ(static_cast<const NullRenderLayer&>(*layer).ShapeCount(), 1U);
    EXPECT_FALSE(gfx.HasActiveLayer());
}

TEST(RendererTest, TransparentColorsFallBackToState)
{
    NullRenderer gfx;
    gfx.State().SetStroke(kRed);
    gfx.State().SetFill(kGreen);
    gfx.State().SetStrokeWidth(0.25);

    gfx.StartLayer("layer");
    gfx.DrawLine(std::vector<Vec2> {{0, 0}, {1, 0}});
    gfx.DrawCircle({0, 0}, 1.0);
    auto layer = gfx.EndLayer();

    const auto& graphics = static_cast<const NullRenderLayer&>(*layer);
    ASSERT_EQ(graphics.GetLines().size(), 1U);
    EXPECT_TRUE(SameColor(graphics.GetLines()[0].color, kRed));
    EXPECT_DOUBLE_EQ(graphics.GetLines()[0].width, 0.25);
    ASSERT_EQ(graphics.GetCircles().size(), 1U);
    EXPECT_TRUE(SameColor(graphics.GetCircles()[0].color, kGreen));
}

TEST(RendererTest, ShapesStillTransparentAreSkipped)
{
    NullRenderer gfx;
    gfx.State().SetStroke(color_utils::kTransparentBlack);

    gfx.StartLayer("layer");
    gfx.DrawLine({{0, 0}, {1, 0}}, 1.0);
    auto layer = gfx.EndLayer();

    EXPECT_EQ(static_cast<const NullRenderLayer&>(*layer).ShapeCount(), 0U);
}

TEST(RendererTest, StateMatrixTransformsShapes)
{
    NullRenderer gfx;
    gfx.State().Multiply(Matrix3::Translation(5, 5));

    gfx.StartLayer("layer");
    gfx.DrawPolygon({{0, 0}, {1, 0}, {0, 1}}, kRed);
    auto layer = gfx.EndLayer();

    const auto& polygon = static_cast<const NullRenderLayer&>(*layer).GetPolygons().at(0);
    EXPECT_EQ(polygon.points[0], Vec2(5, 5));
    EXPECT_EQ(polygon.points[2], Vec2(5, 6));
}

TEST(RendererTest, ArcsBecomePolylines)
{
    NullRenderer gfx;
    gfx.StartLayer("layer");
    gfx.DrawArc({0, 0}, 1.0, Angle(0.0), Angle(constants::kPi), 0.2, kRed);
    EXPECT_THROW(gfx.DrawArc({0, 0}, 1.0, Angle(1.0), Angle(0.0), 0.2, kRed), std::invalid_argument);
    auto layer = gfx.EndLayer();

    const auto& lines = static_cast<const NullRenderLayer&>(*layer).GetLines();
    ASSERT_EQ(lines.size(), 1U);
    EXPECT_EQ(lines[0].points.front(), Vec2(1, 0));
    EXPECT_NEAR(lines[0].points.back().x_ax, -1, 1e-12);
    EXPECT_DOUBLE_EQ(lines[0].width, 0.2);
}

// --- GLRenderer ---

TEST(GLRendererTest, SetupWithoutWindowLeavesNothingBehind)
{
    testing::internal::CaptureStderr();
    {
        GLRenderer gfx(nullptr);
        EXPECT_FALSE(gfx.Setup());
        EXPECT_FALSE(gfx.IsReady());
        EXPECT_FALSE(gfx.GetPolylineShader().IsValid());
        EXPECT_FALSE(gfx.GetPolygonShader().IsValid());
        gfx.Dispose();
        EXPECT_THROW(gfx.ClearCanvas(), InvalidStateError);
    }
    std::string const output = testing::internal::GetCapturedStderr();
    EXPECT_NE(output.find("No window"), std::string::npos);
}

TEST(GLRendererTest, ReleasingAnUnloadedShaderDoesNothing)
{
    gl::ShaderProgram program;
    program.Release();
    program.Release();
    EXPECT_FALSE(program.IsValid());
}
