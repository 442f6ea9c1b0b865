#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <vector>

#include "TestHelpers.hpp"
#include "view/ViewLayer.hpp"

using test_helpers::TestItem;

namespace
{
std::vector<std::string> Names(const std::vector<ViewLayer*>& layers)
{
    std::vector<std::string> names;
    for (const ViewLayer* layer : layers) {
        names.push_back(layer->GetName());
    }
    return names;
}
}  // namespace

TEST(ViewLayerSetTest, DisplayOrderIsBackToFrontThenHighlightedThenOverlay)
{
    ViewLayerSet layers;
    layers.Add("front");
    layers.Add("middle");
    layers.Add("back");

    EXPECT_EQ(Names(layers.InOrder()), (std::vector<std::string> {"front", "middle", "back"}));
    EXPECT_EQ(Names(layers.InDisplayOrder()), (std::vector<std::string> {"back", "middle", "front", ViewLayerSet::kOverlayName}));

    layers.Highlight("middle");
    EXPECT_TRUE(layers.IsAnyLayerHighlighted());
    EXPECT_EQ(Names(layers.InDisplayOrder()), (std::vector<std::string> {"back", "front", "middle", ViewLayerSet::kOverlayName}));

    layers.ClearHighlight();
    EXPECT_FALSE(layers.IsAnyLayerHighlighted());
}

TEST(ViewLayerSetTest, ByNameReturnsNullForUnknownLayers)
{
    ViewLayerSet layers;
    layers.Add("a");
    EXPECT_NE(layers.ByName("a"), nullptr);
    EXPECT_EQ(layers.ByName("b"), nullptr);
    EXPECT_EQ(layers.Size(), 1U);
}

TEST(ViewLayerTest, VisibilityPredicateIsEvaluatedOnEveryQuery)
{
    ViewLayerSet layers;
    ViewLayer& copper = layers.Add("copper");
    ViewLayer& holes = layers.Add("holes", Visibility(std::function<bool()>([&copper]() { return copper.IsVisible(); })));

    EXPECT_TRUE(holes.IsVisible());
    copper.SetVisible(false);
    EXPECT_FALSE(holes.IsVisible());
    copper.SetVisible(true);
    EXPECT_TRUE(holes.IsVisible());
}

TEST(ViewLayerTest, EmptyPredicateMeansHidden)
{
    ViewLayer layer("empty", Visibility(std::function<bool()>()));
    EXPECT_FALSE(layer.IsVisible());
}

TEST(ViewLayerSetTest, PointQueriesOnlyHitVisibleInteractiveLayers)
{
    TestItem front_item(ElementType::kPad);
    TestItem back_item(ElementType::kTraceSegment);
    TestItem passive_item(ElementType::kGraphicLine);

    ViewLayerSet layers;
    ViewLayer& front = layers.Add("front", true, true);
    ViewLayer& passive = layers.Add("passive", true, false);
    ViewLayer& back = layers.Add("back", true, true);

    front.SetBBoxes({BBox(0, 0, 10, 10, &front_item)});
    passive.SetBBoxes({BBox(0, 0, 10, 10, &passive_item)});
    back.SetBBoxes({BBox(5, 5, 10, 10, &back_item), BBox(100, 100, 1, 1, &back_item)});

    auto hits = layers.QueryPoint({6, 6});
    ASSERT_EQ(hits.size(), 2U);
    EXPECT_EQ(hits[0].layer, &front);
    EXPECT_EQ(hits[0].bbox.GetContext(), &front_item);
    EXPECT_EQ(hits[1].layer, &back);

    front.SetVisible(false);
    hits = layers.QueryPoint({6, 6});
    ASSERT_EQ(hits.size(), 1U);
    EXPECT_EQ(hits[0].bbox.GetContext(), &back_item);

    EXPECT_TRUE(layers.QueryPoint({50, 50}).empty());
}

TEST(ViewLayerSetTest, ItemBBoxesComeFromInteractiveLayers)
{
    TestItem item(ElementType::kPad);

    ViewLayerSet layers;
    layers.Add("a", true, true).SetBBoxes({BBox(0, 0, 1, 1, &item)});
    layers.Add("b", true, false).SetBBoxes({BBox(5, 5, 1, 1, &item)});
    layers.Add("c", true, true).SetBBoxes({BBox(2, 2, 1, 1, &item)});

    std::vector<BBox> const boxes = layers.QueryItemBBoxes(&item);
    ASSERT_EQ(boxes.size(), 2U);
    EXPECT_EQ(BBox::Combine(boxes), BBox(0, 0, 3, 3));

    EXPECT_EQ(layers.GetBBox(), BBox(0, 0, 6, 6));
}

TEST(ViewLayerTest, ClearDropsItemsAndBoxes)
{
    TestItem item(ElementType::kPad);
    ViewLayer layer("a");
    layer.AddItem(&item);
    layer.SetBBoxes({BBox(0, 0, 1, 1, &item)});
    ASSERT_NE(layer.FindBBox(&item), nullptr);

    layer.Clear();
    EXPECT_TRUE(layer.GetItems().empty());
    EXPECT_EQ(layer.FindBBox(&item), nullptr);
    EXPECT_FALSE(layer.GetBBox().IsValid());
}
