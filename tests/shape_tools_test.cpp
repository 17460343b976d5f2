#include "test_common.hpp"
#include "DrawingTools/RectangleTool.hpp"
#include "DrawingTools/CircleTool.hpp"
#include "DrawingTools/ArrowTool.hpp"
#include "DrawingTools/LineTool.hpp"
#include "DrawingTools/HandDrawnTool.hpp"
#include "DrawingTools/StarTool.hpp"
#include "DrawingTools/TriangleTool.hpp"
#include "DrawingTools/SelectTool.hpp"

class TwoPointToolTest : public ::testing::TestWithParam<DrawingToolType> {};

TEST_P(TwoPointToolTest, BoundsIgnoreDragDirection) {
    TestToolContext t;
    std::unique_ptr<DrawingToolBase> tool = DrawingToolBase::allocate_tool_type(GetParam());
    ASSERT_TRUE(tool);
    auto downRight = draw_gesture(*tool, t.ctx, {{10.0f, 20.0f}, {60.0f, 90.0f}});
    auto upLeft = draw_gesture(*tool, t.ctx, {{60.0f, 90.0f}, {10.0f, 20.0f}});
    EXPECT_EQ(downRight->bounds, upLeft->bounds);
    EXPECT_LE(downRight->bounds.x, 10.0f);
    EXPECT_GE(downRight->bounds.right(), 60.0f);
}

TEST_P(TwoPointToolTest, HitsOwnAnchorsAndMissesFarAway) {
    TestToolContext t;
    std::unique_ptr<DrawingToolBase> tool = DrawingToolBase::allocate_tool_type(GetParam());
    auto obj = draw_gesture(*tool, t.ctx, {{10.0f, 20.0f}, {60.0f, 90.0f}});
    float margin = tool->get_default_hit_margin();
    if(GetParam() != DrawingToolType::CIRCLE) {
        EXPECT_TRUE(tool->hit_test({10.0f, 20.0f}, *obj, margin));
        EXPECT_TRUE(tool->hit_test({60.0f, 90.0f}, *obj, margin));
    }
    EXPECT_FALSE(tool->hit_test({500.0f, 500.0f}, *obj, margin));
}

TEST_P(TwoPointToolTest, FinishThenRecalculateMatches) {
    TestToolContext t;
    std::unique_ptr<DrawingToolBase> tool = DrawingToolBase::allocate_tool_type(GetParam());
    auto obj = draw_gesture(*tool, t.ctx, {{5.0f, 5.0f}, {30.0f, 12.0f}, {-8.0f, 40.0f}});
    EXPECT_TRUE(obj->endPoint->isApprox(Vector2f{-8.0f, 40.0f}));
    EXPECT_EQ(tool->calculate_bounds(*obj, t.ctx), obj->bounds);
    EXPECT_TRUE(tool->requires_drag());
    EXPECT_EQ(t.redraws, 1u);
}

INSTANTIATE_TEST_SUITE_P(AllTwoPointTools, TwoPointToolTest, ::testing::Values(
    DrawingToolType::RECTANGLE,
    DrawingToolType::CIRCLE,
    DrawingToolType::ARROW,
    DrawingToolType::LINE,
    DrawingToolType::HANDDRAWN,
    DrawingToolType::STAR,
    DrawingToolType::TRIANGLE
));

TEST(RectangleToolTest, BoundsPaddedByHalfStroke) {
    TestToolContext t;
    RectangleTool rect;
    t.ctx.options.strokeWidth = 4.0f;
    auto obj = draw_gesture(rect, t.ctx, {{10.0f, 10.0f}, {50.0f, 30.0f}});
    EXPECT_EQ(obj->bounds, (DrawingBounds{8.0f, 8.0f, 44.0f, 24.0f}));
}

TEST(RectangleToolTest, ZeroStrokeStillPads) {
    TestToolContext t;
    RectangleTool rect;
    t.ctx.options.strokeWidth = 0.0f;
    auto obj = draw_gesture(rect, t.ctx, {{10.0f, 10.0f}, {50.0f, 30.0f}});
    EXPECT_EQ(obj->bounds, (DrawingBounds{9.5f, 9.5f, 41.0f, 21.0f}));
}

TEST(RectangleToolTest, StartCreatesZeroSizeShape) {
    TestToolContext t;
    RectangleTool rect;
    auto obj = rect.start_drawing({7.0f, 7.0f}, t.ctx);
    ASSERT_TRUE(obj->endPoint.has_value());
    EXPECT_TRUE(obj->endPoint->isApprox(Vector2f{7.0f, 7.0f}));
    EXPECT_EQ(obj->bounds, (DrawingBounds{6.0f, 6.0f, 2.0f, 2.0f}));
}

TEST(CircleToolTest, HitInsideGrownEllipse) {
    TestToolContext t;
    CircleTool circle;
    auto obj = draw_gesture(circle, t.ctx, {{0.0f, 0.0f}, {100.0f, 50.0f}});
    EXPECT_TRUE(circle.hit_test({50.0f, 25.0f}, *obj, 5.0f));
    EXPECT_TRUE(circle.hit_test({103.0f, 25.0f}, *obj, 5.0f));
    EXPECT_FALSE(circle.hit_test({106.0f, 25.0f}, *obj, 5.0f));
    // Box corner lies outside the ellipse
    EXPECT_FALSE(circle.hit_test({0.0f, 0.0f}, *obj, 5.0f));
}

TEST(CircleToolTest, DegenerateCircleWithNoMarginMisses) {
    TestToolContext t;
    CircleTool circle;
    auto obj = draw_gesture(circle, t.ctx, {{10.0f, 10.0f}, {10.0f, 10.0f}});
    EXPECT_FALSE(circle.hit_test({10.0f, 10.0f}, *obj, 0.0f));
}

TEST(ArrowToolTest, ShortArrow) {
    TestToolContext t;
    ArrowTool arrow;
    auto obj = draw_gesture(arrow, t.ctx, {{0.0f, 0.0f}, {30.0f, 0.0f}});
    EXPECT_TRUE(arrow.hit_test({15.0f, 0.0f}, *obj, arrow.get_default_hit_margin()));
    EXPECT_FALSE(arrow.hit_test({15.0f, 6.0f}, *obj, arrow.get_default_hit_margin()));
    EXPECT_EQ(obj->bounds, (DrawingBounds{-20.0f, -20.0f, 70.0f, 40.0f}));
}

TEST(ArrowToolTest, WideStrokeGrowsPadding) {
    TestToolContext t;
    ArrowTool arrow;
    t.ctx.options.strokeWidth = 30.0f;
    auto obj = draw_gesture(arrow, t.ctx, {{0.0f, 0.0f}, {30.0f, 0.0f}});
    EXPECT_FLOAT_EQ(obj->bounds.x, -30.0f);
}

TEST(ArrowToolTest, ZeroLengthNeverHits) {
    TestToolContext t;
    ArrowTool arrow;
    auto obj = draw_gesture(arrow, t.ctx, {{5.0f, 5.0f}, {5.0f, 5.0f}});
    EXPECT_FALSE(arrow.hit_test({5.0f, 5.0f}, *obj, 5.0f));
}

TEST(LineToolTest, HitAlongSegment) {
    TestToolContext t;
    LineTool line;
    auto obj = draw_gesture(line, t.ctx, {{0.0f, 0.0f}, {40.0f, 40.0f}});
    EXPECT_EQ(obj->bounds, (DrawingBounds{0.0f, 0.0f, 40.0f, 40.0f}));
    EXPECT_TRUE(line.hit_test({20.0f, 22.0f}, *obj, 4.0f));
    // Inside the box but far from the segment
    EXPECT_FALSE(line.hit_test({35.0f, 5.0f}, *obj, 4.0f));
}

TEST(LineToolTest, ZeroLengthNeverHits) {
    TestToolContext t;
    LineTool line;
    auto obj = draw_gesture(line, t.ctx, {{5.0f, 5.0f}, {5.0f, 5.0f}});
    EXPECT_FALSE(line.hit_test({5.0f, 5.0f}, *obj, 4.0f));
}

TEST(HandDrawnToolTest, BoundsCoverJitter) {
    TestToolContext t;
    HandDrawnTool hand;
    auto obj = draw_gesture(hand, t.ctx, {{10.0f, 10.0f}, {50.0f, 40.0f}});
    float amplitude = HandDrawnTool::jitter_amplitude(*obj);
    EXPECT_FLOAT_EQ(amplitude, 2.0f);
    EXPECT_EQ(obj->bounds, (DrawingBounds{8.0f, 8.0f, 44.0f, 34.0f}));
    for(auto& [a, b] : HandDrawnTool::jittered_edges(*obj)) {
        EXPECT_TRUE(obj->bounds.contains(a));
        EXPECT_TRUE(obj->bounds.contains(b));
    }
}

TEST(HandDrawnToolTest, JitterIsStablePerObject) {
    TestToolContext t;
    HandDrawnTool hand;
    auto obj = draw_gesture(hand, t.ctx, {{10.0f, 10.0f}, {50.0f, 40.0f}});
    auto first = HandDrawnTool::jittered_edges(*obj);
    auto second = HandDrawnTool::jittered_edges(*obj);
    for(size_t i = 0; i < first.size(); i++) {
        EXPECT_EQ(first[i].first, second[i].first);
        EXPECT_EQ(first[i].second, second[i].second);
    }
}

TEST(StarToolTest, HitsInsidePaddedBox) {
    TestToolContext t;
    StarTool star;
    auto obj = draw_gesture(star, t.ctx, {{0.0f, 0.0f}, {40.0f, 40.0f}});
    EXPECT_EQ(obj->bounds, (DrawingBounds{0.0f, 0.0f, 40.0f, 40.0f}));
    EXPECT_TRUE(star.hit_test({-3.0f, 20.0f}, *obj, star.get_default_hit_margin()));
    EXPECT_FALSE(star.hit_test({-5.0f, 20.0f}, *obj, star.get_default_hit_margin()));
}

TEST(TriangleToolTest, HitsInsidePaddedBox) {
    TestToolContext t;
    TriangleTool triangle;
    auto obj = draw_gesture(triangle, t.ctx, {{40.0f, 40.0f}, {0.0f, 0.0f}});
    EXPECT_EQ(obj->bounds, (DrawingBounds{0.0f, 0.0f, 40.0f, 40.0f}));
    EXPECT_TRUE(triangle.hit_test({20.0f, 20.0f}, *obj, 4.0f));
    EXPECT_FALSE(triangle.hit_test({20.0f, 50.0f}, *obj, 4.0f));
}

TEST(SelectToolTest, CreatesNothing) {
    TestToolContext t;
    SelectTool select;
    EXPECT_FALSE(select.requires_drag());
    EXPECT_EQ(select.start_drawing({1.0f, 1.0f}, t.ctx), nullptr);
    EXPECT_EQ(t.nextId, 0u);
}

TEST(SelectToolTest, UsesStoredBounds) {
    SelectTool select;
    TestToolContext t;
    DrawingObject obj("a", DrawingToolType::SELECT, {0.0f, 0.0f}, DrawingOptions{});
    obj.bounds = DrawingBounds{10.0f, 10.0f, 10.0f, 10.0f};
    EXPECT_EQ(select.calculate_bounds(obj, t.ctx), obj.bounds);
    EXPECT_TRUE(select.hit_test({24.0f, 15.0f}, obj, 5.0f));
    EXPECT_FALSE(select.hit_test({26.0f, 15.0f}, obj, 5.0f));
}
