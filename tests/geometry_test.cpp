#include "test_common.hpp"
#include "DrawGeometry.hpp"
#include <cmath>

TEST(GeometryTest, SegmentDistanceProjectsOntoSegment) {
    EXPECT_FLOAT_EQ(distance_to_line_segment({5.0f, 3.0f}, {0.0f, 0.0f}, {10.0f, 0.0f}), 3.0f);
    EXPECT_FLOAT_EQ(distance_to_line_segment({5.0f, 0.0f}, {0.0f, 0.0f}, {10.0f, 0.0f}), 0.0f);
}

TEST(GeometryTest, SegmentDistanceClampsToEndpoints) {
    EXPECT_FLOAT_EQ(distance_to_line_segment({-3.0f, 4.0f}, {0.0f, 0.0f}, {10.0f, 0.0f}), 5.0f);
    EXPECT_FLOAT_EQ(distance_to_line_segment({13.0f, 4.0f}, {0.0f, 0.0f}, {10.0f, 0.0f}), 5.0f);
}

TEST(GeometryTest, ZeroLengthSegmentMeasuresToPoint) {
    Vector2f a{2.0f, 2.0f};
    Vector2f p{5.0f, 6.0f};
    EXPECT_FLOAT_EQ(distance_to_line_segment(p, a, a), (p - a).norm());
    EXPECT_FALSE(std::isnan(distance_to_line_segment(a, a, a)));
}

TEST(GeometryTest, PolylineDistance) {
    EXPECT_FALSE(distance_to_polyline({0.0f, 0.0f}, {}).has_value());
    EXPECT_FLOAT_EQ(distance_to_polyline({3.0f, 4.0f}, {Vector2f{0.0f, 0.0f}}).value(), 5.0f);
    std::vector<Vector2f> pts{{0.0f, 0.0f}, {10.0f, 0.0f}, {10.0f, 10.0f}};
    EXPECT_FLOAT_EQ(distance_to_polyline({12.0f, 5.0f}, pts).value(), 2.0f);
}

TEST(GeometryTest, BoundsOfPoints) {
    expect_bounds_near(bounds_of_points({}), DrawingBounds{});
    expect_bounds_near(bounds_of_points({Vector2f{4.0f, 5.0f}}), DrawingBounds{4.0f, 5.0f, 0.0f, 0.0f});
    std::vector<Vector2f> pts{{3.0f, 8.0f}, {-2.0f, 1.0f}, {7.0f, -4.0f}};
    expect_bounds_near(bounds_of_points(pts), DrawingBounds{-2.0f, -4.0f, 9.0f, 12.0f});
}

TEST(GeometryTest, AnchorBoundsIgnoreDragDirection) {
    Vector2f a{10.0f, 40.0f};
    Vector2f b{-5.0f, 2.0f};
    EXPECT_EQ(normalized_anchor_bounds(a, b), normalized_anchor_bounds(b, a));
    expect_bounds_near(normalized_anchor_bounds(a, b, 1.0f), DrawingBounds{-6.0f, 1.0f, 17.0f, 40.0f});
}

TEST(GeometryTest, ArrowHeadForShortShaft) {
    auto head = arrow_head_triangle({0.0f, 0.0f}, {30.0f, 0.0f});
    ASSERT_TRUE(head.has_value());
    EXPECT_FLOAT_EQ(head->length, 10.0f);
    EXPECT_FLOAT_EQ(head->halfWidth, 6.0f);
    EXPECT_TRUE(head->p[0].isApprox(Vector2f{30.0f, 0.0f}));
    EXPECT_NEAR(head->p[1].x(), 20.0f, 1e-4f);
    EXPECT_NEAR(head->p[2].x(), 20.0f, 1e-4f);
    EXPECT_NEAR(std::fabs(head->p[1].y() - head->p[2].y()), 12.0f, 1e-4f);
}

TEST(GeometryTest, ArrowHeadLengthIsCapped) {
    auto head = arrow_head_triangle({0.0f, 0.0f}, {0.0f, 300.0f});
    ASSERT_TRUE(head.has_value());
    EXPECT_FLOAT_EQ(head->length, ARROW_HEAD_MAX_LENGTH);
    EXPECT_NEAR(head->p[1].y(), 280.0f, 1e-4f);
}

TEST(GeometryTest, NoArrowHeadForZeroLength) {
    EXPECT_FALSE(arrow_head_triangle({4.0f, 4.0f}, {4.0f, 4.0f}).has_value());
}

TEST(GeometryTest, StarStartsAtTopSpike) {
    std::vector<Vector2f> star = star_polygon({0.0f, 0.0f}, {100.0f, 60.0f});
    ASSERT_EQ(star.size(), 2u * STAR_DEFAULT_SPIKES);
    // Outer radius is the smaller half extent
    EXPECT_NEAR(star[0].x(), 50.0f, 1e-3f);
    EXPECT_NEAR(star[0].y(), 0.0f, 1e-3f);
    Vector2f center{50.0f, 30.0f};
    EXPECT_NEAR((star[1] - center).norm(), 15.0f, 1e-3f);
    for(size_t i = 0; i < star.size(); i += 2)
        EXPECT_NEAR((star[i] - center).norm(), 30.0f, 1e-3f);
}

TEST(GeometryTest, DegenerateStarCollapsesToCenter) {
    std::vector<Vector2f> star = star_polygon({5.0f, 5.0f}, {5.0f, 5.0f});
    for(auto& p : star)
        EXPECT_TRUE(p.isApprox(Vector2f{5.0f, 5.0f}));
}

TEST(GeometryTest, TriangleUsesNormalizedBox) {
    auto tri = triangle_polygon({40.0f, 0.0f}, {0.0f, 30.0f});
    EXPECT_TRUE(tri[0].isApprox(Vector2f{0.0f, 30.0f}));
    EXPECT_TRUE(tri[1].isApprox(Vector2f{20.0f, 0.0f}));
    EXPECT_TRUE(tri[2].isApprox(Vector2f{40.0f, 30.0f}));
}
