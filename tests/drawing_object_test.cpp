#include "test_common.hpp"
#include "DrawingObjects/DrawingObject.hpp"
#include "DrawingObjects/DrawingOptions.hpp"
#include "DrawingObjects/DrawingToolType.hpp"

TEST(DrawingBoundsTest, ContainsWithMargin) {
    DrawingBounds b{10.0f, 10.0f, 20.0f, 5.0f};
    EXPECT_TRUE(b.contains({10.0f, 10.0f}));
    EXPECT_TRUE(b.contains({30.0f, 15.0f}));
    EXPECT_FALSE(b.contains({31.0f, 12.0f}));
    EXPECT_TRUE(b.contains({31.0f, 12.0f}, 2.0f));
    EXPECT_EQ(DrawingBounds::make_ltrb(1.0f, 2.0f, 4.0f, 8.0f), (DrawingBounds{1.0f, 2.0f, 3.0f, 6.0f}));
}

TEST(DrawingObjectTest, StartsWithZeroBoundsAtStartPoint) {
    DrawingObject obj("a", DrawingToolType::RECTANGLE, {3.0f, 4.0f}, DrawingOptions{});
    EXPECT_EQ(obj.get_id(), "a");
    EXPECT_EQ(obj.get_type(), DrawingToolType::RECTANGLE);
    EXPECT_EQ(obj.bounds, (DrawingBounds{3.0f, 4.0f, 0.0f, 0.0f}));
    EXPECT_FALSE(obj.endPoint.has_value());
    EXPECT_FALSE(obj.points.has_value());
    EXPECT_FALSE(obj.transform.has_value());
}

TEST(DrawingOptionsTest, Defaults) {
    DrawingOptions o;
    EXPECT_TRUE(o.color.isApprox(Vector4f{0x22 / 255.0f, 0x22 / 255.0f, 0x22 / 255.0f, 1.0f}));
    EXPECT_FLOAT_EQ(o.strokeWidth, 2.0f);
    EXPECT_FLOAT_EQ(o.opacity, 1.0f);
    EXPECT_FLOAT_EQ(o.roughness, 0.5f);
    EXPECT_FLOAT_EQ(o.fontSize, 16.0f);
    EXPECT_EQ(o.fontFamily, "Arial");
    EXPECT_EQ(o.fontWeight, PENKIT_FONT_WEIGHT_NORMAL);
    EXPECT_EQ(o.textAlign, TextAlign::LEFT);
    EXPECT_FALSE(o.should_fill());
    EXPECT_FALSE(o.has_shadow());
}

TEST(DrawingOptionsTest, StrokeColorFallsBackToColor) {
    DrawingOptions o;
    EXPECT_EQ(&o.get_stroke_color(), &o.color);
    o.strokeColor = Vector4f{1.0f, 0.0f, 0.0f, 1.0f};
    EXPECT_TRUE(o.get_stroke_color().isApprox(Vector4f{1.0f, 0.0f, 0.0f, 1.0f}));
}

TEST(DrawingOptionsTest, FillNeedsFlagAndColor) {
    DrawingOptions o;
    o.hasFill = true;
    EXPECT_FALSE(o.should_fill());
    o.fillColor = Vector4f{0.0f, 1.0f, 0.0f, 1.0f};
    EXPECT_TRUE(o.should_fill());
    o.hasFill = false;
    EXPECT_FALSE(o.should_fill());
}

TEST(DrawingOptionsTest, ShadowNeedsColorAndBlur) {
    DrawingOptions o;
    o.shadowColor = Vector4f{0.0f, 0.0f, 0.0f, 0.5f};
    EXPECT_FALSE(o.has_shadow());
    o.shadowBlur = 4.0f;
    EXPECT_TRUE(o.has_shadow());
}

TEST(DrawingOptionsTest, HexColors) {
    EXPECT_TRUE(color_from_hex("#ff0000")->isApprox(Vector4f{1.0f, 0.0f, 0.0f, 1.0f}));
    EXPECT_TRUE(color_from_hex("#0f0")->isApprox(Vector4f{0.0f, 1.0f, 0.0f, 1.0f}));
    EXPECT_NEAR(color_from_hex("#00000080")->w(), 128.0f / 255.0f, 1e-6f);
    EXPECT_FALSE(color_from_hex("ff0000").has_value());
    EXPECT_FALSE(color_from_hex("#12345").has_value());
    EXPECT_FALSE(color_from_hex("#gg0000").has_value());
}

TEST(DrawingOptionsTest, PartialJsonKeepsDefaults) {
    LogCapture logs;
    DrawingOptions o;
    from_json(nlohmann::json{{"strokeWidth", 5}, {"color", "#0000ff"}, {"textAlign", "center"}, {"fillColor", "not a color"}}, o);
    EXPECT_FLOAT_EQ(o.strokeWidth, 5.0f);
    EXPECT_TRUE(o.color.isApprox(Vector4f{0.0f, 0.0f, 1.0f, 1.0f}));
    EXPECT_EQ(o.textAlign, TextAlign::CENTER);
    EXPECT_FALSE(o.fillColor.has_value());
    EXPECT_FLOAT_EQ(o.fontSize, 16.0f);
    EXPECT_TRUE(logs.contains("fillColor"));
}

TEST(DrawingOptionsTest, JsonWritesEveryField) {
    DrawingOptions o;
    o.lineDash = {4.0f, 2.0f};
    o.shadowColor = Vector4f{0.0f, 0.0f, 0.0f, 1.0f};
    o.shadowBlur = 3.0f;
    nlohmann::json j = o;
    DrawingOptions back;
    from_json(j, back);
    EXPECT_EQ(back, o);
}

TEST(DrawingToolTypeTest, NamesAreStable) {
    EXPECT_EQ(drawing_tool_type_to_str(DrawingToolType::HANDDRAWN), "hand-drawn");
    EXPECT_EQ(drawing_tool_type_from_str("hand-drawn"), DrawingToolType::HANDDRAWN);
    EXPECT_EQ(drawing_tool_type_from_str("highlighter"), DrawingToolType::HIGHLIGHTER);
    EXPECT_FALSE(drawing_tool_type_from_str("lasso").has_value());
    EXPECT_FALSE(drawing_tool_type_from_str("").has_value());
}
