#include "CircleTool.hpp"
#include "../DrawGeometry.hpp"
#include <include/core/SkPathBuilder.h>

CircleTool::CircleTool():
    TwoPointToolBase(DrawingToolType::CIRCLE, "circle",
        "<svg width=\"16\" height=\"16\" viewBox=\"0 0 16 16\" fill=\"none\"><circle cx=\"8\" cy=\"8\" r=\"6\" stroke=\"currentColor\" stroke-width=\"1.5\" fill=\"none\"/></svg>",
        "Circle (4)")
{}

void CircleTool::render(const DrawingObject& obj, ToolContext& ctx) const {
    if(!obj.endPoint)
        return;
    DrawingBounds b = normalized_anchor_bounds(obj.startPoint, obj.endPoint.value());
    SkPathBuilder pathBuilder;
    pathBuilder.addOval(SkRect::MakeXYWH(b.x, b.y, b.width, b.height));
    draw_shape_path(obj, ctx, pathBuilder.detach(), obj.options.get_stroke_color(), true);
}

bool CircleTool::hit_test(const Vector2f& p, const DrawingObject& obj, float margin) const {
    if(!obj.endPoint)
        return false;
    Vector2f center = (obj.startPoint + obj.endPoint.value()) * 0.5f;
    Vector2f radii = (obj.endPoint.value() - obj.startPoint).cwiseAbs() * 0.5f + Vector2f{margin, margin};
    if(radii.x() <= 0.0f || radii.y() <= 0.0f)
        return false;
    Vector2f d = (p - center).cwiseQuotient(radii);
    return d.squaredNorm() <= 1.0f;
}

float CircleTool::get_bounds_padding(const DrawingObject& obj) const {
    return stroke_padding(obj);
}
