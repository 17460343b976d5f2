#include "RectangleTool.hpp"
#include "../DrawGeometry.hpp"
#include <include/core/SkPathBuilder.h>

RectangleTool::RectangleTool():
    TwoPointToolBase(DrawingToolType::RECTANGLE, "rectangle",
        "<svg width=\"16\" height=\"16\" viewBox=\"0 0 16 16\" fill=\"none\"><rect x=\"2\" y=\"2\" width=\"12\" height=\"12\" stroke=\"currentColor\" stroke-width=\"1.5\" fill=\"none\"/></svg>",
        "Rectangle (3)")
{}

void RectangleTool::render(const DrawingObject& obj, ToolContext& ctx) const {
    if(!obj.endPoint)
        return;
    DrawingBounds b = normalized_anchor_bounds(obj.startPoint, obj.endPoint.value());
    SkPathBuilder pathBuilder;
    pathBuilder.addRect(SkRect::MakeXYWH(b.x, b.y, b.width, b.height));
    draw_shape_path(obj, ctx, pathBuilder.detach(), obj.options.get_stroke_color(), true);
}

float RectangleTool::get_bounds_padding(const DrawingObject& obj) const {
    return stroke_padding(obj);
}
