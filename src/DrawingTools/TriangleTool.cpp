#include "TriangleTool.hpp"
#include "../ConvertVec.hpp"
#include "../DrawGeometry.hpp"
#include <include/core/SkPathBuilder.h>

TriangleTool::TriangleTool():
    TwoPointToolBase(DrawingToolType::TRIANGLE, "triangle",
        "<svg width=\"16\" height=\"16\" viewBox=\"0 0 16 16\"><polygon points=\"8,2 14,14 2,14\" fill=\"currentColor\"/></svg>",
        "Triangle")
{}

void TriangleTool::render(const DrawingObject& obj, ToolContext& ctx) const {
    if(!obj.endPoint)
        return;
    std::array<Vector2f, 3> tri = triangle_polygon(obj.startPoint, obj.endPoint.value());
    SkPathBuilder pathBuilder;
    pathBuilder.moveTo(convert_vec2(tri[0]));
    pathBuilder.lineTo(convert_vec2(tri[1]));
    pathBuilder.lineTo(convert_vec2(tri[2]));
    pathBuilder.close();
    draw_shape_path(obj, ctx, pathBuilder.detach(), obj.options.color, false);
}

float TriangleTool::get_default_hit_margin() const {
    return 4.0f;
}
