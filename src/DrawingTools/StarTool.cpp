#include "StarTool.hpp"
#include "../ConvertVec.hpp"
#include "../DrawGeometry.hpp"
#include <include/core/SkPathBuilder.h>

StarTool::StarTool():
    TwoPointToolBase(DrawingToolType::STAR, "star",
        "<svg width=\"16\" height=\"16\" viewBox=\"0 0 16 16\"><polygon points=\"8,2 10,6 14,6.5 11,9.5 12,14 8,11.5 4,14 5,9.5 2,6.5 6,6\" fill=\"currentColor\"/></svg>",
        "Star (0)")
{}

void StarTool::render(const DrawingObject& obj, ToolContext& ctx) const {
    if(!obj.endPoint)
        return;
    std::vector<Vector2f> poly = star_polygon(obj.startPoint, obj.endPoint.value());
    if(poly.empty())
        return;
    SkPathBuilder pathBuilder;
    pathBuilder.moveTo(convert_vec2(poly[0]));
    for(size_t i = 1; i < poly.size(); i++)
        pathBuilder.lineTo(convert_vec2(poly[i]));
    pathBuilder.close();
    draw_shape_path(obj, ctx, pathBuilder.detach(), obj.options.color, false);
}

float StarTool::get_default_hit_margin() const {
    return 4.0f;
}
