#include "FreehandToolBase.hpp"
#include "../ConvertVec.hpp"
#include "../DrawGeometry.hpp"
#include "../Logger.hpp"
#include <include/core/SkPathBuilder.h>

FreehandToolBase::FreehandToolBase(DrawingToolType initType, const std::string& initName, const std::string& initIcon, const std::string& initTitle):
    DrawingToolBase(initType, initName, initIcon, initTitle)
{}

bool FreehandToolBase::requires_drag() const {
    return true;
}

std::shared_ptr<DrawingObject> FreehandToolBase::start_drawing(const Vector2f& p, ToolContext& ctx) {
    std::shared_ptr<DrawingObject> obj = make_object(p, ctx);
    obj->points = std::vector<Vector2f>{p};
    obj->bounds = calculate_bounds(*obj, ctx);
    return obj;
}

bool FreehandToolBase::append_sample(const Vector2f& p, DrawingObject& obj, ToolContext& ctx, const char* caller) {
    if(!obj.points) {
        Logger::get().log("WARNING", std::string("[") + caller + "] Object " + obj.get_id() + " has no sample list, ignoring point");
        return false;
    }
    obj.points->emplace_back(p);
    obj.bounds = calculate_bounds(obj, ctx);
    return true;
}

void FreehandToolBase::continue_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) {
    if(append_sample(p, obj, ctx, "FreehandToolBase::continue_drawing"))
        ctx.redraw_canvas();
}

DrawingFinishOutcome FreehandToolBase::finish_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) {
    append_sample(p, obj, ctx, "FreehandToolBase::finish_drawing");
    return DrawingFinishOutcome::CREATED;
}

bool FreehandToolBase::hit_test(const Vector2f& p, const DrawingObject& obj, float margin) const {
    if(!obj.points)
        return false;
    std::optional<float> dist = distance_to_polyline(p, obj.points.value());
    return dist && dist.value() <= margin;
}

float FreehandToolBase::get_default_hit_margin() const {
    return 8.0f;
}

DrawingBounds FreehandToolBase::calculate_bounds(const DrawingObject& obj, ToolContext& ctx) const {
    if(!obj.points)
        return DrawingBounds{};
    return bounds_of_points(obj.points.value());
}

void FreehandToolBase::render_polyline(const DrawingObject& obj, ToolContext& ctx, SkPaint p) const {
    if(!ctx.canvas || !obj.points || obj.points->size() < 2)
        return;

    const std::vector<Vector2f>& pts = obj.points.value();
    SkPathBuilder pathBuilder;
    pathBuilder.moveTo(convert_vec2(pts[0]));
    for(size_t i = 1; i < pts.size(); i++)
        pathBuilder.lineTo(convert_vec2(pts[i]));

    p.setStrokeCap(SkPaint::kRound_Cap);
    p.setStrokeJoin(SkPaint::kRound_Join);

    ctx.canvas->save();
    ctx.canvas->drawPath(pathBuilder.detach(), p);
    ctx.canvas->restore();
}

float FreehandToolBase::freehand_width(const DrawingObject& obj) {
    return obj.options.strokeWidth != 0.0f ? obj.options.strokeWidth : FREEHAND_DEFAULT_WIDTH;
}
