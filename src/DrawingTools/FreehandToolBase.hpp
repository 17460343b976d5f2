#pragma once
#include "DrawingToolBase.hpp"
#include <include/core/SkPaint.h>

#define FREEHAND_DEFAULT_WIDTH 16.0f

// Tools that record every pointer sample into a polyline
class FreehandToolBase : public DrawingToolBase {
    public:
        FreehandToolBase(DrawingToolType initType, const std::string& initName, const std::string& initIcon, const std::string& initTitle);

        bool requires_drag() const override;
        std::shared_ptr<DrawingObject> start_drawing(const Vector2f& p, ToolContext& ctx) override;
        void continue_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) override;
        DrawingFinishOutcome finish_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) override;

        bool hit_test(const Vector2f& p, const DrawingObject& obj, float margin) const override;
        float get_default_hit_margin() const override;
        DrawingBounds calculate_bounds(const DrawingObject& obj, ToolContext& ctx) const override;
    protected:
        bool append_sample(const Vector2f& p, DrawingObject& obj, ToolContext& ctx, const char* caller);
        void render_polyline(const DrawingObject& obj, ToolContext& ctx, SkPaint p) const;
        static float freehand_width(const DrawingObject& obj);
};
