#pragma once
#include "DrawingToolBase.hpp"
#include <include/core/SkPath.h>

// Tools whose geometry is fully described by the press anchor and the current pointer anchor
class TwoPointToolBase : public DrawingToolBase {
    public:
        TwoPointToolBase(DrawingToolType initType, const std::string& initName, const std::string& initIcon, const std::string& initTitle);

        bool requires_drag() const override;
        std::shared_ptr<DrawingObject> start_drawing(const Vector2f& p, ToolContext& ctx) override;
        void continue_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) override;
        DrawingFinishOutcome finish_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) override;

        // Padded box of the two anchors
        bool hit_test(const Vector2f& p, const DrawingObject& obj, float margin) const override;
        DrawingBounds calculate_bounds(const DrawingObject& obj, ToolContext& ctx) const override;

        virtual float get_bounds_padding(const DrawingObject& obj) const;
    protected:
        static Vector2f get_end_point(const DrawingObject& obj);
        static float stroke_padding(const DrawingObject& obj);
        // Fills when fillable is set and the options ask for it, then strokes
        void draw_shape_path(const DrawingObject& obj, ToolContext& ctx, const SkPath& path, const Vector4f& strokeColor, bool fillable) const;
};
