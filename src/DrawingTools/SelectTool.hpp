#pragma once
#include "DrawingToolBase.hpp"

// Creates nothing. Only answers hit tests against an object's stored bounds.
class SelectTool : public DrawingToolBase {
    public:
        SelectTool();

        bool requires_drag() const override;
        std::shared_ptr<DrawingObject> start_drawing(const Vector2f& p, ToolContext& ctx) override;
        void continue_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) override;
        DrawingFinishOutcome finish_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) override;

        void render(const DrawingObject& obj, ToolContext& ctx) const override;
        bool hit_test(const Vector2f& p, const DrawingObject& obj, float margin) const override;
        DrawingBounds calculate_bounds(const DrawingObject& obj, ToolContext& ctx) const override;
};
