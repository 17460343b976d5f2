#pragma once
#include "TwoPointToolBase.hpp"

#define ARROW_MIN_BOUNDS_PADDING 20.0f

class ArrowTool : public TwoPointToolBase {
    public:
        ArrowTool();
        void render(const DrawingObject& obj, ToolContext& ctx) const override;
        bool hit_test(const Vector2f& p, const DrawingObject& obj, float margin) const override;
        // Leaves room for the arrowhead, which can stick out past the anchors' box
        float get_bounds_padding(const DrawingObject& obj) const override;
};
