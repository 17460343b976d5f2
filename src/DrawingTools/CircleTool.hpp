#pragma once
#include "TwoPointToolBase.hpp"

// Ellipse inscribed in the box spanned by both anchors
class CircleTool : public TwoPointToolBase {
    public:
        CircleTool();
        void render(const DrawingObject& obj, ToolContext& ctx) const override;
        bool hit_test(const Vector2f& p, const DrawingObject& obj, float margin) const override;
        float get_bounds_padding(const DrawingObject& obj) const override;
};
