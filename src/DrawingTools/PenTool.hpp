#pragma once
#include "FreehandToolBase.hpp"

class PenTool : public FreehandToolBase {
    public:
        PenTool();
        bool requires_drag() const override;
        void render(const DrawingObject& obj, ToolContext& ctx) const override;
        bool hit_test(const Vector2f& p, const DrawingObject& obj, float margin) const override;
        float get_default_hit_margin() const override;
};
