#pragma once
#include "TwoPointToolBase.hpp"

class LineTool : public TwoPointToolBase {
    public:
        LineTool();
        void render(const DrawingObject& obj, ToolContext& ctx) const override;
        bool hit_test(const Vector2f& p, const DrawingObject& obj, float margin) const override;
        float get_default_hit_margin() const override;
};
