#pragma once
#include "TwoPointToolBase.hpp"

class TriangleTool : public TwoPointToolBase {
    public:
        TriangleTool();
        void render(const DrawingObject& obj, ToolContext& ctx) const override;
        float get_default_hit_margin() const override;
};
