#pragma once
#include "TwoPointToolBase.hpp"

class StarTool : public TwoPointToolBase {
    public:
        StarTool();
        void render(const DrawingObject& obj, ToolContext& ctx) const override;
        float get_default_hit_margin() const override;
};
