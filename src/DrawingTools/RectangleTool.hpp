#pragma once
#include "TwoPointToolBase.hpp"

class RectangleTool : public TwoPointToolBase {
    public:
        RectangleTool();
        void render(const DrawingObject& obj, ToolContext& ctx) const override;
        float get_bounds_padding(const DrawingObject& obj) const override;
};
