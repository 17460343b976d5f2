#pragma once
#include "FreehandToolBase.hpp"

class EraserTool : public FreehandToolBase {
    public:
        EraserTool();
        void render(const DrawingObject& obj, ToolContext& ctx) const override;
};
