#pragma once
#include "FreehandToolBase.hpp"

#define HIGHLIGHTER_ALPHA 0.3f

class HighlighterTool : public FreehandToolBase {
    public:
        HighlighterTool();
        void render(const DrawingObject& obj, ToolContext& ctx) const override;
};
