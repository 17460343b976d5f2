#pragma once
#include "TwoPointToolBase.hpp"
#include <array>

#define HANDDRAWN_JITTER_PER_ROUGHNESS 4.0f

// Rectangle with four slightly wobbly edges. The wobble is seeded from the object id so the
// same object always renders identically.
class HandDrawnTool : public TwoPointToolBase {
    public:
        HandDrawnTool();
        void render(const DrawingObject& obj, ToolContext& ctx) const override;
        float get_default_hit_margin() const override;
        float get_bounds_padding(const DrawingObject& obj) const override;

        static float jitter_amplitude(const DrawingObject& obj);
        static std::array<std::pair<Vector2f, Vector2f>, 4> jittered_edges(const DrawingObject& obj);
};
