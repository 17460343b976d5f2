#include "HandDrawnTool.hpp"
#include "../ConvertVec.hpp"
#include "../DrawGeometry.hpp"
#include <include/core/SkPathBuilder.h>
#include <algorithm>
#include <functional>
#include <random>

HandDrawnTool::HandDrawnTool():
    TwoPointToolBase(DrawingToolType::HANDDRAWN, "hand-drawn",
        "<svg width=\"16\" height=\"16\" viewBox=\"0 0 16 16\"><rect x=\"2\" y=\"2\" width=\"12\" height=\"12\" stroke=\"currentColor\" stroke-width=\"2\" fill=\"none\"/><path d=\"M2 2 Q8 0 14 2 Q16 8 14 14 Q8 16 2 14 Q0 8 2 2 Z\" stroke=\"currentColor\" stroke-width=\"1\" fill=\"none\"/></svg>",
        "Hand-drawn rectangle (6)")
{}

float HandDrawnTool::jitter_amplitude(const DrawingObject& obj) {
    return std::max(0.0f, obj.options.roughness * HANDDRAWN_JITTER_PER_ROUGHNESS);
}

std::array<std::pair<Vector2f, Vector2f>, 4> HandDrawnTool::jittered_edges(const DrawingObject& obj) {
    DrawingBounds b = normalized_anchor_bounds(obj.startPoint, get_end_point(obj));
    std::array<Vector2f, 4> corners = {
        Vector2f{b.x, b.y},
        Vector2f{b.right(), b.y},
        Vector2f{b.right(), b.bottom()},
        Vector2f{b.x, b.bottom()}
    };

    float amplitude = jitter_amplitude(obj);
    std::mt19937 gen(static_cast<std::mt19937::result_type>(std::hash<std::string>{}(obj.get_id())));
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    auto jitter = [&](const Vector2f& v) {
        float dx = dist(gen) * amplitude;
        float dy = dist(gen) * amplitude;
        return Vector2f{v.x() + dx, v.y() + dy};
    };

    std::array<std::pair<Vector2f, Vector2f>, 4> edges;
    for(size_t i = 0; i < 4; i++) {
        Vector2f a = jitter(corners[i]);
        Vector2f b2 = jitter(corners[(i + 1) % 4]);
        edges[i] = {a, b2};
    }
    return edges;
}

void HandDrawnTool::render(const DrawingObject& obj, ToolContext& ctx) const {
    if(!obj.endPoint)
        return;
    SkPathBuilder pathBuilder;
    for(auto& [a, b] : jittered_edges(obj)) {
        pathBuilder.moveTo(convert_vec2(a));
        pathBuilder.lineTo(convert_vec2(b));
    }
    draw_shape_path(obj, ctx, pathBuilder.detach(), obj.options.color, false);
}

float HandDrawnTool::get_default_hit_margin() const {
    return 4.0f;
}

float HandDrawnTool::get_bounds_padding(const DrawingObject& obj) const {
    return jitter_amplitude(obj);
}
