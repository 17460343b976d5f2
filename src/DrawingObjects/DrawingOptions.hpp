#pragma once
#include "../SharedTypes.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class TextAlign : uint8_t {
    LEFT = 0,
    CENTER,
    RIGHT
};

#define PENKIT_FONT_WEIGHT_NORMAL 400
#define PENKIT_FONT_WEIGHT_BOLD 700

// Style snapshot. Objects copy this at creation and never share it.
struct DrawingOptions {
    Vector4f color{0x22 / 255.0f, 0x22 / 255.0f, 0x22 / 255.0f, 1.0f};
    std::optional<Vector4f> strokeColor;
    std::optional<Vector4f> fillColor;
    bool hasFill = false;
    float strokeWidth = 2.0f;
    float opacity = 1.0f;
    float roughness = 0.5f;
    std::vector<float> lineDash;

    std::optional<Vector4f> shadowColor;
    float shadowBlur = 0.0f;
    Vector2f shadowOffset{0.0f, 0.0f};

    std::string fontFamily = "Arial";
    float fontSize = 16.0f;
    int fontWeight = PENKIT_FONT_WEIGHT_NORMAL;
    TextAlign textAlign = TextAlign::LEFT;

    const Vector4f& get_stroke_color() const;
    bool should_fill() const;
    bool has_shadow() const;

    bool operator==(const DrawingOptions& o) const = default;
};

std::optional<Vector4f> color_from_hex(std::string_view hex);

std::string_view text_align_to_str(TextAlign align);
std::optional<TextAlign> text_align_from_str(std::string_view str);

void to_json(nlohmann::json& j, const DrawingOptions& o);
void from_json(const nlohmann::json& j, DrawingOptions& o);
