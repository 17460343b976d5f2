#include "DrawingOptions.hpp"
#include "../Logger.hpp"
#include <charconv>

const Vector4f& DrawingOptions::get_stroke_color() const {
    return strokeColor.has_value() ? strokeColor.value() : color;
}

bool DrawingOptions::should_fill() const {
    return hasFill && fillColor.has_value();
}

bool DrawingOptions::has_shadow() const {
    return shadowColor.has_value() && shadowBlur > 0.0f;
}

std::optional<Vector4f> color_from_hex(std::string_view hex) {
    if(hex.empty() || hex.front() != '#')
        return std::nullopt;
    hex.remove_prefix(1);

    std::string expanded;
    if(hex.size() == 3 || hex.size() == 4) {
        for(char c : hex) {
            expanded.push_back(c);
            expanded.push_back(c);
        }
    }
    else if(hex.size() == 6 || hex.size() == 8)
        expanded = std::string(hex);
    else
        return std::nullopt;

    if(expanded.size() == 6)
        expanded += "ff";

    Vector4f toRet;
    for(int i = 0; i < 4; i++) {
        unsigned channel = 0;
        const char* begin = expanded.data() + i * 2;
        auto [ptr, ec] = std::from_chars(begin, begin + 2, channel, 16);
        if(ec != std::errc() || ptr != begin + 2)
            return std::nullopt;
        toRet[i] = static_cast<float>(channel) / 255.0f;
    }
    return toRet;
}

std::string_view text_align_to_str(TextAlign align) {
    switch(align) {
        case TextAlign::LEFT:
            return "left";
        case TextAlign::CENTER:
            return "center";
        case TextAlign::RIGHT:
            return "right";
    }
    return "left";
}

std::optional<TextAlign> text_align_from_str(std::string_view str) {
    if(str == "left")
        return TextAlign::LEFT;
    if(str == "center")
        return TextAlign::CENTER;
    if(str == "right")
        return TextAlign::RIGHT;
    return std::nullopt;
}

namespace {
    nlohmann::json color_to_json(const Vector4f& c) {
        return nlohmann::json::array({c.x(), c.y(), c.z(), c.w()});
    }

    std::optional<Vector4f> color_from_json(const nlohmann::json& j) {
        if(j.is_string())
            return color_from_hex(j.get<std::string>());
        if(j.is_array() && (j.size() == 3 || j.size() == 4)) {
            Vector4f c{0.0f, 0.0f, 0.0f, 1.0f};
            for(size_t i = 0; i < j.size(); i++) {
                if(!j[i].is_number())
                    return std::nullopt;
                c[i] = j[i].get<float>();
            }
            return c;
        }
        return std::nullopt;
    }

    void read_optional_color(const nlohmann::json& j, const char* key, std::optional<Vector4f>& out) {
        if(!j.contains(key))
            return;
        const nlohmann::json& v = j.at(key);
        if(v.is_null()) {
            out = std::nullopt;
            return;
        }
        auto c = color_from_json(v);
        if(c.has_value())
            out = c;
        else
            Logger::get().log("WARNING", std::string("[DrawingOptions::from_json] Ignoring malformed color for ") + key);
    }

    template <typename T> void read_number(const nlohmann::json& j, const char* key, T& out) {
        if(j.contains(key) && j.at(key).is_number())
            out = j.at(key).get<T>();
    }
}

void to_json(nlohmann::json& j, const DrawingOptions& o) {
    j = nlohmann::json::object();
    j["color"] = color_to_json(o.color);
    j["strokeColor"] = o.strokeColor.has_value() ? color_to_json(o.strokeColor.value()) : nlohmann::json(nullptr);
    j["fillColor"] = o.fillColor.has_value() ? color_to_json(o.fillColor.value()) : nlohmann::json(nullptr);
    j["hasFill"] = o.hasFill;
    j["strokeWidth"] = o.strokeWidth;
    j["opacity"] = o.opacity;
    j["roughness"] = o.roughness;
    j["lineDash"] = o.lineDash;
    j["shadowColor"] = o.shadowColor.has_value() ? color_to_json(o.shadowColor.value()) : nlohmann::json(nullptr);
    j["shadowBlur"] = o.shadowBlur;
    j["shadowOffset"] = nlohmann::json::array({o.shadowOffset.x(), o.shadowOffset.y()});
    j["fontFamily"] = o.fontFamily;
    j["fontSize"] = o.fontSize;
    j["fontWeight"] = o.fontWeight;
    j["textAlign"] = std::string(text_align_to_str(o.textAlign));
}

void from_json(const nlohmann::json& j, DrawingOptions& o) {
    if(!j.is_object())
        return;

    if(j.contains("color")) {
        auto c = color_from_json(j.at("color"));
        if(c.has_value())
            o.color = c.value();
        else
            Logger::get().log("WARNING", "[DrawingOptions::from_json] Ignoring malformed color for color");
    }
    read_optional_color(j, "strokeColor", o.strokeColor);
    read_optional_color(j, "fillColor", o.fillColor);
    read_optional_color(j, "shadowColor", o.shadowColor);

    if(j.contains("hasFill") && j.at("hasFill").is_boolean())
        o.hasFill = j.at("hasFill").get<bool>();
    read_number(j, "strokeWidth", o.strokeWidth);
    read_number(j, "opacity", o.opacity);
    read_number(j, "roughness", o.roughness);
    read_number(j, "shadowBlur", o.shadowBlur);
    read_number(j, "fontSize", o.fontSize);
    read_number(j, "fontWeight", o.fontWeight);

    if(j.contains("lineDash") && j.at("lineDash").is_array()) {
        std::vector<float> dash;
        for(auto& d : j.at("lineDash")) {
            if(d.is_number())
                dash.emplace_back(d.get<float>());
        }
        o.lineDash = dash;
    }

    if(j.contains("shadowOffset")) {
        const nlohmann::json& off = j.at("shadowOffset");
        if(off.is_array() && off.size() == 2 && off[0].is_number() && off[1].is_number())
            o.shadowOffset = Vector2f{off[0].get<float>(), off[1].get<float>()};
    }

    if(j.contains("fontFamily") && j.at("fontFamily").is_string())
        o.fontFamily = j.at("fontFamily").get<std::string>();

    if(j.contains("textAlign") && j.at("textAlign").is_string()) {
        auto align = text_align_from_str(j.at("textAlign").get<std::string>());
        if(align.has_value())
            o.textAlign = align.value();
    }
}
