#pragma once
#include "SharedTypes.hpp"
#include "DrawingObjects/DrawingOptions.hpp"
#include "DrawingObjects/DrawingToolType.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

class ToolManager;

class ToolConfiguration {
    public:
        struct CanvasConfig {
            int width = 800;
            int height = 600;
            std::string backgroundColor = "#ffffff";
            NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(CanvasConfig, width, height, backgroundColor)
        } canvas;

        DrawingOptions defaultOptions;
        std::string startingTool = "pen";
        std::map<std::string, float> hitMargins; // Keyed by tool name, overrides the tool's own default

        std::optional<DrawingToolType> get_starting_tool() const;
        std::optional<float> get_hit_margin(DrawingToolType type) const;
        Vector4f get_canvas_background_color() const;

        // Selects the starting tool, falling back to the first registered one
        bool apply_starting_tool(ToolManager& toolMan) const;

        nlohmann::json get_config_json() const;
        // Keys that are missing or malformed keep their current values
        void set_config_json(const nlohmann::json& j);

        bool load_file(const std::filesystem::path& path);
        bool save_file(const std::filesystem::path& path) const;
};
