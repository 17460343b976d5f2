#include "ToolConfiguration.hpp"
#include "DrawingTools/ToolManager.hpp"
#include "VersionConstants.hpp"
#include "Logger.hpp"
#include <fstream>
#include <iomanip>

std::optional<DrawingToolType> ToolConfiguration::get_starting_tool() const {
    return drawing_tool_type_from_str(startingTool);
}

std::optional<float> ToolConfiguration::get_hit_margin(DrawingToolType type) const {
    auto it = hitMargins.find(std::string(drawing_tool_type_to_str(type)));
    if(it == hitMargins.end())
        return std::nullopt;
    return it->second;
}

Vector4f ToolConfiguration::get_canvas_background_color() const {
    return color_from_hex(canvas.backgroundColor).value_or(Vector4f{1.0f, 1.0f, 1.0f, 1.0f});
}

bool ToolConfiguration::apply_starting_tool(ToolManager& toolMan) const {
    std::optional<DrawingToolType> type = get_starting_tool();
    if(type && toolMan.set_current_tool(type.value()))
        return true;
    Logger::get().log("INFO", "[ToolConfiguration::apply_starting_tool] Starting tool " + startingTool + " unavailable");
    std::vector<DrawingToolType> types = toolMan.get_tool_types();
    if(types.empty())
        return false;
    return toolMan.set_current_tool(types.front());
}

nlohmann::json ToolConfiguration::get_config_json() const {
    using json = nlohmann::json;
    json toRet;
    toRet["defaultOptions"] = defaultOptions;
    toRet["startingTool"] = startingTool;
    toRet["hitMargins"] = hitMargins;
    toRet["canvas"] = canvas;
    return toRet;
}

void ToolConfiguration::set_config_json(const nlohmann::json& j) {
    using json = nlohmann::json;
    if(!j.is_object()) {
        Logger::get().log("INFO", "[ToolConfiguration::set_config_json] Settings are not an object, keeping defaults");
        return;
    }

    if(j.contains("defaultOptions"))
        from_json(j.at("defaultOptions"), defaultOptions);

    if(j.contains("startingTool") && j.at("startingTool").is_string()) {
        std::string name = j.at("startingTool").get<std::string>();
        if(drawing_tool_type_from_str(name))
            startingTool = name;
        else
            Logger::get().log("INFO", "[ToolConfiguration::set_config_json] Unknown starting tool " + name);
    }

    if(j.contains("hitMargins") && j.at("hitMargins").is_object()) {
        for(auto& [name, margin] : j.at("hitMargins").items()) {
            if(!drawing_tool_type_from_str(name) || !margin.is_number() || margin.get<float>() < 0.0f) {
                Logger::get().log("INFO", "[ToolConfiguration::set_config_json] Ignoring hit margin for " + name);
                continue;
            }
            hitMargins[name] = margin.get<float>();
        }
    }

    if(j.contains("canvas")) {
        try {
            CanvasConfig newCanvas = canvas;
            j.at("canvas").get_to(newCanvas);
            if(newCanvas.width > 0 && newCanvas.height > 0)
                canvas = newCanvas;
            else
                Logger::get().log("INFO", "[ToolConfiguration::set_config_json] Canvas size must be positive");
        }
        catch(const json::exception& e) {
            Logger::get().log("INFO", std::string("[ToolConfiguration::set_config_json] Malformed canvas settings: ") + e.what());
        }
    }
}

bool ToolConfiguration::load_file(const std::filesystem::path& path) {
    using json = nlohmann::json;
    std::ifstream f(path);
    if(!f.is_open()) {
        Logger::get().log("INFO", "[ToolConfiguration::load_file] Could not open " + path.string());
        return false;
    }

    json j;
    try {
        f >> j;
    }
    catch(const json::exception& e) {
        Logger::get().log("INFO", "[ToolConfiguration::load_file] Could not parse " + path.string() + ": " + e.what());
        return false;
    }

    int version = 0;
    if(j.contains("version") && j.at("version").is_number_integer())
        version = j.at("version").get<int>();
    if(version > VersionConstants::CURRENT_CONFIG_VERSION)
        Logger::get().log("INFO", "[ToolConfiguration::load_file] Config version " + std::to_string(version) + " is newer than this build, unknown keys are ignored");

    if(j.contains("settings"))
        set_config_json(j.at("settings"));
    return true;
}

bool ToolConfiguration::save_file(const std::filesystem::path& path) const {
    std::ofstream f(path);
    if(!f.is_open()) {
        Logger::get().log("INFO", "[ToolConfiguration::save_file] Could not open " + path.string() + " for writing");
        return false;
    }

    using json = nlohmann::json;
    json j;
    j["version"] = VersionConstants::CURRENT_CONFIG_VERSION;
    j["settings"] = get_config_json();
    f << std::setw(4) << j;
    f.close();
    return !f.fail();
}
