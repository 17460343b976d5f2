#include "ScriptReplay.hpp"
#include "Logger.hpp"

namespace {
    std::optional<Vector2f> point_from_json(const nlohmann::json& j) {
        if(!j.is_array() || j.size() != 2 || !j[0].is_number() || !j[1].is_number())
            return std::nullopt;
        return Vector2f{j[0].get<float>(), j[1].get<float>()};
    }

    bool replay_gesture(const nlohmann::json& g, size_t index, CanvasHost& host, ToolManager& toolMan) {
        std::string where = "[replay_script] Gesture " + std::to_string(index);
        if(!g.is_object() || !g.contains("tool") || !g.at("tool").is_string()) {
            Logger::get().log("WARNING", where + " has no tool name");
            return false;
        }
        if(!toolMan.set_current_tool(std::string_view(g.at("tool").get_ref<const std::string&>())))
            return false;

        std::vector<Vector2f> pts;
        if(g.contains("points") && g.at("points").is_array()) {
            for(auto& jp : g.at("points")) {
                std::optional<Vector2f> p = point_from_json(jp);
                if(p)
                    pts.emplace_back(p.value());
                else
                    Logger::get().log("WARNING", where + " has a malformed point, skipping it");
            }
        }
        if(pts.empty()) {
            Logger::get().log("WARNING", where + " has no points");
            return false;
        }

        DrawingOptions ambientOptions = host.options;
        if(g.contains("options"))
            from_json(g.at("options"), host.options);

        host.press(pts.front());
        for(size_t i = 1; i + 1 < pts.size(); i++)
            host.move(pts[i]);
        std::shared_ptr<DrawingObject> added = host.release(pts.back());

        host.options = ambientOptions;

        if(added && g.contains("text") && g.at("text").is_string() && host.get_editing_text_id() == added->get_id())
            host.update_text(added->get_id(), g.at("text").get<std::string>());
        host.finish_text_editing();
        return true;
    }
}

ReplayResult replay_script(const nlohmann::json& script, CanvasHost& host, ToolManager& toolMan) {
    ReplayResult toRet;
    if(!script.is_object()) {
        Logger::get().log("WARNING", "[replay_script] Script is not an object");
        return toRet;
    }

    if(script.contains("options"))
        from_json(script.at("options"), host.options);

    if(script.contains("gestures") && script.at("gestures").is_array()) {
        const nlohmann::json& gestures = script.at("gestures");
        for(size_t i = 0; i < gestures.size(); i++) {
            if(replay_gesture(gestures[i], i, host, toolMan))
                toRet.gesturesReplayed++;
            else
                toRet.gesturesSkipped++;
        }
    }

    if(script.contains("queries") && script.at("queries").is_array()) {
        for(auto& jq : script.at("queries")) {
            std::optional<Vector2f> p = point_from_json(jq);
            if(!p) {
                Logger::get().log("WARNING", "[replay_script] Malformed query point");
                continue;
            }
            std::shared_ptr<DrawingObject> hit = host.object_at(p.value());
            toRet.queries.emplace_back(ReplayQueryResult{p.value(), hit ? std::optional<std::string>(hit->get_id()) : std::nullopt});
        }
    }

    return toRet;
}
