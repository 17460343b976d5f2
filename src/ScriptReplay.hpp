#pragma once
#include "CanvasHost.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct ReplayQueryResult {
    Vector2f p;
    std::optional<std::string> id; // Topmost object under p
};

struct ReplayResult {
    unsigned gesturesReplayed = 0;
    unsigned gesturesSkipped = 0;
    std::vector<ReplayQueryResult> queries;
};

// Script layout:
// {
//     "options": { ...DrawingOptions overrides for every gesture... },
//     "gestures": [ { "tool": "pen", "points": [[x, y], ...], "text": "...", "options": { ... } } ],
//     "queries": [[x, y], ...]
// }
ReplayResult replay_script(const nlohmann::json& script, CanvasHost& host, ToolManager& toolMan);
