#include <include/core/SkCanvas.h>
#include <include/core/SkSurface.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>

#include "CanvasHost.hpp"
#include "ConvertVec.hpp"
#include "FontData.hpp"
#include "Logger.hpp"
#include "RasterExport.hpp"
#include "ScriptReplay.hpp"
#include "ToolConfiguration.hpp"
#include "VersionConstants.hpp"
#include "DrawingTools/ToolManager.hpp"

namespace {
    void init_logs() {
        Logger::get().add_log("FATAL", [](const std::string& text) {
            std::cerr << "[FATAL] " << text << std::endl;
        });
        Logger::get().add_log("WARNING", [](const std::string& text) {
            std::cerr << "[WARNING] " << text << std::endl;
        });
        Logger::get().add_log("INFO", [](const std::string& text) {
            std::cout << "[INFO] " << text << std::endl;
        });
    }

    std::optional<nlohmann::json> load_script(const std::filesystem::path& scriptPath) {
        std::ifstream f(scriptPath);
        if(!f.is_open()) {
            Logger::get().log("FATAL", "[load_script] Could not open " + scriptPath.string());
            return std::nullopt;
        }
        try {
            nlohmann::json j;
            f >> j;
            return j;
        }
        catch(const nlohmann::json::exception& e) {
            Logger::get().log("FATAL", "[load_script] Could not parse " + scriptPath.string() + ": " + e.what());
            return std::nullopt;
        }
    }
}

int main(int argc, char** argv) {
    init_logs();

    if(argc < 3) {
        Logger::get().log("FATAL", std::string("Usage: ") + argv[0] + " <script.json> <out.png> [config.json]");
        return 1;
    }
    std::filesystem::path scriptPath = argv[1];
    std::filesystem::path outPath = argv[2];

    Logger::get().log("INFO", "penkit_replay " + VersionConstants::CURRENT_VERSION_STRING);

    ToolConfiguration config;
    if(argc > 3 && !config.load_file(argv[3]))
        Logger::get().log("INFO", "Continuing with default configuration");

    std::optional<nlohmann::json> script = load_script(scriptPath);
    if(!script)
        return 1;

    FontData fonts;
    ToolManager toolMan;
    toolMan.register_default_tools();
    config.apply_starting_tool(toolMan);

    CanvasHost host(toolMan, &fonts);
    host.apply_config(config);

    ReplayResult result = replay_script(script.value(), host, toolMan);
    Logger::get().log("INFO", "Replayed " + std::to_string(result.gesturesReplayed) + " gestures, skipped " + std::to_string(result.gesturesSkipped) + ", " + std::to_string(host.get_objects().size()) + " objects on canvas");
    for(auto& q : result.queries) {
        std::stringstream ss;
        ss << "Query (" << q.p.x() << ", " << q.p.y() << "): " << q.id.value_or("none");
        Logger::get().log("INFO", ss.str());
    }

    sk_sp<SkSurface> surface = make_raster_surface(config.canvas.width, config.canvas.height);
    if(!surface) {
        Logger::get().log("FATAL", "Could not make drawing surface");
        return 1;
    }
    SkCanvas* canvas = surface->getCanvas();
    canvas->clear(convert_vec4(config.get_canvas_background_color()));
    host.render_all(canvas);

    if(!write_surface_png(surface.get(), outPath)) {
        Logger::get().log("FATAL", "Could not write " + outPath.string());
        return 1;
    }
    Logger::get().log("INFO", "Wrote " + outPath.string());
    return 0;
}
