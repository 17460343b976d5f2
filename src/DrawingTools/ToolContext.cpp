#include "ToolContext.hpp"
#include "../FontData.hpp"
#include "../Logger.hpp"
#include <atomic>
#include <chrono>
#include <random>

namespace {
    std::string to_base36(uint64_t v) {
        static constexpr char DIGITS[] = "0123456789abcdefghijklmnopqrstuvwxyz";
        if(v == 0)
            return "0";
        std::string toRet;
        while(v != 0) {
            toRet.insert(toRet.begin(), DIGITS[v % 36]);
            v /= 36;
        }
        return toRet;
    }
}

std::string generate_object_id() {
    static std::atomic<uint64_t> counter = 0;
    static std::mt19937_64 gen{std::random_device{}()};
    uint64_t millis = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
    return to_base36(millis) + to_base36(gen() % 2176782336ULL) + to_base36(counter++);
}

std::string ToolContext::generate_id() {
    if(generateId) {
        std::string id = generateId();
        if(!id.empty())
            return id;
        Logger::get().log("WARNING", "[ToolContext::generate_id] Host returned an empty id, using fallback generator");
    }
    else
        Logger::get().log("WARNING", "[ToolContext::generate_id] No id generator provided, using fallback generator");
    return generate_object_id();
}

void ToolContext::redraw_canvas() {
    if(redrawCanvas)
        redrawCanvas();
}

void ToolContext::save_state() {
    if(saveState)
        saveState();
}

SkFont ToolContext::get_font(const DrawingOptions& fontOptions) {
    if(fonts)
        return fonts->get_font(fontOptions);
    SkFont font;
    font.setSize(fontOptions.fontSize);
    return font;
}
