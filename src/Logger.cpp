#include "Logger.hpp"

Logger& Logger::get() {
    static Logger logger;
    return logger;
}

void Logger::add_log(const std::string& category, const LogFunc& func) {
    logFuncs[category].emplace_back(func);
}

void Logger::clear_logs(const std::string& category) {
    logFuncs.erase(category);
}

void Logger::log(const std::string& category, const std::string& text) {
    auto it = logFuncs.find(category);
    if(it == logFuncs.end())
        return;
    // Copy so a sink may register or clear sinks while being called
    std::vector<LogFunc> funcs = it->second;
    for(auto& f : funcs)
        f(text);
}
