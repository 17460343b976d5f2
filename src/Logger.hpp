#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

class Logger {
    public:
        typedef std::function<void(const std::string&)> LogFunc;

        static Logger& get();

        void add_log(const std::string& category, const LogFunc& func);
        void clear_logs(const std::string& category);
        void log(const std::string& category, const std::string& text);
    private:
        Logger() = default;
        std::unordered_map<std::string, std::vector<LogFunc>> logFuncs;
};
