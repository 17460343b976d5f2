#pragma once
#include <string>

namespace VersionConstants {
    const std::string CURRENT_VERSION_STRING = "0.1.0";
    constexpr int CURRENT_CONFIG_VERSION = 1; // Bump whenever a config key changes meaning
}
