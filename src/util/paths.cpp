#include "util/paths.hpp"

#include <cstdlib>
#include <string>
#include <unistd.h>

namespace ds::paths {

namespace {
std::filesystem::path configPathOverride;
std::filesystem::path logPathOverride;
}

std::filesystem::path getConfigPath() {
    if (!configPathOverride.empty()) return configPathOverride;
    if (const char* env = std::getenv("DOCSHARE_CONFIG")) return env;
    return "/etc/docshare/config.yaml";
}

std::filesystem::path getLogPath() {
    if (!logPathOverride.empty()) return logPathOverride;
    return "/var/log/docshare";
}

void setConfigPath(const std::filesystem::path& path) {
    configPathOverride = path;
}

void setLogPathForTesting() {
    logPathOverride = std::filesystem::temp_directory_path() / ("docshare_test_logs_" + std::to_string(::getpid()));
}

}
