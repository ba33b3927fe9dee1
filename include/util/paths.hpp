#pragma once

#include <filesystem>

namespace ds::paths {

std::filesystem::path getConfigPath();
std::filesystem::path getLogPath();

void setConfigPath(const std::filesystem::path& path);
void setLogPathForTesting();

}
