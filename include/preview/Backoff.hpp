#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

namespace ds::preview {

// Delay before the next attempt once `attempts` failures have been recorded.
// The schedule is indexed at attempts-1 and holds at its final entry.
[[nodiscard]] std::chrono::seconds retryDelay(const std::vector<std::chrono::seconds>& schedule, uint32_t attempts);

}
