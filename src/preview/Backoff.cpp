#include "preview/Backoff.hpp"

#include <stdexcept>

std::chrono::seconds ds::preview::retryDelay(const std::vector<std::chrono::seconds>& schedule, const uint32_t attempts) {
    if (schedule.empty()) throw std::invalid_argument("retry delay schedule is empty");
    const size_t index = attempts == 0 ? 0 : attempts - 1;
    return index >= schedule.size() ? schedule.back() : schedule[index];
}
