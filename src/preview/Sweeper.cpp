#include "preview/Sweeper.hpp"
#include "preview/Scheduler.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace ds::preview;

Sweeper::Sweeper(std::shared_ptr<Scheduler> scheduler, const std::chrono::milliseconds interval)
    : AsyncService("PreviewSweeper"),
      scheduler_(std::move(scheduler)),
      sweep_interval_(interval) {
    if (!scheduler_) throw std::invalid_argument("PreviewSweeper requires a scheduler");
    if (sweep_interval_.count() <= 0) throw std::invalid_argument("PreviewSweeper interval must be positive");
}

Sweeper::~Sweeper() { stop(); }

void Sweeper::runLoop() {
    while (!shouldStop()) {
        try {
            scheduler_->recoverStaleJobs();
        } catch (const std::exception& e) {
            log::Registry::preview()->warn("[PreviewSweeper] Failed to recover preview jobs: {}", e.what());
        }

        lazySleep(sweep_interval_);
    }
}
