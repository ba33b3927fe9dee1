#pragma once

#include "concurrency/AsyncService.hpp"

#include <chrono>
#include <memory>

namespace ds::preview {

class Scheduler;

// Periodic trigger for Scheduler::recoverStaleJobs(). Sweeps once on start.
class Sweeper final : public concurrency::AsyncService {
public:
    Sweeper(std::shared_ptr<Scheduler> scheduler, std::chrono::milliseconds interval);
    ~Sweeper() override;

protected:
    void runLoop() override;

private:
    std::shared_ptr<Scheduler> scheduler_;
    std::chrono::milliseconds sweep_interval_;
};

}
