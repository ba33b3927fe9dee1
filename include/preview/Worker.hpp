#pragma once

#include "concurrency/AsyncService.hpp"
#include "preview/Scheduler.hpp"

#include <chrono>
#include <memory>

namespace ds::preview {

// Drains the wake-up queue one task at a time.
class Worker final : public concurrency::AsyncService {
public:
    static constexpr auto POLL_INTERVAL = std::chrono::milliseconds(250);

    Worker(Scheduler& scheduler, std::shared_ptr<Scheduler::Queue> queue, unsigned int index);
    ~Worker() override;

protected:
    void runLoop() override;

private:
    Scheduler& scheduler_;
    std::shared_ptr<Scheduler::Queue> queue_;
};

}
