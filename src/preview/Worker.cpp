#include "preview/Worker.hpp"

#include <string>

using namespace ds::preview;

Worker::Worker(Scheduler& scheduler, std::shared_ptr<Scheduler::Queue> queue, const unsigned int index)
    : AsyncService("PreviewWorker-" + std::to_string(index)),
      scheduler_(scheduler),
      queue_(std::move(queue)) {}

Worker::~Worker() { stop(); }

void Worker::runLoop() {
    while (!shouldStop()) {
        if (auto task = queue_->popFor(POLL_INTERVAL)) scheduler_.process(*task);
        else if (queue_->isClosed()) return;
    }
}
