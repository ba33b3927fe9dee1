#pragma once

#include <memory>
#include <mutex>

namespace ds::preview { class Scheduler; class Sweeper; }

namespace ds::runtime {

// Starts and stops the long-running parts of the preview daemon.
class Manager {
public:
    explicit Manager(std::shared_ptr<preview::Scheduler> scheduler);
    ~Manager();

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    void startAll();
    void stopAll();

    [[nodiscard]] bool allRunning() const;

private:
    std::shared_ptr<preview::Scheduler> scheduler_;
    std::shared_ptr<preview::Sweeper> sweeper_;

    mutable std::mutex mutex_;
};

}
