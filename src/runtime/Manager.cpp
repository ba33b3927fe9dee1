#include "runtime/Manager.hpp"
#include "preview/Scheduler.hpp"
#include "preview/Sweeper.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

namespace ds::runtime {

Manager::Manager(std::shared_ptr<preview::Scheduler> scheduler)
    : scheduler_(std::move(scheduler)) {
    if (!scheduler_) throw std::invalid_argument("Manager requires a scheduler");
    sweeper_ = std::make_shared<preview::Sweeper>(scheduler_, scheduler_->config().sweep_interval);
}

Manager::~Manager() { stopAll(); }

void Manager::startAll() {
    std::scoped_lock lock(mutex_);
    log::Registry::docshare()->debug("[ServiceManager] Starting all services...");

    scheduler_->start();
    log::Registry::docshare()->info("[ServiceManager] {} preview worker(s) started", scheduler_->workerCount());

    // sweeps once right away, picking up whatever a previous run left behind
    sweeper_->start();
    log::Registry::docshare()->info("[ServiceManager] {} started", sweeper_->name());
}

void Manager::stopAll() {
    std::scoped_lock lock(mutex_);
    log::Registry::docshare()->debug("[ServiceManager] Stopping all services...");

    if (sweeper_->isRunning()) sweeper_->stop();

    scheduler_->queue()->close();
    scheduler_->stop();

    log::Registry::docshare()->debug("[ServiceManager] All services stopped.");
}

bool Manager::allRunning() const {
    std::scoped_lock lock(mutex_);
    return scheduler_->isRunning() && sweeper_->isRunning();
}

}
