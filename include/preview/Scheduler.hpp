#pragma once

#include "concurrency/WakeQueue.hpp"
#include "config/Config.hpp"
#include "preview/job/Job.hpp"
#include "preview/job/Task.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ds::preview {

namespace job { class Store; }
class Converter;
class FileCatalog;
class Worker;

// A job-store failure surfaced to a caller of the scheduler.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Owns the lifecycle of preview jobs.
 *
 * The job store is the source of truth. The wake-up queue only shortens the time
 * between a job becoming runnable and a worker noticing it; hints may be dropped
 * at any point, and recoverStaleJobs() re-announces whatever is still runnable.
 *
 * With the default single worker, at most one conversion runs process-wide and at
 * most one attempt per file is in flight. More workers raise throughput but two
 * hints for the same file may then be processed concurrently.
 */
class Scheduler {
public:
    using Queue = concurrency::WakeQueue<job::Task>;

    static constexpr auto STALE_AFTER = std::chrono::minutes(10);

    Scheduler(std::shared_ptr<job::Store> store,
              std::shared_ptr<FileCatalog> files,
              std::shared_ptr<Converter> converter,
              std::shared_ptr<Queue> queue,
              config::PreviewConfig config);

    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Returns the in-flight job for the file if there is one, otherwise a new pending job.
    job::JobPtr enqueue(const std::string& fileId, const std::optional<std::string>& requestedById);

    // Most recent job for the file, or nullptr.
    [[nodiscard]] job::JobPtr getJobByFileId(const std::string& fileId) const;

    // Reopens a failed job that still has attempts left; otherwise behaves like enqueue().
    job::JobPtr retry(const std::string& fileId, const std::optional<std::string>& requestedById);

    void recoverStaleJobs();

    // Handles one wake-up hint on the calling thread. Never throws.
    void process(const job::Task& task) noexcept;

    void start();
    void stop();
    [[nodiscard]] bool isRunning() const;

    [[nodiscard]] const std::shared_ptr<Queue>& queue() const { return queue_; }
    [[nodiscard]] const config::PreviewConfig& config() const { return config_; }
    [[nodiscard]] unsigned int workerCount() const { return config_.worker_count; }

private:
    job::JobPtr enqueueLocked(const std::string& fileId, const std::optional<std::string>& requestedById);
    bool announce(const job::Job& job, const std::optional<std::string>& requestedById, std::string_view dropEvent);
    void markFailed(const job::JobPtr& job, const std::string& reason);

    std::shared_ptr<job::Store> store_;
    std::shared_ptr<FileCatalog> files_;
    std::shared_ptr<Converter> converter_;
    std::shared_ptr<Queue> queue_;
    config::PreviewConfig config_;

    std::mutex admissionMutex_;
    std::vector<std::unique_ptr<Worker>> workers_;
};

}
