#include "preview/Scheduler.hpp"
#include "preview/Backoff.hpp"
#include "preview/Converter.hpp"
#include "preview/FileCatalog.hpp"
#include "preview/Worker.hpp"
#include "preview/job/Store.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <unordered_set>

using namespace ds::preview;
using namespace ds::preview::job;
using namespace std::chrono;

Scheduler::Scheduler(std::shared_ptr<Store> store,
                     std::shared_ptr<FileCatalog> files,
                     std::shared_ptr<Converter> converter,
                     std::shared_ptr<Queue> queue,
                     config::PreviewConfig config)
    : store_(std::move(store)),
      files_(std::move(files)),
      converter_(std::move(converter)),
      queue_(std::move(queue)),
      config_(std::move(config)) {
    if (!store_ || !files_ || !converter_ || !queue_)
        throw std::invalid_argument("PreviewScheduler requires a store, file catalog, converter and queue");
    if (config_.retry_delays.empty()) throw std::invalid_argument("PreviewScheduler requires at least one retry delay");
    if (config_.max_attempts == 0) throw std::invalid_argument("PreviewScheduler requires max_attempts >= 1");
    if (config_.worker_count == 0) config_.worker_count = 1;

    if (config_.worker_count > 1)
        log::Registry::preview()->warn(
            "[PreviewScheduler] Running {} workers; the same file may be converted concurrently",
            config_.worker_count);
}

Scheduler::~Scheduler() { stop(); }

JobPtr Scheduler::enqueue(const std::string& fileId, const std::optional<std::string>& requestedById) {
    std::scoped_lock lock(admissionMutex_);
    return enqueueLocked(fileId, requestedById);
}

JobPtr Scheduler::enqueueLocked(const std::string& fileId, const std::optional<std::string>& requestedById) {
    JobPtr existing;
    try {
        existing = store_->findLatest(fileId, {Job::Status::PENDING, Job::Status::PROCESSING});
    } catch (const std::exception& e) {
        throw StoreError(std::string("Failed to check existing preview job: ") + e.what());
    }

    if (existing) return existing;

    auto job = std::make_shared<Job>();
    job->file_id = fileId;
    job->requested_by_id = requestedById;
    job->status = Job::Status::PENDING;
    job->attempts = 0;
    job->max_attempts = config_.max_attempts;

    try {
        store_->create(job);
    } catch (const std::exception& e) {
        throw StoreError(std::string("Failed to create preview job: ") + e.what());
    }

    if (announce(*job, requestedById, "preview_queue_full"))
        log::Registry::preview()->info("[PreviewScheduler] preview_job_enqueued job_id={} file_id={}", job->id, fileId);

    return job;
}

JobPtr Scheduler::getJobByFileId(const std::string& fileId) const {
    try {
        return store_->findLatest(fileId);
    } catch (const std::exception& e) {
        throw StoreError(std::string("Failed to load preview job: ") + e.what());
    }
}

JobPtr Scheduler::retry(const std::string& fileId, const std::optional<std::string>& requestedById) {
    std::scoped_lock lock(admissionMutex_);

    const auto existing = getJobByFileId(fileId);
    if (existing && existing->isRetryable()) {
        existing->status = Job::Status::PENDING;
        existing->last_error.reset();
        existing->next_retry_at = 0;

        try {
            store_->update(existing);
        } catch (const std::exception& e) {
            throw StoreError(std::string("Failed to update preview job: ") + e.what());
        }

        announce(*existing, requestedById, "preview_queue_full_on_retry");
        log::Registry::preview()->info("[PreviewScheduler] preview_job_retry_requested job_id={} file_id={} attempts={}",
                                       existing->id, fileId, existing->attempts);
        return existing;
    }

    return enqueueLocked(fileId, requestedById);
}

void Scheduler::process(const Task& task) noexcept {
    try {
        JobPtr job;
        try {
            job = store_->findLatest(task.file_id, {Job::Status::PENDING});
        } catch (const std::exception& e) {
            log::Registry::preview()->error("[PreviewScheduler] preview_job_load_failed file_id={}: {}", task.file_id, e.what());
            return;
        }

        // already handled or superseded
        if (!job) return;

        job->status = Job::Status::PROCESSING;
        job->started_at = util::now();

        try {
            store_->update(job);
        } catch (const std::exception& e) {
            log::Registry::preview()->error("[PreviewScheduler] preview_job_update_failed job_id={}: {}", job->id, e.what());
            return;
        }

        std::shared_ptr<fs::model::File> file;
        try {
            file = files_->getFile(job->file_id);
        } catch (const std::exception& e) {
            markFailed(job, std::string("file not found: ") + e.what());
            return;
        }

        if (!file) {
            markFailed(job, "file not found");
            return;
        }

        try {
            const auto artifact = converter_->convert(*file);
            log::Registry::preview()->debug("[PreviewScheduler] Preview for file {} written to {}", file->id, artifact);
        } catch (const std::exception& e) {
            markFailed(job, e.what());
            return;
        }

        job->status = Job::Status::COMPLETED;
        job->completed_at = util::now();

        try {
            store_->update(job);
        } catch (const std::exception& e) {
            log::Registry::preview()->error("[PreviewScheduler] preview_job_complete_failed job_id={}: {}", job->id, e.what());
            return;
        }

        log::Registry::preview()->info("[PreviewScheduler] preview_job_completed job_id={} file_id={}", job->id, job->file_id);
    } catch (const std::exception& e) {
        log::Registry::preview()->error("[PreviewScheduler] Unexpected error processing file {}: {}", task.file_id, e.what());
    } catch (...) {
        log::Registry::preview()->error("[PreviewScheduler] Unknown error processing file {}", task.file_id);
    }
}

void Scheduler::markFailed(const JobPtr& job, const std::string& reason) {
    job->attempts++;
    job->last_error = reason;

    if (job->attemptsExhausted()) {
        job->status = Job::Status::FAILED;
        log::Registry::preview()->error(
            "[PreviewScheduler] preview_job_final_failure job_id={} file_id={} attempts={}: {}",
            job->id, job->file_id, job->attempts, reason);
    } else {
        job->status = Job::Status::PENDING;
        const auto delay = retryDelay(config_.retry_delays, job->attempts);
        job->next_retry_at = util::now() + static_cast<std::time_t>(delay.count());
        log::Registry::preview()->warn(
            "[PreviewScheduler] preview_job_retry_scheduled job_id={} file_id={} attempts={} max_attempts={} next_retry={}: {}",
            job->id, job->file_id, job->attempts, job->max_attempts, util::timestampToString(job->next_retry_at), reason);
    }

    try {
        store_->update(job);
    } catch (const std::exception& e) {
        log::Registry::preview()->error("[PreviewScheduler] preview_job_failed_update_failed job_id={}: {}", job->id, e.what());
    }
}

void Scheduler::recoverStaleJobs() {
    const auto now = util::now();
    const auto cutoff = now - static_cast<std::time_t>(duration_cast<seconds>(STALE_AFTER).count());

    // file ids already hinted during this sweep
    std::unordered_set<std::string> announced;

    std::vector<JobPtr> stale;
    try {
        stale = store_->findStale(cutoff);
    } catch (const std::exception& e) {
        log::Registry::preview()->error("[PreviewScheduler] preview_job_stale_query_failed: {}", e.what());
    }

    for (const auto& candidate : stale) {
        try {
            // the worker may have moved it on since the query ran
            const auto job = store_->findById(candidate->id);
            if (!job || job->status != Job::Status::PROCESSING || job->updated_at >= cutoff) continue;

            job->status = Job::Status::PENDING;
            job->next_retry_at = 0;
            store_->update(job);

            announce(*job, job->requested_by_id, "preview_queue_full_on_recovery");
            announced.insert(job->file_id);

            log::Registry::preview()->info("[PreviewScheduler] preview_job_stale_recovered job_id={} file_id={}",
                                           job->id, job->file_id);
        } catch (const std::exception& e) {
            log::Registry::preview()->error("[PreviewScheduler] preview_job_stale_recovery_failed job_id={}: {}",
                                            candidate->id, e.what());
        }
    }

    std::vector<JobPtr> due;
    try {
        due = store_->findDue(now);
    } catch (const std::exception& e) {
        log::Registry::preview()->error("[PreviewScheduler] preview_job_due_query_failed: {}", e.what());
        return;
    }

    for (const auto& job : due) {
        if (!announced.insert(job->file_id).second) continue;
        announce(*job, job->requested_by_id, "preview_queue_full_on_recovery");
    }

    log::Registry::preview()->debug("[PreviewScheduler] Sweep finished: {} stale, {} due, {} announced",
                                    stale.size(), due.size(), announced.size());
}

bool Scheduler::announce(const Job& job, const std::optional<std::string>& requestedById, const std::string_view dropEvent) {
    if (queue_->tryPush(Task{job.file_id, requestedById})) return true;
    log::Registry::preview()->warn("[PreviewScheduler] {} job_id={} file_id={}", dropEvent, job.id, job.file_id);
    return false;
}

void Scheduler::start() {
    if (!workers_.empty()) return;
    for (unsigned int i = 0; i < config_.worker_count; ++i) {
        workers_.push_back(std::make_unique<Worker>(*this, queue_, i));
        workers_.back()->start();
    }
}

void Scheduler::stop() {
    for (auto& worker : workers_) worker->stop();
    workers_.clear();
}

bool Scheduler::isRunning() const {
    if (workers_.empty()) return false;
    for (const auto& worker : workers_)
        if (!worker->isRunning()) return false;
    return true;
}
