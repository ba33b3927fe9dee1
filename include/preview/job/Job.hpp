#pragma once

#include <cstdint>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <pqxx/params>

#include <nlohmann/json_fwd.hpp>

namespace pqxx { class row; class result; }

namespace ds::preview::job {

// One preview-generation lineage for a file. Mirrors a row of preview_jobs.
struct Job {
    // status: pending/processing/completed/failed
    enum class Status : uint8_t {
        PENDING,
        PROCESSING,
        COMPLETED,
        FAILED
    };

    std::string id;
    std::string file_id;
    std::optional<std::string> requested_by_id;

    Status status{Status::PENDING};
    uint32_t attempts{0};
    uint32_t max_attempts{3};
    std::optional<std::string> last_error;

    // Timing (0 means NULL / not set)
    std::time_t started_at{0};
    std::time_t completed_at{0};
    std::time_t next_retry_at{0};
    std::time_t created_at{0};
    std::time_t updated_at{0};

    Job() = default;
    explicit Job(const pqxx::row& row);

    [[nodiscard]] bool isInFlight() const noexcept {
        return status == Status::PENDING || status == Status::PROCESSING;
    }

    [[nodiscard]] bool attemptsExhausted() const noexcept { return attempts >= max_attempts; }

    // completed, or failed with no attempts left
    [[nodiscard]] bool isTerminal() const noexcept {
        return status == Status::COMPLETED || (status == Status::FAILED && attemptsExhausted());
    }

    [[nodiscard]] bool isRetryable() const noexcept {
        return status == Status::FAILED && !attemptsExhausted();
    }

    static std::string_view toString(Status s) noexcept;

    // Returns false if unrecognized (and leaves out unchanged)
    static bool tryParseStatus(std::string_view in, Status& out) noexcept;

    // Positional parameters for preview_job.update
    [[nodiscard]] pqxx::params getUpdateParams() const;
};

using JobPtr = std::shared_ptr<Job>;

void to_json(nlohmann::json& j, const Job& job);

std::vector<JobPtr> jobs_from_pqxx_res(const pqxx::result& res);

}
