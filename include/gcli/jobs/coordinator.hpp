#pragma once

#include "gcli/core/result.hpp"
#include "gcli/core/time.hpp"
#include "gcli/remote/archive_service.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gcli::jobs {

enum class JobState {
    NoJob,
    Pending,
    Completed,
    Failed
};

/**
 * @brief Logical operation whose remote job we are looking for
 */
struct JobQuery {
    remote::JobAction action = remote::JobAction::InventoryRetrieval;
    std::string archive_id;     ///< Retrievals only
    int max_age_hours = 0;      ///< Inventories only; 0 accepts pending jobs only
    std::string subject;        ///< Human description used in messages

    static JobQuery archive_retrieval(std::string archive_id, const std::string& display_name);
    static JobQuery inventory(const std::string& vault, int max_age_hours);

    [[nodiscard]] bool matches(const remote::JobDescription& job, Timestamp now) const;
};

struct JobLookup {
    JobState state = JobState::NoJob;
    std::optional<remote::JobDescription> job;    ///< Winner for Completed, latest failure for Failed
    std::vector<remote::JobDescription> matching;
};

struct PollPolicy {
    std::chrono::seconds interval{600};
    int max_attempts = 144;
};

using Sleeper = std::function<void(std::chrono::seconds)>;

/**
 * @brief Decides whether remote work is done, in flight, or must be started
 *
 * Blocking waits sleep on the calling thread between polls. Without wait the
 * coordinator never sleeps and reports pending or freshly queued work as a
 * Retryable error.
 */
class JobCoordinator {
public:
    explicit JobCoordinator(remote::ArchiveService& service,
                            PollPolicy policy = {},
                            Sleeper sleeper = {},
                            Clock clock = system_now);

    /**
     * @brief Apply the selection policy to a set of matching jobs
     *
     * The most recently completed successful job wins; otherwise any pending
     * job yields Pending; otherwise a failed job yields Failed; else NoJob.
     */
    static JobLookup select(std::vector<remote::JobDescription> matching);

    Result<JobLookup> lookup(const std::string& vault, const JobQuery& query);

    /// Submit a new job for the query and return its id.
    Result<std::string> submit(const std::string& vault, const JobQuery& query);

    /**
     * Poll the given jobs until one completes successfully, sleeping
     * policy.interval between polls for at most policy.max_attempts sleeps.
     */
    Result<remote::JobDescription> wait_until_complete(const std::string& vault,
                                                       const std::vector<std::string>& job_ids);

    /**
     * Completed job for the query, submitting or waiting as needed. Without
     * wait, pending and just-queued jobs produce a Retryable error.
     */
    Result<remote::JobDescription> ensure(const std::string& vault, const JobQuery& query, bool wait);

    [[nodiscard]] const PollPolicy& policy() const noexcept { return policy_; }

private:
    remote::ArchiveService& service_;
    PollPolicy policy_;
    Sleeper sleeper_;
    Clock clock_;
};

const char* to_string(JobState state);

} // namespace gcli::jobs
