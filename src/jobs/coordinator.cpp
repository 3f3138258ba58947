#include "gcli/jobs/coordinator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace gcli::jobs {

using remote::JobAction;
using remote::JobDescription;
using remote::JobStatus;

JobQuery JobQuery::archive_retrieval(std::string archive_id, const std::string& display_name) {
    JobQuery query;
    query.action = JobAction::ArchiveRetrieval;
    query.archive_id = std::move(archive_id);
    query.subject = "archive '" + display_name + "'";
    return query;
}

JobQuery JobQuery::inventory(const std::string& vault, int max_age_hours) {
    JobQuery query;
    query.action = JobAction::InventoryRetrieval;
    query.max_age_hours = max_age_hours;
    query.subject = "inventory on '" + vault + "'";
    return query;
}

bool JobQuery::matches(const JobDescription& job, Timestamp now) const {
    if (job.action != action) {
        return false;
    }
    if (action == JobAction::ArchiveRetrieval) {
        return job.archive_id == archive_id;
    }

    if (!job.completed) {
        return true;
    }
    if (max_age_hours <= 0 || !job.completion_date) {
        return false;
    }
    return *job.completion_date > now - static_cast<Timestamp>(max_age_hours) * 60 * 60;
}

JobCoordinator::JobCoordinator(remote::ArchiveService& service, PollPolicy policy, Sleeper sleeper, Clock clock)
    : service_(service),
      policy_(policy),
      sleeper_(std::move(sleeper)),
      clock_(std::move(clock)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::seconds duration) { std::this_thread::sleep_for(duration); };
    }
    if (!clock_) {
        clock_ = system_now;
    }
}

JobLookup JobCoordinator::select(std::vector<JobDescription> matching) {
    JobLookup lookup;
    lookup.matching = std::move(matching);

    auto completion_key = [](const JobDescription& job) { return job.completion_date.value_or(0); };

    std::optional<JobDescription> best_success;
    std::optional<JobDescription> latest_failure;
    bool any_pending = false;

    for (const auto& job : lookup.matching) {
        if (!job.completed) {
            any_pending = true;
            continue;
        }
        if (job.status == JobStatus::Succeeded) {
            if (!best_success || completion_key(job) > completion_key(*best_success)) {
                best_success = job;
            }
        } else if (!latest_failure || completion_key(job) > completion_key(*latest_failure)) {
            latest_failure = job;
        }
    }

    if (best_success) {
        lookup.state = JobState::Completed;
        lookup.job = std::move(best_success);
    } else if (any_pending) {
        lookup.state = JobState::Pending;
    } else if (latest_failure) {
        lookup.state = JobState::Failed;
        lookup.job = std::move(latest_failure);
    } else {
        lookup.state = JobState::NoJob;
    }
    return lookup;
}

Result<JobLookup> JobCoordinator::lookup(const std::string& vault, const JobQuery& query) {
    auto jobs = service_.list_jobs(vault);
    if (jobs.is_error()) {
        return Err<JobLookup>(jobs.error());
    }

    const Timestamp now = clock_();
    std::vector<JobDescription> matching;
    for (auto& job : jobs.value()) {
        if (query.matches(job, now)) {
            matching.push_back(std::move(job));
        }
    }

    auto result = select(std::move(matching));
    spdlog::debug("{}: {} matching job(s), state {}", query.subject, result.matching.size(), to_string(result.state));
    return Ok(std::move(result));
}

Result<std::string> JobCoordinator::submit(const std::string& vault, const JobQuery& query) {
    if (query.action == JobAction::ArchiveRetrieval) {
        return service_.initiate_archive_retrieval(vault, query.archive_id);
    }
    return service_.initiate_inventory_retrieval(vault);
}

Result<JobDescription> JobCoordinator::wait_until_complete(const std::string& vault,
                                                           const std::vector<std::string>& job_ids) {
    auto poll = [&]() -> Result<JobLookup> {
        std::vector<JobDescription> refreshed;
        refreshed.reserve(job_ids.size());
        for (const auto& id : job_ids) {
            auto job = service_.describe_job(vault, id);
            if (job.is_error()) {
                return Err<JobLookup>(job.error());
            }
            refreshed.push_back(std::move(job.value()));
        }
        return Ok(select(std::move(refreshed)));
    };

    int attempt = 0;
    while (true) {
        auto current = poll();
        if (current.is_error()) {
            return Err<JobDescription>(current.error());
        }

        auto& lookup = current.value();
        if (lookup.state == JobState::Completed) {
            return Ok(std::move(*lookup.job));
        }
        if (lookup.state == JobState::Failed || lookup.state == JobState::NoJob) {
            const std::string detail = lookup.job ? lookup.job->status_message : std::string("no job to wait for");
            return Err<JobDescription>(ErrorKind::Remote, "Job failed: " + detail);
        }

        if (attempt >= policy_.max_attempts) {
            return Err<JobDescription>(ErrorKind::Timeout,
                                       "Timed out waiting for job completion (" +
                                       std::to_string(policy_.max_attempts) + " attempts, " +
                                       std::to_string(policy_.interval.count()) + " seconds apart)");
        }
        ++attempt;
        spdlog::debug("Job not completed, sleeping for {} seconds (Wait {} of {})",
                      policy_.interval.count(), attempt, policy_.max_attempts);
        sleeper_(policy_.interval);
    }
}

Result<JobDescription> JobCoordinator::ensure(const std::string& vault, const JobQuery& query, bool wait) {
    auto found = lookup(vault, query);
    if (found.is_error()) {
        return Err<JobDescription>(found.error());
    }

    auto& state = found.value();
    switch (state.state) {
        case JobState::Completed:
            return Ok(std::move(*state.job));

        case JobState::Pending: {
            if (!wait) {
                return Err<JobDescription>(ErrorKind::Retryable, "job still pending for " + query.subject);
            }
            std::vector<std::string> ids;
            for (const auto& job : state.matching) {
                if (!job.completed) {
                    ids.push_back(job.id);
                }
            }
            return wait_until_complete(vault, ids);
        }

        case JobState::Failed:
            spdlog::warn("previous job for {} failed ({}); submitting a new one",
                         query.subject, state.job ? state.job->status_message : std::string());
            [[fallthrough]];

        case JobState::NoJob: {
            auto job_id = submit(vault, query);
            if (job_id.is_error()) {
                return Err<JobDescription>(job_id.error());
            }
            spdlog::debug("Submitted job {} for {}", job_id.value(), query.subject);
            if (!wait) {
                const char* kind = query.action == JobAction::ArchiveRetrieval ? "retrieval" : "inventory";
                return Err<JobDescription>(ErrorKind::Retryable,
                                           std::string("queued ") + kind + " job for " + query.subject);
            }
            return wait_until_complete(vault, {job_id.value()});
        }
    }

    return Err<JobDescription>(ErrorKind::DataError, "Unknown job state");
}

const char* to_string(JobState state) {
    switch (state) {
        case JobState::NoJob: return "NoJob";
        case JobState::Pending: return "Pending";
        case JobState::Completed: return "Completed";
        case JobState::Failed: return "Failed";
    }
    return "Unknown";
}

} // namespace gcli::jobs
