#include "gcli/jobs/coordinator.hpp"

#include "support/fake_archive_service.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace gcli;
using gcli::jobs::JobCoordinator;
using gcli::jobs::JobQuery;
using gcli::jobs::JobState;
using gcli::jobs::PollPolicy;
using gcli::remote::JobAction;
using gcli::remote::JobDescription;
using gcli::remote::JobStatus;
using gcli::testing::FakeArchiveService;

namespace {

JobDescription make_job(const std::string& id, JobStatus status, std::optional<Timestamp> completed_at = std::nullopt) {
    JobDescription job;
    job.id = id;
    job.action = JobAction::ArchiveRetrieval;
    job.archive_id = "A";
    job.status = status;
    job.completed = status != JobStatus::InProgress;
    job.completion_date = completed_at;
    job.status_message = status == JobStatus::Failed ? "Archive was lost" : "";
    return job;
}

JobDescription inventory_job(const std::string& id, std::optional<Timestamp> completed_at) {
    JobDescription job;
    job.id = id;
    job.action = JobAction::InventoryRetrieval;
    job.completed = completed_at.has_value();
    job.status = job.completed ? JobStatus::Succeeded : JobStatus::InProgress;
    job.completion_date = completed_at;
    return job;
}

struct CountingSleeper {
    int sleeps = 0;
    std::chrono::seconds last{0};
    std::function<void(int)> on_sleep;

    jobs::Sleeper bind() {
        return [this](std::chrono::seconds duration) {
            ++sleeps;
            last = duration;
            if (on_sleep) {
                on_sleep(sleeps);
            }
        };
    }
};

} // namespace

TEST(JobCoordinatorTest, SelectPrefersLatestSuccess) {
    auto lookup = JobCoordinator::select({
        make_job("old", JobStatus::Succeeded, 100),
        make_job("pending", JobStatus::InProgress),
        make_job("new", JobStatus::Succeeded, 200),
        make_job("failed", JobStatus::Failed, 300),
    });
    EXPECT_EQ(lookup.state, JobState::Completed);
    ASSERT_TRUE(lookup.job.has_value());
    EXPECT_EQ(lookup.job->id, "new");
    EXPECT_EQ(lookup.matching.size(), 4u);
}

TEST(JobCoordinatorTest, SelectPendingBeatsFailure) {
    auto lookup = JobCoordinator::select({
        make_job("failed", JobStatus::Failed, 300),
        make_job("pending", JobStatus::InProgress),
    });
    EXPECT_EQ(lookup.state, JobState::Pending);
}

TEST(JobCoordinatorTest, SelectFailedAndEmpty) {
    auto failed = JobCoordinator::select({make_job("failed", JobStatus::Failed, 300)});
    EXPECT_EQ(failed.state, JobState::Failed);
    ASSERT_TRUE(failed.job.has_value());
    EXPECT_EQ(failed.job->status_message, "Archive was lost");

    EXPECT_EQ(JobCoordinator::select({}).state, JobState::NoJob);
}

TEST(JobCoordinatorTest, InventoryQueryHonoursMaxAge) {
    const Timestamp now = 1'000'000;
    const auto query = JobQuery::inventory("vault", 24);

    EXPECT_TRUE(query.matches(inventory_job("pending", std::nullopt), now));
    EXPECT_TRUE(query.matches(inventory_job("fresh", now - 23 * 3600), now));
    EXPECT_FALSE(query.matches(inventory_job("stale", now - 25 * 3600), now));
    EXPECT_FALSE(query.matches(make_job("retrieval", JobStatus::Succeeded, now), now));

    const auto pending_only = JobQuery::inventory("vault", 0);
    EXPECT_FALSE(pending_only.matches(inventory_job("fresh", now - 60), now));
    EXPECT_TRUE(pending_only.matches(inventory_job("pending", std::nullopt), now));
}

TEST(JobCoordinatorTest, RetrievalQueryMatchesArchiveId) {
    const auto query = JobQuery::archive_retrieval("A", "photos");
    EXPECT_EQ(query.subject, "archive 'photos'");
    EXPECT_TRUE(query.matches(make_job("j", JobStatus::InProgress), 0));

    auto other = make_job("k", JobStatus::InProgress);
    other.archive_id = "B";
    EXPECT_FALSE(query.matches(other, 0));
}

TEST(JobCoordinatorTest, NoJobWithoutWaitQueuesAndSignalsRetry) {
    FakeArchiveService service;
    CountingSleeper sleeper;
    JobCoordinator coordinator(service, PollPolicy{}, sleeper.bind(), [&] { return service.now; });

    auto result = coordinator.ensure("vault", JobQuery::archive_retrieval("A", "photos"), false);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Retryable);
    EXPECT_EQ(result.error().message, "queued retrieval job for archive 'photos'");
    EXPECT_EQ(service.count("initiate_archive_retrieval"), 1u);
    EXPECT_EQ(sleeper.sleeps, 0);
}

TEST(JobCoordinatorTest, PendingWithoutWaitDoesNotResubmit) {
    FakeArchiveService service;
    service.add_job("vault", make_job("running", JobStatus::InProgress));
    JobCoordinator coordinator(service, PollPolicy{}, [](std::chrono::seconds) {}, [&] { return service.now; });

    auto result = coordinator.ensure("vault", JobQuery::archive_retrieval("A", "photos"), false);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Retryable);
    EXPECT_EQ(result.error().message, "job still pending for archive 'photos'");
    EXPECT_EQ(service.count("initiate_archive_retrieval"), 0u);
}

TEST(JobCoordinatorTest, InventoryQueuedMessage) {
    FakeArchiveService service;
    JobCoordinator coordinator(service, PollPolicy{}, [](std::chrono::seconds) {}, [&] { return service.now; });

    auto result = coordinator.ensure("vault", JobQuery::inventory("vault", 24), false);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().message, "queued inventory job for inventory on 'vault'");
    EXPECT_EQ(service.count("initiate_inventory_retrieval"), 1u);
}

TEST(JobCoordinatorTest, CompletedJobReturnedImmediately) {
    FakeArchiveService service;
    service.add_job("vault", make_job("done", JobStatus::Succeeded, service.now - 60));
    CountingSleeper sleeper;
    JobCoordinator coordinator(service, PollPolicy{}, sleeper.bind(), [&] { return service.now; });

    auto result = coordinator.ensure("vault", JobQuery::archive_retrieval("A", "photos"), true);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().id, "done");
    EXPECT_EQ(sleeper.sleeps, 0);
    EXPECT_EQ(service.count("describe_job"), 0u);
}

TEST(JobCoordinatorTest, WaitPollsUntilComplete) {
    FakeArchiveService service;
    service.add_job("vault", make_job("running", JobStatus::InProgress));

    CountingSleeper sleeper;
    sleeper.on_sleep = [&](int count) {
        if (count == 3) {
            service.complete_job("running");
        }
    };
    PollPolicy policy;
    policy.interval = std::chrono::seconds(7);
    policy.max_attempts = 10;
    JobCoordinator coordinator(service, policy, sleeper.bind(), [&] { return service.now; });

    auto result = coordinator.ensure("vault", JobQuery::archive_retrieval("A", "photos"), true);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(result.value().id, "running");
    EXPECT_EQ(sleeper.sleeps, 3);
    EXPECT_EQ(sleeper.last, std::chrono::seconds(7));
}

TEST(JobCoordinatorTest, WaitTimesOutAfterMaxAttempts) {
    FakeArchiveService service;
    service.add_job("vault", make_job("stuck", JobStatus::InProgress));

    CountingSleeper sleeper;
    PollPolicy policy;
    policy.interval = std::chrono::seconds(600);
    policy.max_attempts = 4;
    JobCoordinator coordinator(service, policy, sleeper.bind(), [&] { return service.now; });

    auto result = coordinator.wait_until_complete("vault", {"stuck"});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Timeout);
    EXPECT_EQ(result.error().message, "Timed out waiting for job completion (4 attempts, 600 seconds apart)");
    EXPECT_EQ(sleeper.sleeps, 4);
    EXPECT_EQ(service.count("describe_job"), 5u);
}

TEST(JobCoordinatorTest, FailureWhileWaitingIsReported) {
    FakeArchiveService service;
    service.add_job("vault", make_job("running", JobStatus::InProgress));

    CountingSleeper sleeper;
    sleeper.on_sleep = [&](int) { service.complete_job("running", false); };
    JobCoordinator coordinator(service, PollPolicy{}, sleeper.bind(), [&] { return service.now; });

    auto result = coordinator.wait_until_complete("vault", {"running"});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Remote);
    EXPECT_EQ(result.error().message, "Job failed: Failed");
}

TEST(JobCoordinatorTest, FailedJobIsResubmitted) {
    FakeArchiveService service;
    service.add_job("vault", make_job("failed", JobStatus::Failed, service.now - 60));
    JobCoordinator coordinator(service, PollPolicy{}, [](std::chrono::seconds) {}, [&] { return service.now; });

    auto result = coordinator.ensure("vault", JobQuery::archive_retrieval("A", "photos"), false);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Retryable);
    EXPECT_EQ(service.count("initiate_archive_retrieval"), 1u);
}

TEST(JobCoordinatorTest, StaleInventoryTriggersNewJob) {
    FakeArchiveService service;
    service.add_job("vault", inventory_job("old", service.now - 48 * 3600));
    JobCoordinator coordinator(service, PollPolicy{}, [](std::chrono::seconds) {}, [&] { return service.now; });

    auto stale = coordinator.lookup("vault", JobQuery::inventory("vault", 24));
    ASSERT_TRUE(stale.is_ok());
    EXPECT_EQ(stale.value().state, JobState::NoJob);

    auto fresh_enough = coordinator.lookup("vault", JobQuery::inventory("vault", 72));
    ASSERT_TRUE(fresh_enough.is_ok());
    EXPECT_EQ(fresh_enough.value().state, JobState::Completed);
}
