#pragma once

#include "gcli/cache/archive_cache.hpp"
#include "gcli/cli/command_line.hpp"
#include "gcli/core/result.hpp"
#include "gcli/jobs/coordinator.hpp"
#include "gcli/remote/archive_service.hpp"

#include <ostream>
#include <string>

namespace gcli::cli {

/// Exit status for the user interrupt (SIGINT).
inline constexpr int kExitInterrupted = 130;
/// EX_TEMPFAIL from sysexits.h: temporary failure, retry later.
inline constexpr int kExitRetry = 75;
inline constexpr int kExitFailure = 1;

int exit_code(const Result<void>& result);

/// Prefix every line of message with "glacier: ".
std::string format_error(const std::string& message);

/**
 * @brief The user-level operations of the command line tool
 *
 * Each command talks to the archive service and the cache it is given and
 * writes its regular output to out. Diagnostics go through spdlog; failures
 * and retry signals are returned for the caller to report.
 */
class App {
public:
    App(remote::ArchiveService& service,
        cache::ArchiveCache& cache,
        jobs::JobCoordinator& coordinator,
        std::ostream& out,
        Clock clock = system_now);

    /// Dispatch a parsed invocation (config and help are handled by main).
    Result<void> run(const Invocation& invocation);

    Result<void> vault_list();
    Result<void> vault_create(const std::string& vault);
    Result<void> vault_delete(const std::string& vault);

    /**
     * @brief Bring the cache up to date with the vault's inventory
     *
     * Reuses an inventory job completed within max_age_hours, otherwise waits
     * for or submits one. Pending and just-queued jobs are Retryable unless
     * wait is set.
     */
    Result<void> vault_sync(const SyncOptions& options);

    Result<void> archive_list(const std::string& vault, bool force_ids);
    Result<void> archive_upload(const UploadOptions& options);

    /**
     * @brief Retrieve one or more archives
     *
     * Names are processed in order. A hard failure stops the command; retry
     * signals are collected and reported together with the names already
     * retrieved, as one Retryable error.
     */
    Result<void> archive_retrieve(const RetrieveOptions& options);

    Result<void> archive_delete(const std::string& vault, const std::string& name);

    /**
     * @brief Print name if the archive was seen recently enough
     *
     * A stale or missing sighting triggers an inventory sync (a Retryable
     * sync is ignored) and a second look. An archive still not known to be
     * present yields NotFound, whose message is empty when quiet.
     */
    Result<void> archive_checkpresent(const CheckPresentOptions& options);

    /// One line per job across all vaults.
    Result<void> job_list();

    /// "<a|i>/<p|d|e> <date> <vault padded to 10> <name>"
    std::string job_oneline(const std::string& vault, const remote::JobDescription& job) const;

private:
    Result<void> reconcile(const std::string& vault, const remote::JobDescription& job, bool fix);
    Result<void> retrieve_one(const RetrieveOptions& options, const std::string& name);

    remote::ArchiveService& service_;
    cache::ArchiveCache& cache_;
    jobs::JobCoordinator& coordinator_;
    std::ostream& out_;
    Clock clock_;
};

} // namespace gcli::cli
