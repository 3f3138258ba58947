#include "gcli/cli/app.hpp"

#include "gcli/remote/codec.hpp"
#include "gcli/transfer/engine.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace gcli::cli {
namespace fs = std::filesystem;

using remote::JobAction;
using remote::JobDescription;
using remote::JobStatus;

int exit_code(const Result<void>& result) {
    if (result.is_ok()) {
        return 0;
    }
    return result.error().kind == ErrorKind::Retryable ? kExitRetry : kExitFailure;
}

std::string format_error(const std::string& message) {
    std::istringstream lines(message);
    std::string line;
    std::string out;
    while (std::getline(lines, line)) {
        out += "glacier: " + line + "\n";
    }
    return out;
}

App::App(remote::ArchiveService& service,
         cache::ArchiveCache& cache,
         jobs::JobCoordinator& coordinator,
         std::ostream& out,
         Clock clock)
    : service_(service)
    , cache_(cache)
    , coordinator_(coordinator)
    , out_(out)
    , clock_(std::move(clock)) {}

Result<void> App::run(const Invocation& invocation) {
    switch (invocation.command) {
        case Command::VaultList: return vault_list();
        case Command::VaultCreate: return vault_create(invocation.name);
        case Command::VaultDelete: return vault_delete(invocation.name);
        case Command::VaultSync: return vault_sync(invocation.sync);
        case Command::ArchiveList: return archive_list(invocation.vault, invocation.force_ids);
        case Command::ArchiveUpload: return archive_upload(invocation.upload);
        case Command::ArchiveRetrieve: return archive_retrieve(invocation.retrieve);
        case Command::ArchiveDelete: return archive_delete(invocation.vault, invocation.name);
        case Command::ArchiveCheckPresent: return archive_checkpresent(invocation.checkpresent);
        case Command::JobList: return job_list();
        case Command::Help:
        case Command::ConfigWriteDefault:
            break;
    }
    return Err<void>(ErrorKind::Usage, "command is not handled by the application");
}

// ──────────────────────────────────────────────────────────
// Vaults
// ──────────────────────────────────────────────────────────

Result<void> App::vault_list() {
    auto vaults = service_.list_vaults();
    if (vaults.is_error()) {
        return Err<void>(vaults.error());
    }
    for (const auto& vault : vaults.value()) {
        out_ << vault.name << "\n";
    }
    return Ok();
}

Result<void> App::vault_create(const std::string& vault) {
    return service_.create_vault(vault);
}

Result<void> App::vault_delete(const std::string& vault) {
    auto vaults = service_.list_vaults();
    if (vaults.is_error()) {
        return Err<void>(vaults.error());
    }
    for (const auto& candidate : vaults.value()) {
        if (candidate.name == vault) {
            return service_.delete_vault(vault);
        }
    }
    return Err<void>(ErrorKind::NotFound, "Could not find vault " + vault);
}

Result<void> App::reconcile(const std::string& vault, const JobDescription& job, bool fix) {
    auto output = service_.get_job_output(vault, job.id, std::nullopt);
    if (output.is_error()) {
        return Err<void>(output.error());
    }
    auto inventory = remote::parse_inventory(output.value());
    if (inventory.is_error()) {
        return Err<void>(inventory.error());
    }

    const auto& snapshot = inventory.value();
    spdlog::debug("Reconciling inventory of {} dated {} ({} archives)",
                  vault, format_iso8601(snapshot.inventory_date), snapshot.archives.size());

    std::vector<std::string> seen_ids;
    seen_ids.reserve(snapshot.archives.size());
    for (const auto& entry : snapshot.archives) {
        cache::InventorySighting sighting;
        sighting.id = entry.archive_id;
        sighting.name = entry.description;
        sighting.size = entry.size;
        sighting.upstream_creation_date = entry.creation_date;
        sighting.upstream_inventory_date = snapshot.inventory_date;
        sighting.inventory_job_creation_date = job.creation_date;
        if (auto merged = cache_.merge_inventory_sighting(vault, sighting, fix); merged.is_error()) {
            return merged;
        }
        seen_ids.push_back(entry.archive_id);
    }

    if (auto finalized = cache_.finalize_inventory(vault, snapshot.inventory_date, seen_ids, fix);
        finalized.is_error()) {
        return finalized;
    }
    return cache_.commit();
}

Result<void> App::vault_sync(const SyncOptions& options) {
    auto job = coordinator_.ensure(options.vault,
                                   jobs::JobQuery::inventory(options.vault, options.max_age_hours),
                                   options.wait);
    if (job.is_error()) {
        return Err<void>(job.error());
    }
    return reconcile(options.vault, job.value(), options.fix);
}

// ──────────────────────────────────────────────────────────
// Archives
// ──────────────────────────────────────────────────────────

Result<void> App::archive_list(const std::string& vault, bool force_ids) {
    auto lines = force_ids ? cache_.list_with_ids(vault) : cache_.list_names(vault);
    if (lines.is_error()) {
        return Err<void>(lines.error());
    }
    for (const auto& line : lines.value()) {
        out_ << line << "\n";
    }
    return Ok();
}

Result<void> App::archive_upload(const UploadOptions& options) {
    std::string name;
    if (options.name) {
        name = *options.name;
    } else {
        name = options.file.filename().string();
        if (name.empty()) {
            return Err<void>(ErrorKind::Usage, "Archive name not specified. Use --name");
        }
    }

    std::ifstream file(options.file, std::ios::binary);
    if (!file) {
        return Err<void>(ErrorKind::DataError, "Failed to open " + options.file.string());
    }

    transfer::TransferEngine engine(service_, cache_, options.multipart_size);
    auto receipt = engine.upload(options.vault, name, file);
    if (receipt.is_error()) {
        return Err<void>(receipt.error());
    }
    spdlog::debug("Uploaded '{}' as {} ({} bytes, {} parts)",
                  name, receipt.value().archive_id, receipt.value().size, receipt.value().parts);
    return Ok();
}

Result<void> App::retrieve_one(const RetrieveOptions& options, const std::string& name) {
    auto archive_id = cache_.resolve(options.vault, name);
    if (archive_id.is_error()) {
        return Err<void>(archive_id.error());
    }

    auto job = coordinator_.ensure(options.vault,
                                   jobs::JobQuery::archive_retrieval(archive_id.value(), name),
                                   options.wait);
    if (job.is_error()) {
        return Err<void>(job.error());
    }

    transfer::TransferEngine engine(service_, cache_, options.multipart_size);
    if (options.output && *options.output == "-") {
        auto written = engine.download_to_stream(options.vault, job.value(), out_);
        if (written.is_error()) {
            return Err<void>(written.error());
        }
        return Ok();
    }

    const fs::path destination = options.output ? fs::path(*options.output) : fs::path(name).filename();
    auto written = engine.download_to_file(options.vault, job.value(), destination);
    if (written.is_error()) {
        return Err<void>(written.error());
    }
    return Ok();
}

Result<void> App::archive_retrieve(const RetrieveOptions& options) {
    if (options.names.size() > 1 && options.output) {
        return Err<void>(ErrorKind::Usage, "cannot specify output filename with multi-archive retrieval");
    }

    std::vector<std::string> successes;
    std::vector<std::string> retries;
    for (const auto& name : options.names) {
        auto retrieved = retrieve_one(options, name);
        if (retrieved.is_ok()) {
            successes.push_back("retrieved archive '" + name + "'");
        } else if (retrieved.error().kind == ErrorKind::Retryable) {
            retries.push_back(retrieved.error().message);
        } else {
            return retrieved;
        }
    }

    if (retries.empty()) {
        return Ok();
    }
    std::string message;
    for (const auto* list : {&successes, &retries}) {
        for (const auto& line : *list) {
            message += message.empty() ? line : "\n" + line;
        }
    }
    return Err<void>(ErrorKind::Retryable, message);
}

Result<void> App::archive_delete(const std::string& vault, const std::string& name) {
    auto archive_id = cache_.resolve(vault, name);
    if (archive_id.is_error()) {
        return Err<void>(archive_id.error());
    }
    if (auto deleted = service_.delete_archive(vault, archive_id.value()); deleted.is_error()) {
        return deleted;
    }
    return cache_.delete_record(vault, "id:" + archive_id.value());
}

Result<void> App::archive_checkpresent(const CheckPresentOptions& options) {
    const auto absent = [&](const std::string& message) {
        return Err<void>(ErrorKind::NotFound, options.quiet ? std::string() : message);
    };
    const auto too_old = [&](const std::optional<Timestamp>& seen) {
        return !seen || *seen == 0 || options.max_age_hours <= 0 ||
               *seen < clock_() - static_cast<Timestamp>(options.max_age_hours) * 60 * 60;
    };
    const std::string quoted = "archive '" + options.name + "'";

    std::optional<Timestamp> last_seen;
    auto cached = cache_.last_seen(options.vault, options.name);
    if (cached.is_ok()) {
        last_seen = cached.value();
    } else if (cached.error().kind != ErrorKind::NotFound) {
        return Err<void>(cached.error());
    } else if (!options.wait) {
        return absent(quoted + " not found");
    }

    if (too_old(last_seen)) {
        SyncOptions sync;
        sync.vault = options.vault;
        sync.max_age_hours = options.max_age_hours;
        sync.wait = options.wait;

        auto synced = vault_sync(sync);
        if (synced.is_error() && synced.error().kind != ErrorKind::Retryable) {
            return synced;
        }
        if (synced.is_error()) {
            spdlog::debug("Inventory not available yet: {}", synced.error().message);
        } else {
            auto refreshed = cache_.last_seen(options.vault, options.name);
            if (refreshed.is_error()) {
                if (refreshed.error().kind != ErrorKind::NotFound) {
                    return Err<void>(refreshed.error());
                }
                return absent(quoted + " not found, but it may not be in the inventory yet");
            }
            last_seen = refreshed.value();
        }
    }

    if (!last_seen) {
        return absent(quoted + " not found, but it may not be in the inventory yet");
    }
    if (too_old(last_seen)) {
        return absent(quoted + " found, but has not been seen recently enough to consider it present");
    }

    out_ << options.name << "\n";
    return Ok();
}

// ──────────────────────────────────────────────────────────
// Jobs
// ──────────────────────────────────────────────────────────

std::string App::job_oneline(const std::string& vault, const JobDescription& job) const {
    const char action = job.action == JobAction::ArchiveRetrieval ? 'a' : 'i';
    char status = 'p';
    if (job.status == JobStatus::Succeeded) {
        status = 'd';
    } else if (job.status == JobStatus::Failed) {
        status = 'e';
    }
    const Timestamp date = job.completion_date ? *job.completion_date : job.creation_date;

    std::string name;
    if (job.action == JobAction::ArchiveRetrieval) {
        auto cached = cache_.name_of(vault, "id:" + job.archive_id);
        if (cached.is_ok() && cached.value()) {
            name = *cached.value();
        } else {
            name = "id:" + job.archive_id;
        }
    }
    return fmt::format("{}/{} {} {:<10} {}", action, status, format_iso8601(date), vault, name);
}

Result<void> App::job_list() {
    auto vaults = service_.list_vaults();
    if (vaults.is_error()) {
        return Err<void>(vaults.error());
    }
    for (const auto& vault : vaults.value()) {
        auto jobs = service_.list_jobs(vault.name);
        if (jobs.is_error()) {
            return Err<void>(jobs.error());
        }
        for (const auto& job : jobs.value()) {
            out_ << job_oneline(vault.name, job) << "\n";
        }
    }
    return Ok();
}

} // namespace gcli::cli
