#pragma once

/**
 * @file archive_cache.hpp
 * @brief Persistent record of archive identity, name and existence
 *
 * The archive service offers no stable names and only a lagging inventory.
 * This cache is the client's memory across invocations: uploads and deletes
 * are recorded as they happen, and retrieved inventories are merged in with
 * the lag-tolerant rule documented on merge_inventory_sighting().
 *
 * STORAGE:
 * One SQLite file, table "archive", rows keyed by (account_key, vault, id).
 * The account key is supplied by the caller; the cache never looks up
 * credentials itself.
 *
 * TRANSACTIONS:
 * Mutations run inside an explicit transaction that becomes durable only on
 * commit(). record_upload() and delete_record() commit on their own. An
 * inventory merge (all merge_inventory_sighting() calls followed by
 * finalize_inventory()) must be followed by one commit(); if the process dies
 * or the cache is destroyed first, the whole merge is rolled back.
 *
 * EXAMPLE:
 * auto cache = ArchiveCache::open(access_key, "/home/me/.cache/glacier-cli/db");
 * cache.value()->record_upload("photos", "2012.tar", archive_id, size);
 * auto id = cache.value()->resolve("photos", "2012.tar");
 */

#include "gcli/cache/types.hpp"
#include "gcli/core/result.hpp"
#include "gcli/core/time.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace gcli::cache {

class ArchiveCache {
public:
    /**
     * Open (creating if needed) the store at db_path. ":memory:" opens a
     * private in-memory store.
     */
    static Result<std::unique_ptr<ArchiveCache>> open(std::string account_key,
                                                      const std::filesystem::path& db_path,
                                                      Clock clock = system_now);

    ~ArchiveCache();

    ArchiveCache(const ArchiveCache&) = delete;
    ArchiveCache& operator=(const ArchiveCache&) = delete;

    /**
     * Insert a live record with created_here = now. Names are not unique, so
     * no check against existing names is made.
     */
    Result<void> record_upload(const std::string& vault,
                               const std::string& name,
                               const std::string& id,
                               std::uint64_t size);

    /**
     * Resolve a reference to the id of exactly one live record. No match and
     * several matches both fail with NotFound.
     */
    Result<std::string> resolve(const std::string& vault, const std::string& ref) const;

    Result<std::optional<std::string>> name_of(const std::string& vault, const std::string& ref) const;

    /// last_seen_upstream if known, else created_here.
    Result<Timestamp> last_seen(const std::string& vault, const std::string& ref) const;

    /**
     * One line per live archive, each independently resolvable: a bare name
     * when the name is unique, "id:<x>\t<name>" for every holder of a shared
     * name, "id:<x>" for unnamed archives. Sorted by name, then id.
     */
    Result<std::vector<std::string>> list_names(const std::string& vault) const;

    /// Every live archive as "id:<x>\t<name>".
    Result<std::vector<std::string>> list_with_ids(const std::string& vault) const;

    /// Tombstone the single live match of ref (deleted_here = now).
    Result<void> delete_record(const std::string& vault, const std::string& ref);

    /**
     * Merge one archive entry of a freshly retrieved inventory.
     *
     * The sighting proves existence no later than
     * max(upstream_inventory_date, inventory_job_creation_date - kInventoryLag);
     * last_seen_upstream advances to that value and never moves back.
     * Missing name/size are filled in; conflicting ones are logged and only
     * overwritten when fix is set. Sightings of tombstoned records are logged.
     */
    Result<void> merge_inventory_sighting(const std::string& vault,
                                          const InventorySighting& sighting,
                                          bool fix);

    /**
     * Reconcile records the inventory did not mention: confirmed deletions
     * are purged, archives that should have appeared are reported as
     * disappeared (purged when fix is set), recent uploads are left alone.
     */
    Result<void> finalize_inventory(const std::string& vault,
                                    Timestamp inventory_date,
                                    const std::vector<std::string>& seen_ids,
                                    bool fix);

    /// Make the current transaction durable.
    Result<void> commit();

    /// All records of a vault, tombstones included, ordered by id.
    Result<std::vector<ArchiveRecord>> records(const std::string& vault) const;

    [[nodiscard]] const std::string& account_key() const noexcept { return account_key_; }

private:
    ArchiveCache(sqlite3* db, std::string account_key, Clock clock);

    Result<void> exec(const char* sql);
    Result<void> ensure_schema();
    Result<void> begin_if_needed();

    Result<std::vector<ArchiveRecord>> query_live(const std::string& vault, const ArchiveRef& ref) const;
    Result<ArchiveRecord> find_single_live(const std::string& vault, const std::string& ref) const;
    Result<std::optional<ArchiveRecord>> find_by_id(const std::string& vault, const std::string& id) const;
    Result<std::vector<ArchiveRecord>> query_vault(const std::string& vault, bool live_only, const char* order_by) const;

    Result<void> update_record(const ArchiveRecord& record);
    Result<void> insert_record(const ArchiveRecord& record);
    Result<void> purge_record(const std::string& vault, const std::string& id);

    sqlite3* db_;
    std::string account_key_;
    Clock clock_;
    bool in_transaction_ = false;
};

/**
 * Reference that resolves back to this record: the name, "name:<name>" when
 * the name itself looks like a reference, or "id:<x>".
 */
std::string archive_ref(const ArchiveRecord& record, bool force_id = false);

} // namespace gcli::cache
