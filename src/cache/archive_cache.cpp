#include "gcli/cache/archive_cache.hpp"

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <algorithm>
#include <system_error>
#include <unordered_set>

namespace gcli::cache {
namespace fs = std::filesystem;
namespace {

constexpr const char* kSelectColumns =
    "SELECT id, name, size, vault, account_key, last_seen_upstream, created_here, deleted_here FROM archive ";

// Prepared statement that finalizes itself
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }

    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
    std::string error() const { return sqlite3_errmsg(db_); }

    void bind(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bind(int index, const std::optional<std::string>& value) {
        if (value) {
            bind(index, *value);
        } else {
            sqlite3_bind_null(stmt_, index);
        }
    }

    void bind(int index, std::int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
    }

    void bind(int index, const std::optional<std::int64_t>& value) {
        if (value) {
            bind(index, *value);
        } else {
            sqlite3_bind_null(stmt_, index);
        }
    }

    int step() { return sqlite3_step(stmt_); }

    std::optional<std::string> column_text(int column) const {
        if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
            return std::nullopt;
        }
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
        return std::string(text ? text : "");
    }

    std::optional<std::int64_t> column_int(int column) const {
        if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
            return std::nullopt;
        }
        return sqlite3_column_int64(stmt_, column);
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_ERROR;
};

std::optional<std::int64_t> to_column(const std::optional<std::uint64_t>& size) {
    if (!size) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(*size);
}

ArchiveRecord read_record(const Statement& stmt) {
    ArchiveRecord record;
    record.id = stmt.column_text(0).value_or("");
    record.name = stmt.column_text(1);
    if (auto size = stmt.column_int(2)) {
        record.size = static_cast<std::uint64_t>(*size);
    }
    record.vault = stmt.column_text(3).value_or("");
    record.account_key = stmt.column_text(4).value_or("");
    record.last_seen_upstream = stmt.column_int(5);
    record.created_here = stmt.column_int(6);
    record.deleted_here = stmt.column_int(7);
    return record;
}

Result<std::vector<ArchiveRecord>> collect(Statement& stmt) {
    std::vector<ArchiveRecord> records;
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        records.push_back(read_record(stmt));
    }
    if (rc != SQLITE_DONE) {
        return Err<std::vector<ArchiveRecord>>(ErrorKind::DataError, "Cache query failed: " + stmt.error());
    }
    return Ok(std::move(records));
}

std::string with_ids_line(const ArchiveRecord& record) {
    return archive_ref(record, true) + "\t" + record.name.value_or("");
}

} // namespace

ArchiveRef ArchiveRef::parse(const std::string& ref) {
    if (ref.rfind("id:", 0) == 0) {
        return ArchiveRef{Field::Id, ref.substr(3)};
    }
    if (ref.rfind("name:", 0) == 0) {
        return ArchiveRef{Field::Name, ref.substr(5)};
    }
    return ArchiveRef{Field::Name, ref};
}

std::string archive_ref(const ArchiveRecord& record, bool force_id) {
    if (record.has_name() && !force_id) {
        const auto& name = *record.name;
        if (name.rfind("name:", 0) == 0 || name.rfind("id:", 0) == 0) {
            return "name:" + name;
        }
        return name;
    }
    return "id:" + record.id;
}

ArchiveCache::ArchiveCache(sqlite3* db, std::string account_key, Clock clock)
    : db_(db), account_key_(std::move(account_key)), clock_(std::move(clock)) {}

ArchiveCache::~ArchiveCache() {
    if (in_transaction_) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        spdlog::debug("Cache closed with uncommitted changes; rolled back");
    }
    sqlite3_close(db_);
}

Result<std::unique_ptr<ArchiveCache>> ArchiveCache::open(std::string account_key,
                                                         const fs::path& db_path,
                                                         Clock clock) {
    using CachePtr = std::unique_ptr<ArchiveCache>;

    if (account_key.empty()) {
        return Err<CachePtr>(ErrorKind::Usage, "Cache requires a non-empty account key");
    }

    if (db_path.string() != ":memory:" && db_path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(db_path.parent_path(), ec);
        if (ec && !fs::exists(db_path.parent_path())) {
            return Err<CachePtr>(ErrorKind::DataError,
                                 "Failed to create cache directory: " + db_path.parent_path().string());
        }
    }

    sqlite3* db = nullptr;
    if (sqlite3_open(db_path.string().c_str(), &db) != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        return Err<CachePtr>(ErrorKind::DataError, "Failed to open cache " + db_path.string() + ": " + message);
    }

    CachePtr cache(new ArchiveCache(db, std::move(account_key), clock ? std::move(clock) : Clock(system_now)));
    if (auto res = cache->ensure_schema(); res.is_error()) {
        return Err<CachePtr>(res.error());
    }

    spdlog::debug("Opened archive cache {}", db_path.string());
    return Ok(std::move(cache));
}

Result<void> ArchiveCache::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "sqlite error";
        sqlite3_free(err);
        return Err<void>(ErrorKind::DataError, "Cache error: " + message);
    }
    return Ok();
}

Result<void> ArchiveCache::ensure_schema() {
    return exec(
        "CREATE TABLE IF NOT EXISTS archive ("
        "  id TEXT NOT NULL,"
        "  name TEXT,"
        "  size INTEGER,"
        "  vault TEXT NOT NULL,"
        "  account_key TEXT NOT NULL,"
        "  last_seen_upstream INTEGER,"
        "  created_here INTEGER,"
        "  deleted_here INTEGER,"
        "  PRIMARY KEY (account_key, vault, id)"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_archive_name ON archive(account_key, vault, name);");
}

Result<void> ArchiveCache::begin_if_needed() {
    if (in_transaction_) {
        return Ok();
    }
    if (auto res = exec("BEGIN;"); res.is_error()) {
        return res;
    }
    in_transaction_ = true;
    return Ok();
}

Result<void> ArchiveCache::commit() {
    if (!in_transaction_) {
        return Ok();
    }
    if (auto res = exec("COMMIT;"); res.is_error()) {
        return res;
    }
    in_transaction_ = false;
    return Ok();
}

Result<void> ArchiveCache::record_upload(const std::string& vault,
                                         const std::string& name,
                                         const std::string& id,
                                         std::uint64_t size) {
    if (auto res = begin_if_needed(); res.is_error()) {
        return res;
    }

    ArchiveRecord record;
    record.id = id;
    if (!name.empty()) {
        record.name = name;
    }
    record.size = size;
    record.vault = vault;
    record.account_key = account_key_;
    record.created_here = clock_();

    if (auto res = insert_record(record); res.is_error()) {
        return res;
    }
    return commit();
}

Result<std::vector<ArchiveRecord>> ArchiveCache::query_live(const std::string& vault, const ArchiveRef& ref) const {
    const std::string sql = std::string(kSelectColumns) +
        (ref.field == ArchiveRef::Field::Id
             ? "WHERE account_key = ?1 AND vault = ?2 AND deleted_here IS NULL AND id = ?3 ORDER BY id"
             : "WHERE account_key = ?1 AND vault = ?2 AND deleted_here IS NULL AND name = ?3 ORDER BY id");

    Statement stmt(db_, sql.c_str());
    if (!stmt.ok()) {
        return Err<std::vector<ArchiveRecord>>(ErrorKind::DataError, "Cache query failed: " + stmt.error());
    }
    stmt.bind(1, account_key_);
    stmt.bind(2, vault);
    stmt.bind(3, ref.value);
    return collect(stmt);
}

Result<ArchiveRecord> ArchiveCache::find_single_live(const std::string& vault, const std::string& ref) const {
    auto matches = query_live(vault, ArchiveRef::parse(ref));
    if (matches.is_error()) {
        return Err<ArchiveRecord>(matches.error());
    }

    auto& records = matches.value();
    if (records.empty()) {
        return Err<ArchiveRecord>(ErrorKind::NotFound, "archive '" + ref + "' not found");
    }
    if (records.size() > 1) {
        return Err<ArchiveRecord>(ErrorKind::NotFound,
                                  "archive '" + ref + "' is ambiguous (" + std::to_string(records.size()) +
                                  " archives share this name; use id:<archive id>)");
    }
    return Ok(std::move(records.front()));
}

Result<std::optional<ArchiveRecord>> ArchiveCache::find_by_id(const std::string& vault, const std::string& id) const {
    const std::string sql = std::string(kSelectColumns) + "WHERE account_key = ?1 AND vault = ?2 AND id = ?3";
    Statement stmt(db_, sql.c_str());
    if (!stmt.ok()) {
        return Err<std::optional<ArchiveRecord>>(ErrorKind::DataError, "Cache query failed: " + stmt.error());
    }
    stmt.bind(1, account_key_);
    stmt.bind(2, vault);
    stmt.bind(3, id);

    auto rows = collect(stmt);
    if (rows.is_error()) {
        return Err<std::optional<ArchiveRecord>>(rows.error());
    }
    if (rows.value().empty()) {
        return Ok(std::optional<ArchiveRecord>());
    }
    return Ok(std::optional<ArchiveRecord>(std::move(rows.value().front())));
}

Result<std::vector<ArchiveRecord>> ArchiveCache::query_vault(const std::string& vault,
                                                             bool live_only,
                                                             const char* order_by) const {
    std::string sql = std::string(kSelectColumns) + "WHERE account_key = ?1 AND vault = ?2";
    if (live_only) {
        sql += " AND deleted_here IS NULL";
    }
    sql += " ORDER BY ";
    sql += order_by;

    Statement stmt(db_, sql.c_str());
    if (!stmt.ok()) {
        return Err<std::vector<ArchiveRecord>>(ErrorKind::DataError, "Cache query failed: " + stmt.error());
    }
    stmt.bind(1, account_key_);
    stmt.bind(2, vault);
    return collect(stmt);
}

Result<std::string> ArchiveCache::resolve(const std::string& vault, const std::string& ref) const {
    auto record = find_single_live(vault, ref);
    if (record.is_error()) {
        return Err<std::string>(record.error());
    }
    return Ok(record.value().id);
}

Result<std::optional<std::string>> ArchiveCache::name_of(const std::string& vault, const std::string& ref) const {
    auto record = find_single_live(vault, ref);
    if (record.is_error()) {
        return Err<std::optional<std::string>>(record.error());
    }
    return Ok(record.value().name);
}

Result<Timestamp> ArchiveCache::last_seen(const std::string& vault, const std::string& ref) const {
    auto record = find_single_live(vault, ref);
    if (record.is_error()) {
        return Err<Timestamp>(record.error());
    }
    const auto& found = record.value();
    return Ok(found.last_seen_upstream.value_or(found.created_here.value_or(0)));
}

Result<std::vector<std::string>> ArchiveCache::list_names(const std::string& vault) const {
    auto live = query_vault(vault, true, "name, id");
    if (live.is_error()) {
        return Err<std::vector<std::string>>(live.error());
    }

    const auto& records = live.value();
    std::vector<std::string> lines;
    lines.reserve(records.size());

    std::size_t i = 0;
    while (i < records.size()) {
        if (!records[i].has_name()) {
            lines.push_back(archive_ref(records[i], true));
            ++i;
            continue;
        }

        std::size_t group_end = i + 1;
        while (group_end < records.size() && records[group_end].name == records[i].name) {
            ++group_end;
        }

        if (group_end - i == 1) {
            lines.push_back(archive_ref(records[i]));
        } else {
            for (std::size_t j = i; j < group_end; ++j) {
                lines.push_back(with_ids_line(records[j]));
            }
        }
        i = group_end;
    }
    return Ok(std::move(lines));
}

Result<std::vector<std::string>> ArchiveCache::list_with_ids(const std::string& vault) const {
    auto live = query_vault(vault, true, "name, id");
    if (live.is_error()) {
        return Err<std::vector<std::string>>(live.error());
    }

    std::vector<std::string> lines;
    lines.reserve(live.value().size());
    for (const auto& record : live.value()) {
        lines.push_back(with_ids_line(record));
    }
    return Ok(std::move(lines));
}

Result<std::vector<ArchiveRecord>> ArchiveCache::records(const std::string& vault) const {
    return query_vault(vault, false, "id");
}

Result<void> ArchiveCache::delete_record(const std::string& vault, const std::string& ref) {
    auto record = find_single_live(vault, ref);
    if (record.is_error()) {
        return Err<void>(record.error());
    }
    if (auto res = begin_if_needed(); res.is_error()) {
        return res;
    }

    auto& found = record.value();
    found.deleted_here = clock_();
    if (auto res = update_record(found); res.is_error()) {
        return res;
    }
    return commit();
}

Result<void> ArchiveCache::merge_inventory_sighting(const std::string& vault,
                                                    const InventorySighting& sighting,
                                                    bool fix) {
    if (auto res = begin_if_needed(); res.is_error()) {
        return res;
    }

    const Timestamp proven_at = std::max(sighting.upstream_inventory_date,
                                         sighting.inventory_job_creation_date - kInventoryLag);

    auto existing = find_by_id(vault, sighting.id);
    if (existing.is_error()) {
        return Err<void>(existing.error());
    }

    if (!existing.value()) {
        ArchiveRecord record;
        record.id = sighting.id;
        if (!sighting.name.empty()) {
            record.name = sighting.name;
        }
        record.size = sighting.size;
        record.vault = vault;
        record.account_key = account_key_;
        record.last_seen_upstream = proven_at;
        spdlog::debug("archive {} first seen in inventory", archive_ref(record));
        return insert_record(record);
    }

    ArchiveRecord record = std::move(*existing.value());

    if (!record.has_name()) {
        if (!sighting.name.empty()) {
            record.name = sighting.name;
        }
    } else if (*record.name != sighting.name) {
        if (fix) {
            spdlog::warn("archive '{}' appears to have changed name from '{}' to '{}' (fixed)",
                         record.id, *record.name, sighting.name);
            record.name = sighting.name;
        } else {
            spdlog::warn("archive '{}' appears to have changed name from '{}' to '{}'",
                         record.id, *record.name, sighting.name);
        }
    }

    if (!record.has_size()) {
        record.size = sighting.size;
    } else if (*record.size != sighting.size) {
        if (fix) {
            spdlog::warn("archive '{}' appears to have changed size from {} to {} (fixed)",
                         record.id, *record.size, sighting.size);
            record.size = sighting.size;
        } else {
            spdlog::warn("archive '{}' appears to have changed size from {} to {}",
                         record.id, *record.size, sighting.size);
        }
    }

    if (record.tombstoned()) {
        if (*record.deleted_here < sighting.upstream_inventory_date) {
            spdlog::warn("archive '{}' marked deleted but still present", archive_ref(record));
        } else {
            spdlog::info("archive '{}' deletion not yet in inventory", archive_ref(record));
        }
    }

    if (!record.last_seen_upstream || *record.last_seen_upstream < proven_at) {
        record.last_seen_upstream = proven_at;
    }

    return update_record(record);
}

Result<void> ArchiveCache::finalize_inventory(const std::string& vault,
                                              Timestamp inventory_date,
                                              const std::vector<std::string>& seen_ids,
                                              bool fix) {
    if (auto res = begin_if_needed(); res.is_error()) {
        return res;
    }

    auto all = query_vault(vault, false, "id");
    if (all.is_error()) {
        return Err<void>(all.error());
    }

    const std::unordered_set<std::string> seen(seen_ids.begin(), seen_ids.end());

    for (const auto& record : all.value()) {
        if (seen.count(record.id) > 0) {
            continue;
        }

        const std::string ref = archive_ref(record);

        if (record.tombstoned()) {
            if (*record.deleted_here < inventory_date) {
                if (auto res = purge_record(vault, record.id); res.is_error()) {
                    return res;
                }
                spdlog::info("deleted archive '{}' has left inventory; removed from cache", ref);
            } else {
                spdlog::info("deleted archive '{}' not yet reflected in inventory", ref);
            }
            continue;
        }

        const bool expected_in_inventory =
            record.last_seen_upstream.has_value() ||
            (record.created_here && *record.created_here < inventory_date - kInventoryLag);

        if (expected_in_inventory) {
            if (fix) {
                if (auto res = purge_record(vault, record.id); res.is_error()) {
                    return res;
                }
                spdlog::warn("archive disappeared: '{}' (removed from cache)", ref);
            } else {
                spdlog::warn("archive disappeared: '{}'", ref);
            }
        } else {
            spdlog::info("new archive not yet in inventory: '{}'", ref);
        }
    }

    return Ok();
}

Result<void> ArchiveCache::insert_record(const ArchiveRecord& record) {
    Statement stmt(db_,
        "INSERT INTO archive (id, name, size, vault, account_key, last_seen_upstream, created_here, deleted_here) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)");
    if (!stmt.ok()) {
        return Err<void>(ErrorKind::DataError, "Cache insert failed: " + stmt.error());
    }
    stmt.bind(1, record.id);
    stmt.bind(2, record.name);
    stmt.bind(3, to_column(record.size));
    stmt.bind(4, record.vault);
    stmt.bind(5, record.account_key);
    stmt.bind(6, record.last_seen_upstream);
    stmt.bind(7, record.created_here);
    stmt.bind(8, record.deleted_here);

    if (stmt.step() != SQLITE_DONE) {
        return Err<void>(ErrorKind::DataError, "Cache insert failed for archive " + record.id + ": " + stmt.error());
    }
    return Ok();
}

Result<void> ArchiveCache::update_record(const ArchiveRecord& record) {
    Statement stmt(db_,
        "UPDATE archive SET name = ?1, size = ?2, last_seen_upstream = ?3, created_here = ?4, deleted_here = ?5 "
        "WHERE account_key = ?6 AND vault = ?7 AND id = ?8");
    if (!stmt.ok()) {
        return Err<void>(ErrorKind::DataError, "Cache update failed: " + stmt.error());
    }
    stmt.bind(1, record.name);
    stmt.bind(2, to_column(record.size));
    stmt.bind(3, record.last_seen_upstream);
    stmt.bind(4, record.created_here);
    stmt.bind(5, record.deleted_here);
    stmt.bind(6, account_key_);
    stmt.bind(7, record.vault);
    stmt.bind(8, record.id);

    if (stmt.step() != SQLITE_DONE) {
        return Err<void>(ErrorKind::DataError, "Cache update failed for archive " + record.id + ": " + stmt.error());
    }
    return Ok();
}

Result<void> ArchiveCache::purge_record(const std::string& vault, const std::string& id) {
    Statement stmt(db_, "DELETE FROM archive WHERE account_key = ?1 AND vault = ?2 AND id = ?3");
    if (!stmt.ok()) {
        return Err<void>(ErrorKind::DataError, "Cache delete failed: " + stmt.error());
    }
    stmt.bind(1, account_key_);
    stmt.bind(2, vault);
    stmt.bind(3, id);

    if (stmt.step() != SQLITE_DONE) {
        return Err<void>(ErrorKind::DataError, "Cache delete failed for archive " + id + ": " + stmt.error());
    }
    return Ok();
}

} // namespace gcli::cache
