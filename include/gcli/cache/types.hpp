#pragma once

#include "gcli/core/time.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace gcli::cache {

/**
 * Maximum plausible delay between a vault change and an inventory that
 * reflects it. An archive listed in any inventory is taken to have existed
 * at least at max(InventoryDate, job creation - kInventoryLag).
 */
inline constexpr Timestamp kInventoryLag = 72 * 60 * 60;

/**
 * @brief One archive known to the local cache
 *
 * Keyed by (account_key, vault, id). A record with deleted_here set is a
 * local tombstone awaiting inventory confirmation.
 */
struct ArchiveRecord {
    std::string id;
    std::optional<std::string> name;
    std::optional<std::uint64_t> size;
    std::string vault;
    std::string account_key;
    std::optional<Timestamp> last_seen_upstream; ///< Remote clock, from inventory data only
    std::optional<Timestamp> created_here;       ///< Local clock
    std::optional<Timestamp> deleted_here;       ///< Local clock

    [[nodiscard]] bool tombstoned() const noexcept { return deleted_here.has_value(); }
    [[nodiscard]] bool has_name() const noexcept { return name.has_value() && !name->empty(); }
    [[nodiscard]] bool has_size() const noexcept { return size.has_value() && *size != 0; }
};

/**
 * @brief One archive entry of a retrieved inventory plus the inventory's dates
 */
struct InventorySighting {
    std::string id;
    std::string name;
    std::uint64_t size = 0;
    Timestamp upstream_creation_date = 0;
    Timestamp upstream_inventory_date = 0;
    Timestamp inventory_job_creation_date = 0;
};

/**
 * @brief Parsed form of a user-supplied archive reference
 *
 * "id:<x>" selects by id, "name:<x>" by name, anything else is a bare name.
 */
struct ArchiveRef {
    enum class Field {
        Id,
        Name
    };

    Field field = Field::Name;
    std::string value;

    static ArchiveRef parse(const std::string& ref);
};

} // namespace gcli::cache
