#pragma once

#include "gcli/core/result.hpp"
#include "gcli/core/time.hpp"
#include "gcli/remote/archive_service.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace gcli::remote {

/**
 * @brief One entry of an inventory retrieval job's output
 */
struct InventoryEntry {
    std::string archive_id;
    std::string description;
    Timestamp creation_date = 0;
    std::uint64_t size = 0;
    std::string sha256_tree_hash;
};

struct Inventory {
    std::string vault_arn;
    Timestamp inventory_date = 0;
    std::vector<InventoryEntry> archives;
};

// JSON documents exchanged with the service
Result<JobDescription> job_from_json(const nlohmann::json& j);
Result<VaultDescription> vault_from_json(const nlohmann::json& j);

/// Parse the body of an inventory retrieval job (JSON format).
Result<Inventory> parse_inventory(const std::vector<std::uint8_t>& body);

/// Parse a JSON body, mapping parse failures to DataError.
Result<nlohmann::json> parse_json(const std::vector<std::uint8_t>& body);

/// "message" of a service error document, or the raw body if it is not one.
std::string error_message_from_body(const std::vector<std::uint8_t>& body);

} // namespace gcli::remote
