#include "gcli/remote/codec.hpp"

namespace gcli::remote {
using json = nlohmann::json;
namespace {

std::string string_field(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

std::uint64_t number_field(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end()) {
        return 0;
    }
    if (it->is_number_unsigned() || it->is_number_integer()) {
        return it->get<std::uint64_t>();
    }
    // Sizes are occasionally sent as strings
    if (it->is_string()) {
        try {
            return std::stoull(it->get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

Result<std::optional<Timestamp>> date_field(const json& j, const char* key) {
    const std::string text = string_field(j, key);
    if (text.empty()) {
        return Ok(std::optional<Timestamp>());
    }
    auto parsed = parse_iso8601(text);
    if (parsed.is_error()) {
        return Err<std::optional<Timestamp>>(parsed.error());
    }
    return Ok(std::optional<Timestamp>(parsed.value()));
}

} // namespace

Result<json> parse_json(const std::vector<std::uint8_t>& body) {
    try {
        return Ok(json::parse(body.begin(), body.end()));
    } catch (const json::parse_error& e) {
        return Err<json>(ErrorKind::DataError, std::string("Malformed JSON from service: ") + e.what());
    }
}

Result<JobDescription> job_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<JobDescription>(ErrorKind::DataError, "Job description is not an object");
    }

    JobDescription job;
    job.id = string_field(j, "JobId");
    if (job.id.empty()) {
        return Err<JobDescription>(ErrorKind::DataError, "Job description without JobId");
    }

    auto action = parse_job_action(string_field(j, "Action"));
    if (action.is_error()) {
        return Err<JobDescription>(action.error());
    }
    job.action = action.value();

    auto status = parse_job_status(string_field(j, "StatusCode"));
    if (status.is_error()) {
        return Err<JobDescription>(status.error());
    }
    job.status = status.value();

    const auto completed = j.find("Completed");
    job.completed = completed != j.end() && completed->is_boolean()
                        ? completed->get<bool>()
                        : job.status != JobStatus::InProgress;

    auto created = date_field(j, "CreationDate");
    if (created.is_error()) {
        return Err<JobDescription>(created.error());
    }
    job.creation_date = created.value().value_or(0);

    auto finished = date_field(j, "CompletionDate");
    if (finished.is_error()) {
        return Err<JobDescription>(finished.error());
    }
    job.completion_date = finished.value();

    job.archive_id = string_field(j, "ArchiveId");
    job.archive_size = number_field(j, "ArchiveSizeInBytes");
    job.sha256_tree_hash = string_field(j, "ArchiveSHA256TreeHash");
    if (job.sha256_tree_hash.empty()) {
        job.sha256_tree_hash = string_field(j, "SHA256TreeHash");
    }
    job.status_message = string_field(j, "StatusMessage");
    return Ok(std::move(job));
}

Result<VaultDescription> vault_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<VaultDescription>(ErrorKind::DataError, "Vault description is not an object");
    }

    VaultDescription vault;
    vault.name = string_field(j, "VaultName");
    vault.arn = string_field(j, "VaultARN");
    vault.archive_count = number_field(j, "NumberOfArchives");
    vault.size = number_field(j, "SizeInBytes");

    auto created = date_field(j, "CreationDate");
    if (created.is_error()) {
        return Err<VaultDescription>(created.error());
    }
    vault.creation_date = created.value().value_or(0);

    auto inventoried = date_field(j, "LastInventoryDate");
    if (inventoried.is_error()) {
        return Err<VaultDescription>(inventoried.error());
    }
    vault.last_inventory_date = inventoried.value();
    return Ok(std::move(vault));
}

Result<Inventory> parse_inventory(const std::vector<std::uint8_t>& body) {
    auto parsed = parse_json(body);
    if (parsed.is_error()) {
        return Err<Inventory>(parsed.error());
    }
    const auto& j = parsed.value();

    Inventory inventory;
    inventory.vault_arn = string_field(j, "VaultARN");

    auto date = date_field(j, "InventoryDate");
    if (date.is_error()) {
        return Err<Inventory>(date.error());
    }
    if (!date.value()) {
        return Err<Inventory>(ErrorKind::DataError, "Inventory without InventoryDate");
    }
    inventory.inventory_date = *date.value();

    const auto list = j.find("ArchiveList");
    if (list == j.end() || !list->is_array()) {
        return Err<Inventory>(ErrorKind::DataError, "Inventory without ArchiveList");
    }

    inventory.archives.reserve(list->size());
    for (const auto& item : *list) {
        InventoryEntry entry;
        entry.archive_id = string_field(item, "ArchiveId");
        if (entry.archive_id.empty()) {
            return Err<Inventory>(ErrorKind::DataError, "Inventory entry without ArchiveId");
        }
        entry.description = string_field(item, "ArchiveDescription");
        entry.size = number_field(item, "Size");
        entry.sha256_tree_hash = string_field(item, "SHA256TreeHash");

        auto created = date_field(item, "CreationDate");
        if (created.is_error()) {
            return Err<Inventory>(created.error());
        }
        entry.creation_date = created.value().value_or(0);
        inventory.archives.push_back(std::move(entry));
    }
    return Ok(std::move(inventory));
}

std::string error_message_from_body(const std::vector<std::uint8_t>& body) {
    if (body.empty()) {
        return {};
    }
    try {
        const auto j = json::parse(body.begin(), body.end());
        if (j.is_object()) {
            std::string message = string_field(j, "message");
            const std::string code = string_field(j, "code");
            if (!code.empty()) {
                message = code + (message.empty() ? "" : ": " + message);
            }
            if (!message.empty()) {
                return message;
            }
        }
    } catch (const json::parse_error&) {
        // Not a JSON error document; fall through to the raw text
    }
    return std::string(body.begin(), body.end());
}

} // namespace gcli::remote
