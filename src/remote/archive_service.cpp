#include "gcli/remote/archive_service.hpp"

namespace gcli::remote {

const char* to_string(JobAction action) {
    switch (action) {
        case JobAction::ArchiveRetrieval: return "ArchiveRetrieval";
        case JobAction::InventoryRetrieval: return "InventoryRetrieval";
    }
    return "Unknown";
}

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::InProgress: return "InProgress";
        case JobStatus::Succeeded: return "Succeeded";
        case JobStatus::Failed: return "Failed";
    }
    return "Unknown";
}

Result<JobAction> parse_job_action(const std::string& text) {
    if (text == "ArchiveRetrieval") return Ok(JobAction::ArchiveRetrieval);
    if (text == "InventoryRetrieval") return Ok(JobAction::InventoryRetrieval);
    return Err<JobAction>(ErrorKind::DataError, "Unknown job action: " + text);
}

Result<JobStatus> parse_job_status(const std::string& text) {
    if (text == "InProgress") return Ok(JobStatus::InProgress);
    if (text == "Succeeded") return Ok(JobStatus::Succeeded);
    if (text == "Failed") return Ok(JobStatus::Failed);
    return Err<JobStatus>(ErrorKind::DataError, "Unknown job status: " + text);
}

} // namespace gcli::remote
