#pragma once

#include "gcli/core/result.hpp"
#include "gcli/transfer/chunk_planner.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gcli::cli {

enum class Command {
    Help,
    ConfigWriteDefault,
    VaultList,
    VaultCreate,
    VaultDelete,
    VaultSync,
    ArchiveList,
    ArchiveUpload,
    ArchiveRetrieve,
    ArchiveDelete,
    ArchiveCheckPresent,
    JobList
};

struct GlobalOptions {
    std::optional<std::filesystem::path> config;
    std::optional<std::string> region;
    bool verbose = false;
};

struct SyncOptions {
    std::string vault;
    int max_age_hours = 24;
    bool fix = false;
    bool wait = false;
};

struct UploadOptions {
    std::string vault;
    std::filesystem::path file;
    std::optional<std::string> name;     ///< Defaults to the file's base name
    std::uint64_t multipart_size = transfer::kDefaultUploadChunkSize;
};

struct RetrieveOptions {
    std::string vault;
    std::vector<std::string> names;
    std::optional<std::string> output;   ///< "-" writes to standard output
    bool wait = false;
    std::uint64_t multipart_size = transfer::kDefaultDownloadChunkSize;
};

struct CheckPresentOptions {
    std::string vault;
    std::string name;
    int max_age_hours = 80;
    bool wait = false;
    bool quiet = false;
};

/**
 * @brief A fully parsed command line
 *
 * Only the members relevant to command are meaningful. vault and name carry
 * the positional arguments of the simple commands (vault create/delete,
 * archive list/delete).
 */
struct Invocation {
    GlobalOptions global;
    Command command = Command::Help;
    std::string vault;
    std::string name;
    bool force_ids = false;
    SyncOptions sync;
    UploadOptions upload;
    RetrieveOptions retrieve;
    CheckPresentOptions checkpresent;
    std::string help_text;               ///< Usage text for Command::Help
};

/**
 * @brief Parse "glacier [global options] <group> <command> [args]"
 *
 * Unknown groups, commands or options and missing arguments are Usage
 * errors. --help at either level yields Command::Help.
 */
Result<Invocation> parse_command_line(const std::vector<std::string>& args);

Result<Invocation> parse_command_line(int argc, const char* const argv[]);

} // namespace gcli::cli
