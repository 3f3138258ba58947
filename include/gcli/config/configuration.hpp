#pragma once

#include "gcli/core/result.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace gcli::config {

/// Snapshot of the environment variables the configuration depends on.
using Environment = std::map<std::string, std::string>;

/// HOME, XDG_CONFIG_HOME, XDG_CACHE_HOME and the AWS_* credential variables.
Environment current_environment();

/**
 * @brief Per-user base directories (XDG base directories)
 */
struct UserDirs {
    std::filesystem::path config_dir;  ///< $XDG_CONFIG_HOME, else $HOME/.config
    std::filesystem::path cache_dir;   ///< $XDG_CACHE_HOME, else $HOME/.cache

    /// Fails with DataError when neither the XDG variable nor HOME is set.
    static Result<UserDirs> from_environment(const Environment& env);
};

/**
 * @brief Effective settings after merging defaults, the INI file and env
 *
 * INI layout:
 * [database]
 * driver = sqlite://%(user_cache_dir)s/glacier-cli/db
 *
 * [aws]
 * region = us-east-1
 * access_key = ...
 * secret_key = ...
 * endpoint = glacier.us-east-1.amazonaws.com
 *
 * [poll]
 * interval_seconds = 600
 * max_attempts = 144
 */
struct Configuration {
    std::string database_driver;
    std::string region = "us-east-1";
    std::string access_key;
    std::string secret_key;
    std::string session_token;
    std::string endpoint;             ///< Empty selects the regional default
    int poll_interval_seconds = 600;
    int poll_max_attempts = 144;

    /// Filesystem path of a "sqlite://PATH" driver; other drivers are Usage errors.
    Result<std::filesystem::path> database_path() const;
};

std::filesystem::path default_config_path(const UserDirs& dirs);

/// Expand %(user_cache_dir)s and %(user_config_dir)s.
std::string interpolate(const std::string& value, const UserDirs& dirs);

/**
 * @brief Load the configuration
 *
 * path defaults to default_config_path(). A missing file yields the
 * defaults; an unreadable or malformed one is a DataError.
 */
Result<Configuration> load(const std::optional<std::filesystem::path>& path, const Environment& env);

/**
 * @brief Write the default configuration to the default location
 *
 * Refuses (Usage error) to overwrite an existing file. Returns the path
 * written.
 */
Result<std::filesystem::path> write_default(const Environment& env);

} // namespace gcli::config
