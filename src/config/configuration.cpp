#include "gcli/config/configuration.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <system_error>

namespace gcli::config {
namespace fs = std::filesystem;
namespace pt = boost::property_tree;

namespace {

constexpr const char* kDefaultDriver = "sqlite://%(user_cache_dir)s/glacier-cli/db";
constexpr const char* kSqliteScheme = "sqlite://";

std::optional<std::string> lookup(const Environment& env, const std::string& name) {
    const auto it = env.find(name);
    if (it == env.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    for (std::size_t pos = text.find(from); pos != std::string::npos; pos = text.find(from, pos + to.size())) {
        text.replace(pos, from.size(), to);
    }
}

} // namespace

Environment current_environment() {
    Environment env;
    for (const char* name : {"HOME", "XDG_CONFIG_HOME", "XDG_CACHE_HOME", "AWS_ACCESS_KEY_ID",
                             "AWS_SECRET_ACCESS_KEY", "AWS_SESSION_TOKEN", "AWS_DEFAULT_REGION"}) {
        if (const char* value = std::getenv(name)) {
            env[name] = value;
        }
    }
    return env;
}

Result<UserDirs> UserDirs::from_environment(const Environment& env) {
    const auto home = lookup(env, "HOME");
    const auto xdg_config = lookup(env, "XDG_CONFIG_HOME");
    const auto xdg_cache = lookup(env, "XDG_CACHE_HOME");

    if ((!xdg_config || !xdg_cache) && !home) {
        return Err<UserDirs>(ErrorKind::DataError, "Cannot find user home directory");
    }

    UserDirs dirs;
    dirs.config_dir = xdg_config ? fs::path(*xdg_config) : fs::path(*home) / ".config";
    dirs.cache_dir = xdg_cache ? fs::path(*xdg_cache) : fs::path(*home) / ".cache";
    return Ok(std::move(dirs));
}

fs::path default_config_path(const UserDirs& dirs) {
    return dirs.config_dir / "glacier-cli" / "config.ini";
}

std::string interpolate(const std::string& value, const UserDirs& dirs) {
    std::string out = value;
    replace_all(out, "%(user_cache_dir)s", dirs.cache_dir.string());
    replace_all(out, "%(user_config_dir)s", dirs.config_dir.string());
    return out;
}

Result<fs::path> Configuration::database_path() const {
    if (database_driver.compare(0, std::char_traits<char>::length(kSqliteScheme), kSqliteScheme) != 0) {
        return Err<fs::path>(ErrorKind::Usage,
                             "Unsupported database driver '" + database_driver + "' (only sqlite:// is supported)");
    }
    const std::string path = database_driver.substr(std::char_traits<char>::length(kSqliteScheme));
    if (path.empty()) {
        return Err<fs::path>(ErrorKind::Usage, "Database driver '" + database_driver + "' names no file");
    }
    return Ok(fs::path(path));
}

Result<Configuration> load(const std::optional<fs::path>& path, const Environment& env) {
    auto dirs = UserDirs::from_environment(env);
    if (dirs.is_error()) {
        return Err<Configuration>(dirs.error());
    }
    const fs::path file = path ? *path : default_config_path(dirs.value());

    pt::ptree tree;
    std::error_code ec;
    if (fs::exists(file, ec)) {
        try {
            pt::read_ini(file.string(), tree);
        } catch (const pt::ini_parser_error& e) {
            return Err<Configuration>(ErrorKind::DataError, "Failed to read configuration: " + std::string(e.what()));
        }
        spdlog::debug("Read configuration from {}", file.string());
    } else if (path) {
        // An explicitly named file must exist
        return Err<Configuration>(ErrorKind::DataError, "Configuration file not found: " + file.string());
    }

    Configuration config;
    try {
        config.database_driver = interpolate(tree.get<std::string>("database.driver", kDefaultDriver), dirs.value());
        config.region = tree.get<std::string>("aws.region", lookup(env, "AWS_DEFAULT_REGION").value_or("us-east-1"));
        config.access_key = tree.get<std::string>("aws.access_key", lookup(env, "AWS_ACCESS_KEY_ID").value_or(""));
        config.secret_key = tree.get<std::string>("aws.secret_key", lookup(env, "AWS_SECRET_ACCESS_KEY").value_or(""));
        config.session_token = tree.get<std::string>("aws.session_token",
                                                     lookup(env, "AWS_SESSION_TOKEN").value_or(""));
        config.endpoint = tree.get<std::string>("aws.endpoint", "");
        config.poll_interval_seconds = tree.get<int>("poll.interval_seconds", config.poll_interval_seconds);
        config.poll_max_attempts = tree.get<int>("poll.max_attempts", config.poll_max_attempts);
    } catch (const pt::ptree_error& e) {
        return Err<Configuration>(ErrorKind::DataError, "Invalid configuration value: " + std::string(e.what()));
    }

    if (config.poll_interval_seconds < 0 || config.poll_max_attempts < 0) {
        return Err<Configuration>(ErrorKind::DataError, "Poll settings must not be negative");
    }
    return Ok(std::move(config));
}

Result<fs::path> write_default(const Environment& env) {
    auto dirs = UserDirs::from_environment(env);
    if (dirs.is_error()) {
        return Err<fs::path>(dirs.error());
    }
    const fs::path file = default_config_path(dirs.value());

    std::error_code ec;
    if (fs::exists(file, ec)) {
        return Err<fs::path>(ErrorKind::Usage,
                             "Default configuration already exists (" + file.string() + "), refusing to overwrite");
    }
    fs::create_directories(file.parent_path(), ec);
    if (ec) {
        return Err<fs::path>(ErrorKind::DataError,
                             "Failed to create " + file.parent_path().string() + ": " + ec.message());
    }

    pt::ptree tree;
    tree.put("database.driver", kDefaultDriver);
    try {
        pt::write_ini(file.string(), tree);
    } catch (const pt::ini_parser_error& e) {
        return Err<fs::path>(ErrorKind::DataError, "Failed to write configuration: " + std::string(e.what()));
    }
    return Ok(file);
}

} // namespace gcli::config
