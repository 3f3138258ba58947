#include "gcli/config/configuration.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace gcli;
using namespace gcli::config;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("gcli_config_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_text(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << text;
}

} // namespace

TEST(ConfigurationTest, UserDirsFollowXdg) {
    auto from_home = UserDirs::from_environment({{"HOME", "/home/me"}});
    ASSERT_TRUE(from_home.is_ok());
    EXPECT_EQ(from_home.value().config_dir, fs::path("/home/me/.config"));
    EXPECT_EQ(from_home.value().cache_dir, fs::path("/home/me/.cache"));

    auto from_xdg = UserDirs::from_environment({{"XDG_CONFIG_HOME", "/cfg"}, {"XDG_CACHE_HOME", "/cache"}});
    ASSERT_TRUE(from_xdg.is_ok());
    EXPECT_EQ(from_xdg.value().config_dir, fs::path("/cfg"));
    EXPECT_EQ(default_config_path(from_xdg.value()), fs::path("/cfg/glacier-cli/config.ini"));

    auto nothing = UserDirs::from_environment({});
    ASSERT_TRUE(nothing.is_error());
    EXPECT_EQ(nothing.error().message, "Cannot find user home directory");
}

TEST(ConfigurationTest, DefaultsWithoutFile) {
    const auto home = create_temp_dir();
    auto loaded = load(std::nullopt, {{"HOME", home.string()},
                                      {"AWS_ACCESS_KEY_ID", "AKID"},
                                      {"AWS_SECRET_ACCESS_KEY", "SECRET"}});
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().message;

    const auto& config = loaded.value();
    EXPECT_EQ(config.database_driver, "sqlite://" + (home / ".cache").string() + "/glacier-cli/db");
    EXPECT_EQ(config.region, "us-east-1");
    EXPECT_EQ(config.access_key, "AKID");
    EXPECT_EQ(config.secret_key, "SECRET");
    EXPECT_EQ(config.poll_interval_seconds, 600);
    EXPECT_EQ(config.poll_max_attempts, 144);

    auto db = config.database_path();
    ASSERT_TRUE(db.is_ok());
    EXPECT_EQ(db.value(), home / ".cache" / "glacier-cli" / "db");

    fs::remove_all(home);
}

TEST(ConfigurationTest, FileOverridesEnvironment) {
    const auto home = create_temp_dir();
    write_text(home / ".config" / "glacier-cli" / "config.ini",
               "[database]\n"
               "driver = sqlite://%(user_config_dir)s/cache.db\n"
               "[aws]\n"
               "region = eu-west-1\n"
               "access_key = FROMFILE\n"
               "[poll]\n"
               "interval_seconds = 5\n"
               "max_attempts = 3\n");

    auto loaded = load(std::nullopt, {{"HOME", home.string()},
                                      {"AWS_ACCESS_KEY_ID", "FROMENV"},
                                      {"AWS_DEFAULT_REGION", "ap-south-1"}});
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().message;
    EXPECT_EQ(loaded.value().access_key, "FROMFILE");
    EXPECT_EQ(loaded.value().region, "eu-west-1");
    EXPECT_EQ(loaded.value().database_driver, "sqlite://" + (home / ".config").string() + "/cache.db");
    EXPECT_EQ(loaded.value().poll_interval_seconds, 5);
    EXPECT_EQ(loaded.value().poll_max_attempts, 3);

    fs::remove_all(home);
}

TEST(ConfigurationTest, ExplicitFileMustExist) {
    const auto home = create_temp_dir();
    auto loaded = load(home / "nope.ini", {{"HOME", home.string()}});
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().kind, ErrorKind::DataError);
    fs::remove_all(home);
}

TEST(ConfigurationTest, InvalidValuesRejected) {
    const auto home = create_temp_dir();
    const fs::path file = home / "bad.ini";
    write_text(file, "[poll]\ninterval_seconds = soon\n");

    auto loaded = load(file, {{"HOME", home.string()}});
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().kind, ErrorKind::DataError);
    fs::remove_all(home);
}

TEST(ConfigurationTest, OnlySqliteDriverSupported) {
    Configuration config;
    config.database_driver = "postgres://db";
    auto path = config.database_path();
    ASSERT_TRUE(path.is_error());
    EXPECT_EQ(path.error().kind, ErrorKind::Usage);

    config.database_driver = "sqlite://";
    EXPECT_TRUE(config.database_path().is_error());
}

TEST(ConfigurationTest, WriteDefaultRefusesToOverwrite) {
    const auto home = create_temp_dir();
    const Environment env = {{"HOME", home.string()}};

    auto written = write_default(env);
    ASSERT_TRUE(written.is_ok()) << written.error().message;
    EXPECT_EQ(written.value(), home / ".config" / "glacier-cli" / "config.ini");
    EXPECT_TRUE(fs::exists(written.value()));

    auto reloaded = load(std::nullopt, env);
    ASSERT_TRUE(reloaded.is_ok());
    EXPECT_EQ(reloaded.value().database_driver, "sqlite://" + (home / ".cache").string() + "/glacier-cli/db");

    auto again = write_default(env);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind, ErrorKind::Usage);
    EXPECT_NE(again.error().message.find("refusing to overwrite"), std::string::npos);

    fs::remove_all(home);
}

TEST(ConfigurationTest, InterpolatesBothDirectories) {
    UserDirs dirs{"/c", "/k"};
    EXPECT_EQ(interpolate("%(user_cache_dir)s/a:%(user_config_dir)s/b:%(user_cache_dir)s", dirs), "/k/a:/c/b:/k");
}
