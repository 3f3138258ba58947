#include "gcli/cache/archive_cache.hpp"
#include "gcli/cli/app.hpp"
#include "gcli/cli/command_line.hpp"
#include "gcli/config/configuration.hpp"
#include "gcli/jobs/coordinator.hpp"
#include "gcli/remote/glacier_service.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <iostream>

using namespace gcli;

namespace {

void signal_handler(int signal) {
    if (signal == SIGINT) {
        // Any open cache transaction is rolled back by SQLite on next open
        std::_Exit(cli::kExitInterrupted);
    }
}

void setup_logging(bool verbose) {
    // Standard output carries command results; all logging goes to stderr
    auto logger = spdlog::stderr_color_st("glacier");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("glacier: %l: %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

int report(const Result<void>& result) {
    if (result.is_error()) {
        std::cout.flush();
        std::cerr << cli::format_error(result.error().message);
    }
    return cli::exit_code(result);
}

Result<void> run(const cli::Invocation& invocation) {
    const auto env = config::current_environment();

    if (invocation.command == cli::Command::ConfigWriteDefault) {
        auto written = config::write_default(env);
        if (written.is_error()) {
            return Err<void>(written.error());
        }
        spdlog::info("Wrote default configuration to {}", written.value().string());
        return Ok();
    }

    auto loaded = config::load(invocation.global.config, env);
    if (loaded.is_error()) {
        return Err<void>(loaded.error());
    }
    config::Configuration& settings = loaded.value();
    if (invocation.global.region) {
        settings.region = *invocation.global.region;
    }

    remote::GlacierService::Options options;
    options.region = settings.region;
    options.host = settings.endpoint;
    options.credentials = remote::Credentials{settings.access_key, settings.secret_key, settings.session_token};
    if (options.credentials.empty()) {
        return Err<void>(ErrorKind::Usage,
                         "No AWS credentials configured\n"
                         "Set AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY or the [aws] section of the configuration");
    }

    auto db_path = settings.database_path();
    if (db_path.is_error()) {
        return Err<void>(db_path.error());
    }
    // The access key namespaces the cache so several accounts can share one file
    auto cache = cache::ArchiveCache::open(settings.access_key, db_path.value());
    if (cache.is_error()) {
        return Err<void>(cache.error());
    }

    auto service = remote::GlacierService::connect(std::move(options));

    jobs::PollPolicy policy;
    policy.interval = std::chrono::seconds(settings.poll_interval_seconds);
    policy.max_attempts = settings.poll_max_attempts;
    jobs::JobCoordinator coordinator(*service, policy);

    cli::App app(*service, *cache.value(), coordinator, std::cout);
    return app.run(invocation);
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);

    auto invocation = cli::parse_command_line(argc, argv);
    setup_logging(invocation.is_ok() && invocation.value().global.verbose);
    if (invocation.is_error()) {
        return report(Err<void>(invocation.error()));
    }

    if (invocation.value().command == cli::Command::Help) {
        std::cout << invocation.value().help_text;
        return 0;
    }

    const auto result = run(invocation.value());
    std::cout.flush();
    return report(result);
}
