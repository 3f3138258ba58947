#include "gcli/cli/command_line.hpp"

#include <boost/program_options.hpp>

#include <sstream>

namespace gcli::cli {
namespace po = boost::program_options;

namespace {

constexpr const char* kUsage =
    "usage: glacier [--config FILE] [--region REGION] [--verbose] <group> <command> [args]\n"
    "\n"
    "  config write_default\n"
    "  vault list\n"
    "  vault create NAME\n"
    "  vault delete NAME\n"
    "  vault sync VAULT [--wait] [--fix] [--max-age HOURS]\n"
    "  archive list VAULT [--force-ids]\n"
    "  archive upload VAULT FILE [--name NAME] [--multipart-size BYTES]\n"
    "  archive retrieve VAULT NAME... [-o FILE] [--wait] [--multipart-size BYTES]\n"
    "  archive delete VAULT NAME\n"
    "  archive checkpresent VAULT NAME [--wait] [--quiet] [--max-age HOURS]\n"
    "  job list\n";

Invocation help(const po::options_description* options = nullptr) {
    Invocation invocation;
    invocation.command = Command::Help;
    std::ostringstream text;
    text << kUsage;
    if (options) {
        text << "\n" << *options;
    }
    invocation.help_text = text.str();
    return invocation;
}

/**
 * Parse the arguments following "<group> <command>" against options plus
 * the given positional names, filling vm.
 */
Result<bool> parse_command_args(const std::vector<std::string>& args,
                                const po::options_description& options,
                                const po::positional_options_description& positional,
                                po::variables_map& vm) {
    po::options_description all(options);
    all.add_options()("help,h", "show this help");
    try {
        po::store(po::command_line_parser(args).options(all).positional(positional).run(), vm);
        if (vm.count("help")) {
            return Ok(false);
        }
        po::notify(vm);
    } catch (const po::error& e) {
        return Err<bool>(ErrorKind::Usage, e.what());
    }
    return Ok(true);
}

template <typename T>
std::optional<T> optional_value(const po::variables_map& vm, const char* name) {
    if (!vm.count(name)) {
        return std::nullopt;
    }
    return vm[name].as<T>();
}

Result<Invocation> parse_command(Invocation invocation,
                                 const std::string& group,
                                 const std::string& command,
                                 const std::vector<std::string>& args) {
    po::options_description options(group + " " + command + " options");
    po::positional_options_description positional;
    po::variables_map vm;

    if (group == "config" && command == "write_default") {
        invocation.command = Command::ConfigWriteDefault;
    } else if (group == "vault" && command == "list") {
        invocation.command = Command::VaultList;
    } else if (group == "vault" && (command == "create" || command == "delete")) {
        invocation.command = command == "create" ? Command::VaultCreate : Command::VaultDelete;
        options.add_options()("name", po::value<std::string>(&invocation.name)->required(), "vault name");
        positional.add("name", 1);
    } else if (group == "vault" && command == "sync") {
        invocation.command = Command::VaultSync;
        auto& sync = invocation.sync;
        options.add_options()
            ("vault_name", po::value<std::string>(&sync.vault)->required(), "vault name")
            ("wait", po::bool_switch(&sync.wait), "block until the inventory job completes")
            ("fix", po::bool_switch(&sync.fix), "overwrite local data that disagrees with the inventory")
            ("max-age", po::value<int>(&sync.max_age_hours)->default_value(24), "reuse inventories up to HOURS old");
        positional.add("vault_name", 1);
    } else if (group == "archive" && command == "list") {
        invocation.command = Command::ArchiveList;
        options.add_options()
            ("vault", po::value<std::string>(&invocation.vault)->required(), "vault name")
            ("force-ids", po::bool_switch(&invocation.force_ids), "show the id of every archive");
        positional.add("vault", 1);
    } else if (group == "archive" && command == "upload") {
        invocation.command = Command::ArchiveUpload;
        auto& upload = invocation.upload;
        options.add_options()
            ("vault", po::value<std::string>(&upload.vault)->required(), "vault name")
            ("file", po::value<std::string>()->required(), "file to upload")
            ("name", po::value<std::string>(), "archive name (default: file base name)")
            ("multipart-size", po::value<std::uint64_t>(&upload.multipart_size)
                                   ->default_value(transfer::kDefaultUploadChunkSize), "part size in bytes");
        positional.add("vault", 1).add("file", 1);
    } else if (group == "archive" && command == "retrieve") {
        invocation.command = Command::ArchiveRetrieve;
        auto& retrieve = invocation.retrieve;
        options.add_options()
            ("vault", po::value<std::string>(&retrieve.vault)->required(), "vault name")
            ("names", po::value<std::vector<std::string>>(&retrieve.names)->required(), "archive names")
            ("output,o", po::value<std::string>(), "output file, '-' for standard output")
            ("wait", po::bool_switch(&retrieve.wait), "block until the retrieval jobs complete")
            ("multipart-size", po::value<std::uint64_t>(&retrieve.multipart_size)
                                   ->default_value(transfer::kDefaultDownloadChunkSize), "range size in bytes");
        positional.add("vault", 1).add("names", -1);
    } else if (group == "archive" && command == "delete") {
        invocation.command = Command::ArchiveDelete;
        options.add_options()
            ("vault", po::value<std::string>(&invocation.vault)->required(), "vault name")
            ("name", po::value<std::string>(&invocation.name)->required(), "archive name");
        positional.add("vault", 1).add("name", 1);
    } else if (group == "archive" && command == "checkpresent") {
        invocation.command = Command::ArchiveCheckPresent;
        auto& check = invocation.checkpresent;
        options.add_options()
            ("vault", po::value<std::string>(&check.vault)->required(), "vault name")
            ("name", po::value<std::string>(&check.name)->required(), "archive name")
            ("wait", po::bool_switch(&check.wait), "block until an inventory is available")
            ("quiet", po::bool_switch(&check.quiet), "suppress diagnostics")
            ("max-age", po::value<int>(&check.max_age_hours)->default_value(80), "maximum sighting age in hours");
        positional.add("vault", 1).add("name", 1);
    } else if (group == "job" && command == "list") {
        invocation.command = Command::JobList;
    } else {
        return Err<Invocation>(ErrorKind::Usage, "unknown command '" + group + " " + command + "'");
    }

    auto parsed = parse_command_args(args, options, positional, vm);
    if (parsed.is_error()) {
        return Err<Invocation>(parsed.error());
    }
    if (!parsed.value()) {
        Invocation shown = help(&options);
        shown.global = invocation.global;
        return Ok(std::move(shown));
    }

    if (invocation.command == Command::ArchiveUpload) {
        invocation.upload.file = vm["file"].as<std::string>();
        invocation.upload.name = optional_value<std::string>(vm, "name");
    } else if (invocation.command == Command::ArchiveRetrieve) {
        invocation.retrieve.output = optional_value<std::string>(vm, "output");
    }
    return Ok(std::move(invocation));
}

} // namespace

Result<Invocation> parse_command_line(const std::vector<std::string>& args) {
    Invocation invocation;

    po::options_description global("Global options");
    global.add_options()
        ("help,h", "show this help")
        ("config", po::value<std::string>(), "configuration INI file to use")
        ("region", po::value<std::string>(), "service region")
        ("verbose", po::bool_switch(&invocation.global.verbose), "log debug output");

    po::options_description hidden;
    hidden.add_options()
        ("group", po::value<std::string>())
        ("subargs", po::value<std::vector<std::string>>());

    po::options_description all;
    all.add(global).add(hidden);

    po::positional_options_description positional;
    positional.add("group", 1).add("subargs", -1);

    po::variables_map vm;
    std::vector<std::string> rest;
    try {
        // Options after the group belong to the command; stop at the group
        po::parsed_options parsed = po::command_line_parser(args)
                                        .options(all)
                                        .positional(positional)
                                        .allow_unregistered()
                                        .run();
        po::store(parsed, vm);
        po::notify(vm);
        rest = po::collect_unrecognized(parsed.options, po::include_positional);
    } catch (const po::error& e) {
        return Err<Invocation>(ErrorKind::Usage, e.what());
    }

    if (vm.count("config")) {
        invocation.global.config = std::filesystem::path(vm["config"].as<std::string>());
    }
    if (vm.count("region")) {
        invocation.global.region = vm["region"].as<std::string>();
    }

    if (!vm.count("group")) {
        if (vm.count("help")) {
            Invocation shown = help(&global);
            shown.global = invocation.global;
            return Ok(std::move(shown));
        }
        return Err<Invocation>(ErrorKind::Usage, std::string("no command given\n") + kUsage);
    }

    // rest starts with the group itself
    const std::string group = vm["group"].as<std::string>();
    if (!rest.empty() && rest.front() == group) {
        rest.erase(rest.begin());
    }
    if (rest.empty() || rest.front().rfind("-", 0) == 0) {
        if (vm.count("help") || (!rest.empty() && (rest.front() == "--help" || rest.front() == "-h"))) {
            Invocation shown = help();
            shown.global = invocation.global;
            return Ok(std::move(shown));
        }
        return Err<Invocation>(ErrorKind::Usage, "missing command for '" + group + "'");
    }

    const std::string command = rest.front();
    rest.erase(rest.begin());
    if (vm.count("help")) {
        rest.emplace_back("--help");
    }
    return parse_command(std::move(invocation), group, command, rest);
}

Result<Invocation> parse_command_line(int argc, const char* const argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_command_line(args);
}

} // namespace gcli::cli
