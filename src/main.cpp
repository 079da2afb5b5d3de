// main.cpp - Main entry point
#include <getopt.h>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "conf/config.hpp"
#include "core/errors.hpp"
#include "core/family.hpp"
#include "core/inventory.hpp"
#include "core/links.hpp"
#include "core/version.hpp"
#include "defs.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using namespace protonlink;

struct CliOptions {
    std::string config_file;
    std::string command;
    fs::path extract_dir;
    std::optional<ReleaseFamily> fork;
    std::optional<bool> strict;
    bool verbose = false;
    fs::path log_file;
    std::string output;
    std::vector<std::string> args;
};

static void print_help() {
    std::cout << "Usage: protonlink [OPTIONS] <command> [args...]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  link [TAG]         Point the fork links at the newest releases\n";
    std::cout << "                     (TAG: manually installed release to include)\n";
    std::cout << "  relink             Same as link, fails if nothing is installed\n";
    std::cout << "  ls                 List links and their release folders\n";
    std::cout << "  rm <TAG>           Remove a release folder and update the links\n";
    std::cout << "  where <TAG>        Show where a release is expected on disk\n";
    std::cout << "  config gen         Generate default config file\n";
    std::cout << "  config show        Show current configuration\n\n";

    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE       Config file path\n";
    std::cout << "  -x, --extract-dir DIR   Directory holding extracted releases\n";
    std::cout << "                          (default: " << DEFAULT_EXTRACT_DIR << ")\n";
    std::cout << "  -f, --fork NAME         Release fork: GE-Proton or Proton-EM\n";
    std::cout << "  -s, --strict            Only rank directories named like releases\n";
    std::cout << "                          (default, see strict_names in the config)\n";
    std::cout << "  -a, --all-dirs          Rank every real directory in the extract dir\n";
    std::cout << "  -v, --verbose           Verbose logging\n";
    std::cout << "  -l, --log-file FILE     Also append log lines to FILE\n";
    std::cout << "  -o, --output FILE       Output file (for config gen)\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  protonlink link                        # Relink GE-Proton\n";
    std::cout << "  protonlink -f Proton-EM link EM-10.0-30\n";
    std::cout << "  protonlink ls                          # Links of every fork\n";
    std::cout << "  protonlink rm GE-Proton9-5             # Remove an old release\n";
}

static CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;

    static struct option long_options[] = {{"config", required_argument, 0, 'c'},
                                           {"extract-dir", required_argument, 0, 'x'},
                                           {"fork", required_argument, 0, 'f'},
                                           {"strict", no_argument, 0, 's'},
                                           {"all-dirs", no_argument, 0, 'a'},
                                           {"verbose", no_argument, 0, 'v'},
                                           {"log-file", required_argument, 0, 'l'},
                                           {"output", required_argument, 0, 'o'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "c:x:f:savl:o:h", long_options, &option_index)) !=
           -1) {
        switch (opt) {
        case 'c':
            opts.config_file = optarg;
            break;
        case 'x':
            opts.extract_dir = optarg;
            break;
        case 'f':
            opts.fork = family_from_string(optarg);
            if (!opts.fork) {
                std::cerr << "Error: Invalid fork '" << optarg << "'\n";
                exit(1);
            }
            break;
        case 's':
            opts.strict = true;
            break;
        case 'a':
            opts.strict = false;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'l':
            opts.log_file = optarg;
            break;
        case 'o':
            opts.output = optarg;
            break;
        case 'h':
            print_help();
            exit(0);
        default:
            print_help();
            exit(1);
        }
    }

    if (optind < argc) {
        opts.command = argv[optind];
        optind++;
        while (optind < argc) {
            opts.args.push_back(argv[optind]);
            optind++;
        }
    }

    return opts;
}

static Config load_config(const CliOptions& opts) {
    Config config =
        opts.config_file.empty() ? Config::load_default() : Config::from_file(opts.config_file);
    config.merge_with_cli(opts.extract_dir, opts.fork, opts.strict, opts.verbose, opts.log_file);
    return config;
}

// One line per failed slot; the command itself still succeeds
static void report(const ReconcileResult& result) {
    for (const auto& out : result.outcomes) {
        if (out.status == SlotStatus::Failed) {
            std::cout << "Failed: " << out.link.filename().string() << ": " << out.reason
                      << "\n";
        }
    }
}

static void print_links(const Config& config, ReleaseFamily family) {
    std::cout << "Links for " << family_to_string(family) << ":\n";
    for (const auto& info : list_links(local_filesystem(), config.extract_dir, family)) {
        std::cout << "  " << info.name << " -> "
                  << (info.target ? info.target->string() : std::string("(not found)"))
                  << "\n";
    }
}

int main(int argc, char* argv[]) {
    try {
        CliOptions cli = parse_args(argc, argv);

        if (cli.command.empty()) {
            print_help();
            return 0;
        }

        Config config = load_config(cli);
        Logger::getInstance().init(config.verbose, config.log_file);

        ScanOptions scan = config.scan_options();

        enum class Command { LINK, RELINK, LS, RM, WHERE, CONFIG, UNKNOWN };

        auto get_command = [](const std::string& cmd) -> Command {
            if (cmd == "link")
                return Command::LINK;
            if (cmd == "relink")
                return Command::RELINK;
            if (cmd == "ls")
                return Command::LS;
            if (cmd == "rm")
                return Command::RM;
            if (cmd == "where")
                return Command::WHERE;
            if (cmd == "config")
                return Command::CONFIG;
            return Command::UNKNOWN;
        };

        switch (get_command(cli.command)) {
        case Command::LINK: {
            std::optional<std::string> manual;
            if (!cli.args.empty()) {
                manual = cli.args[0];
            }
            LOG_INFO("Managing " + family_to_string(config.fork) + " links in " +
                     config.extract_dir.string());
            report(manage_links(local_filesystem(), config.extract_dir, config.fork, manual,
                                scan));
            std::cout << "Success\n";
            return 0;
        }
        case Command::RELINK: {
            report(relink(local_filesystem(), config.extract_dir, config.fork, scan));
            std::cout << "Success\n";
            return 0;
        }
        case Command::LS: {
            LOG_INFO("Listing recognized links and their associated release folders...");
            if (cli.fork) {
                print_links(config, *cli.fork);
            } else {
                for (auto family : all_families()) {
                    print_links(config, family);
                }
            }
            std::cout << "Success\n";
            return 0;
        }
        case Command::RM: {
            if (cli.args.empty()) {
                std::cerr << "Usage: protonlink rm <TAG>\n";
                return 1;
            }
            LOG_INFO("Removing release: " + cli.args[0]);
            report(remove_release(local_filesystem(), config.extract_dir, config.fork,
                                  cli.args[0], scan));
            std::cout << "Success\n";
            return 0;
        }
        case Command::WHERE: {
            if (cli.args.empty()) {
                std::cerr << "Usage: protonlink where <TAG>\n";
                return 1;
            }
            const std::string& tag = cli.args[0];
            validate_tag(tag);
            const auto& desc = describe(config.fork);
            std::cout << "Fork:      " << desc.name << " (" << desc.repo << ")\n";
            std::cout << "Asset:     " << asset_name(config.fork, tag) << "\n";
            std::cout << "Version:   " << parse_version(tag, config.fork) << "\n";
            for (const auto& dir : expected_directories(config.extract_dir, config.fork, tag)) {
                std::cout << "Directory: " << dir.string() << "\n";
            }
            return 0;
        }
        case Command::CONFIG: {
            if (cli.args.empty()) {
                std::cerr << "Usage: protonlink config <gen|show>\n";
                return 1;
            }
            std::string subcmd = cli.args[0];

            if (subcmd == "gen") {
                fs::path output = cli.output.empty() ? default_config_path() : fs::path(cli.output);
                if (!config.save_to_file(output)) {
                    std::cerr << "Error: Cannot write " << output.string() << "\n";
                    return 1;
                }
                std::cout << "Generated config: " << output.string() << "\n";
                return 0;
            } else if (subcmd == "show") {
                std::cout << "{\n";
                std::cout << "  \"extract_dir\": \"" << config.extract_dir.string() << "\",\n";
                std::cout << "  \"fork\": \"" << family_to_string(config.fork) << "\",\n";
                std::cout << "  \"strict_names\": " << (config.strict_names ? "true" : "false")
                          << ",\n";
                std::cout << "  \"verbose\": " << (config.verbose ? "true" : "false") << ",\n";
                std::cout << "  \"log_file\": \"" << config.log_file.string() << "\"\n";
                std::cout << "}\n";
                return 0;
            }
            std::cerr << "Unknown config subcommand: " << subcmd << "\n";
            return 1;
        }
        case Command::UNKNOWN:
        default:
            std::cerr << "Unknown command: " << cli.command << "\n";
            print_help();
            return 1;
        }
    } catch (const Error& e) {
        LOG_ERROR(e.what());
        std::cout << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << "\n";
        LOG_ERROR("Fatal Error: " + std::string(e.what()));
        return 1;
    }
}
