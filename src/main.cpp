// main file for snapshot backups
// Created by: Garrett Madsen


#include <csignal>
#include <cstdlib>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "backup_errors.hpp"
#include "backup_manager.hpp"
#include "configuration.hpp"
#include "logging.hpp"
#include "metrics_collector.hpp"
#include "replication_pipeline.hpp"
#include "ssh_channel.hpp"
#include "zfs_snapshot_provider.hpp"

namespace {

CancellationToken cancellation;

void usage(const char* program) {
    std::cerr <<
        "Usage: " << program << " [--debug] [--dry-run] <config> <command> [options]\n"
        "Commands:\n"
        "  init                               create <path>/zfs/.initialized on every target\n"
        "  list    [--plain]                  print stored snapshot chains\n"
        "  backup  [--missing] [--full] [-f prefix] [-t target-prefix]\n"
        "  verify  [-f prefix] [-t target-prefix] [-r|--remove-corrupted]\n"
        "  restore <dest-root|.> [-f prefix] [-g group] [-s sequence] [-i|--incremental]\n";
}

struct CommandArgs {
    bool missing = false;
    bool full = false;
    bool removeCorrupted = false;
    bool incremental = false;
    bool plain = false;
    std::string filter;
    std::string targetFilter;
    std::optional<std::string> group;
    std::optional<uint64_t> sequence;
    std::vector<std::string> positional;
};

// Parse the options following the command name; argv[0] is the command
bool parseCommandArgs(int argc, char* argv[], CommandArgs& args) {
    static struct option long_options[] = {
        {"missing", 0, 0, 'm'},
        {"repair", 0, 0, 'm'},
        {"full", 0, 0, 'F'},
        {"filter", 1, 0, 'f'},
        {"target-filter", 1, 0, 't'},
        {"remove-corrupted", 0, 0, 'r'},
        {"group", 1, 0, 'g'},
        {"sequence", 1, 0, 's'},
        {"incremental", 0, 0, 'i'},
        {"plain", 0, 0, 'p'},
        {NULL, 0, 0, 0},
    };

    optind = 0;
    while (1) {
        int long_index;
        int c = getopt_long(argc, argv, "f:t:rg:s:i", long_options, &long_index);

        if (c == -1)
            break;

        switch (c) {
        case 'm':
            args.missing = true;
            break;
        case 'F':
            args.full = true;
            break;
        case 'f':
            args.filter = optarg;
            break;
        case 't':
            args.targetFilter = optarg;
            break;
        case 'r':
            args.removeCorrupted = true;
            break;
        case 'g':
            args.group = optarg;
            break;
        case 's':
            try {
                args.sequence = std::stoull(optarg);
            } catch (const std::exception&) {
                std::cerr << "Invalid sequence: " << optarg << std::endl;
                return false;
            }
            break;
        case 'i':
            args.incremental = true;
            break;
        case 'p':
            args.plain = true;
            break;
        default:
            return false;
        }
    }

    for (int i = optind; i < argc; ++i) {
        args.positional.push_back(argv[i]);
    }
    return true;
}

}

int runCommand(int argc, char* argv[]) {
    bool debug = false;
    bool dryRun = false;

    static struct option global_options[] = {
        {"debug", 0, 0, 'd'},
        {"dry-run", 0, 0, 'n'},
        {"help", 0, 0, 'h'},
        {NULL, 0, 0, 0},
    };

    while (1) {
        int long_index;
        // '+' stops at the config path, the rest belongs to the command
        int c = getopt_long(argc, argv, "+dnh", global_options, &long_index);

        if (c == -1)
            break;

        switch (c) {
        case 'd':
            debug = true;
            break;
        case 'n':
            dryRun = true;
            break;
        case 'h':
            usage(argv[0]);
            return 0;
        default:
            usage(argv[0]);
            return 2;
        }
    }

    if (argc - optind < 2) {
        usage(argv[0]);
        return 2;
    }
    std::string configPath = argv[optind];
    std::string command = argv[optind + 1];

    CommandArgs args;
    if (!parseCommandArgs(argc - optind - 1, argv + optind + 1, args)) {
        usage(argv[0]);
        return 2;
    }

    // Sink writes into a closed pipe must fail with EPIPE, not kill the process
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, [](int) { cancellation.cancel(); });

    try {
        Configuration config = Configuration::load(configPath);
        initializeLogging(config.general, debug);
        config.validate();

        auto metrics = std::make_shared<MetricsCollector>();
        BackupManager manager(config, std::make_shared<ZfsSnapshotProvider>(), std::make_shared<SshChannel>(),
                              metrics, &cancellation);

        OperationReport report;
        if (command == "init") {
            report = manager.initializeTargets();
        } else if (command == "list") {
            report = manager.list(std::cout, args.plain);
        } else if (command == "backup") {
            BackupOptions options;
            options.repair = args.missing;
            options.forceFull = args.full;
            options.dryRun = dryRun;
            options.datasetFilter = args.filter;
            options.targetFilter = args.targetFilter;
            report = manager.backup(options);
        } else if (command == "verify") {
            VerifyOptions options;
            options.datasetFilter = args.filter;
            options.targetFilter = args.targetFilter;
            options.removeCorrupted = args.removeCorrupted;
            report = manager.verify(options);
        } else if (command == "restore") {
            if (args.positional.size() != 1) {
                std::cerr << "restore needs exactly one destination root (use . for in place)" << std::endl;
                return 2;
            }
            RestoreOptions options;
            options.destinationRoot = args.positional.front();
            options.datasetFilter = args.filter;
            options.group = args.group;
            options.sequence = args.sequence;
            options.incremental = args.incremental;
            options.dryRun = dryRun;
            report = manager.restore(options);
        } else {
            std::cerr << "Unknown command: " << command << std::endl;
            usage(argv[0]);
            return 2;
        }

        report.print(std::cout);
        if (debug) {
            metrics->collect(std::cout);
        }
        if (cancellation.cancelled()) {
            std::cerr << "... Aborted!" << std::endl;
            return 1;
        }
        return report.exitCode();
    } catch (const ConfigurationError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return 2;
    } catch (const ChainBrokenError& e) {
        spdlog::error("{}", e.what());
        return 2;
    } catch (const IOError& e) {
        spdlog::error("{}", e.what());
        return 2;
    } catch (const SnapshotProviderError& e) {
        spdlog::error("{}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 2;
    }
}

int main(int argc, char* argv[]) {
    int code = runCommand(argc, argv);
    shutdownLogging();
    return code;
}
