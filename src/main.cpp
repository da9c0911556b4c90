#include "dsync/cache/response_cache.hpp"
#include "dsync/config/config.hpp"
#include "dsync/events/components.hpp"
#include "dsync/events/event_bus.hpp"
#include "dsync/governor/clock.hpp"
#include "dsync/governor/rate_governor.hpp"
#include "dsync/log/logging.hpp"
#include "dsync/remote/drive_service.hpp"
#include "dsync/sync/comparator.hpp"
#include "dsync/sync/engine.hpp"
#include "dsync/sync/remote_ops.hpp"
#include "dsync/sync/structure.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <optional>
#include <string>

namespace {

struct CliOptions {
    std::string config_path = dsync::config::kDefaultConfigPath;
    std::optional<std::string> log_level;
    bool print_structure = false;
    bool compare = false;
    bool detailed = false;
    bool json = false;
    bool dry_run = false;
    bool help = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\n"
              << "Copies every missing or changed file from the source folder into the\n"
              << "destination folder named in the configuration file.\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH       Configuration file (default ./config.json)\n"
              << "  --print-structure   Print the source and destination trees and exit\n"
              << "  --compare           Compare source and destination without copying\n"
              << "  --detailed          With --compare: list matching, different and missing items\n"
              << "  --json              With --compare: print the report as JSON\n"
              << "  --dry-run           Show what would be created and copied, change nothing\n"
              << "  --log-level LEVEL   DEBUG, INFO, WARNING, ERROR or CRITICAL\n"
              << "  -h, --help          Show this help\n";
}

dsync::Result<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            options.log_level = std::string(argv[++i]);
        } else if (arg == "--print-structure") {
            options.print_structure = true;
        } else if (arg == "--compare") {
            options.compare = true;
        } else if (arg == "--detailed") {
            options.detailed = true;
        } else if (arg == "--json") {
            options.json = true;
        } else if (arg == "--dry-run") {
            options.dry_run = true;
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else {
            return dsync::Err("Unknown or incomplete argument: " + arg);
        }
    }
    if ((options.detailed || options.json) && !options.compare) {
        return dsync::Err("--detailed and --json require --compare");
    }
    return dsync::Ok(options);
}

int print_trees(dsync::sync::RemoteOperations& ops, const dsync::config::AppConfig& config) {
    const auto sink = [](const std::string& line) { std::cout << line << '\n'; };
    int status = 0;
    for (const auto& [title, root] : {std::make_pair("Source", config.source_folder_id),
                                      std::make_pair("Destination", config.destination_folder_id)}) {
        std::cout << "\n" << title << " folder structure (" << root << "):\n";
        auto printed = dsync::sync::print_structure(ops, root, sink);
        if (printed.is_error()) {
            spdlog::error("Cannot list {} folder: {}", title, printed.error().describe());
            status = 1;
        }
    }
    return status;
}

int run_compare(dsync::sync::RemoteOperations& ops, dsync::events::EventBus& bus,
                const dsync::config::AppConfig& config, const CliOptions& cli) {
    dsync::sync::Comparator comparator(ops, bus);
    auto report = comparator.compare(config.source_folder_id, config.destination_folder_id, cli.detailed);
    if (report.is_error()) {
        spdlog::error("Comparison failed: {}", report.error().describe());
        return 1;
    }
    if (cli.json) {
        std::cout << dsync::sync::to_json(report.value()).dump(2) << std::endl;
    } else {
        std::cout << dsync::sync::format_report(report.value());
    }
    return 0;
}

int run_sync(dsync::sync::RemoteOperations& ops, dsync::events::EventBus& bus,
             const dsync::config::AppConfig& config, const CliOptions& cli) {
    dsync::events::ProgressComponent progress(bus);
    dsync::sync::SyncEngine engine(ops, bus);

    dsync::sync::SyncOptions options;
    options.source_root = config.source_folder_id;
    options.dest_root = config.destination_folder_id;
    options.batch_size = config.migration.batch_size;
    options.final_validation = config.migration.final_validation;
    options.auto_fix_missing = config.migration.auto_fix_missing;
    options.dry_run = cli.dry_run;

    const auto result = engine.run(options);
    progress.print_summary();

    const auto cache_stats = ops.cache().stats();
    spdlog::info("API requests admitted: {}, retries: {}, cache hits: {}, misses: {}",
                 ops.governor().total_admitted(), ops.governor().total_retries(),
                 cache_stats.hits, cache_stats.misses);

    if (!result.success) {
        spdlog::error("Sync finished with errors: {}", result.error);
        for (const auto& path : result.failed_paths) {
            spdlog::error("  failed: {}", path);
        }
        return 1;
    }
    spdlog::info("Sync completed successfully");
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        auto cli = parse_args(argc, argv);
        if (cli.is_error()) {
            spdlog::error("{}", cli.error());
            print_usage(argv[0]);
            return 1;
        }
        if (cli.value().help) {
            print_usage(argv[0]);
            return 0;
        }

        auto config = dsync::config::load_config(cli.value().config_path);
        if (config.is_error()) {
            spdlog::error("{}", config.error());
            return 1;
        }

        auto log_path = dsync::log::setup_logging(config.value().logging, cli.value().log_level);
        if (log_path.is_error()) {
            spdlog::error("{}", log_path.error());
            return 1;
        }
        spdlog::info("Logging to {}", log_path.value());

        auto token = dsync::config::load_access_token(config.value());
        if (token.is_error()) {
            spdlog::error("{}", token.error());
            return 1;
        }

        const auto& app = config.value();

        dsync::governor::SystemClock clock;
        dsync::governor::GovernorConfig limits;
        limits.rate_limit = app.performance.rate_limit;
        limits.time_window = app.performance.time_window;
        limits.max_retries = app.migration.max_retries;
        limits.max_backoff = std::chrono::duration<double>(app.migration.max_backoff_seconds);
        dsync::governor::RateGovernor governor(clock, limits);
        dsync::cache::ResponseCache cache(clock);

        dsync::remote::DriveConfig drive_config;
        drive_config.page_size = app.performance.page_size;
        dsync::remote::DriveRestService service(token.value(), drive_config);

        dsync::events::EventBus bus;
        dsync::events::LoggerComponent logger(bus);
        dsync::sync::RemoteOperations ops(service, governor, cache);

        if (cli.value().print_structure) {
            return print_trees(ops, app);
        }
        if (cli.value().compare) {
            return run_compare(ops, bus, app, cli.value());
        }
        return run_sync(ops, bus, app, cli.value());
    } catch (const std::exception& e) {
        spdlog::critical("Unexpected error: {}", e.what());
        return 1;
    }
}
