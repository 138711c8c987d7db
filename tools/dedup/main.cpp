#include "dedup/config.hpp"
#include "dedup/core/platform.hpp"
#include "dedup/events/components.hpp"
#include "dedup/events/event_bus.hpp"
#include "dedup/events/events.hpp"
#include "dedup/report/reporter.hpp"
#include "dedup/resolve/deleter.hpp"
#include "dedup/scan/file_type.hpp"
#include "dedup/session.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using dedup::events::EventBus;

namespace {

constexpr const char* kVersion = "0.1.0";

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::string command;
    fs::path directory;
    std::optional<fs::path> config_path;
    std::vector<std::string> file_types;
    std::vector<std::string> excludes;
    bool no_default_excludes = false;
    std::optional<std::size_t> workers;
    std::optional<fs::path> trash_dir;
    std::string format = "table";
    std::optional<fs::path> output;
    bool dry_run = false;
    bool assume_yes = false;
    bool verbose = false;
    bool quiet = false;
    bool no_progress = false;
};

void print_usage() {
    std::cout << "Usage: dedup <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  scan <dir>      Find duplicate files and print a summary\n"
              << "  report <dir>    Print the keep/delete plan\n"
              << "  clean <dir>     Move duplicates to the trash\n"
              << "  config          Print the effective configuration\n"
              << "\n"
              << "Options:\n"
              << "  -t, --type <name>          Only consider text|audio|video|archive files (repeatable)\n"
              << "  -e, --exclude <pattern>    Skip directories matching a glob (repeatable)\n"
              << "      --no-default-excludes  Do not skip .git, node_modules, build, ...\n"
              << "  -j, --workers <n>          Hash with n threads\n"
              << "  -c, --config <file>        Load settings from a JSON file\n"
              << "      --trash-dir <dir>      Trash location override\n"
              << "  -f, --format <fmt>         report: table|csv|json\n"
              << "  -o, --output <file>        report: write to file\n"
              << "  -n, --dry-run              clean: show what would be deleted\n"
              << "  -y, --yes                  clean: do not ask for confirmation\n"
              << "      --no-progress          Do not draw progress bars\n"
              << "  -v, --verbose              Debug logging\n"
              << "  -q, --quiet                Warnings and errors only\n"
              << "      --version              Print version\n";
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions options;
    std::vector<std::string> positional;

    auto need_value = [&](int& i, const std::string& flag) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage();
            std::exit(kExitOk);
        } else if (arg == "--version") {
            std::cout << "dedup " << kVersion << "\n";
            std::exit(kExitOk);
        } else if (arg == "-t" || arg == "--type") {
            auto value = need_value(i, arg);
            if (!value) return std::nullopt;
            options.file_types.push_back(*value);
        } else if (arg == "-e" || arg == "--exclude") {
            auto value = need_value(i, arg);
            if (!value) return std::nullopt;
            options.excludes.push_back(*value);
        } else if (arg == "--no-default-excludes") {
            options.no_default_excludes = true;
        } else if (arg == "-j" || arg == "--workers") {
            auto value = need_value(i, arg);
            if (!value) return std::nullopt;
            try {
                options.workers = static_cast<std::size_t>(std::stoul(*value));
            } catch (const std::exception&) {
                std::cerr << "Invalid worker count: " << *value << "\n";
                return std::nullopt;
            }
        } else if (arg == "-c" || arg == "--config") {
            auto value = need_value(i, arg);
            if (!value) return std::nullopt;
            options.config_path = fs::path(*value);
        } else if (arg == "--trash-dir") {
            auto value = need_value(i, arg);
            if (!value) return std::nullopt;
            options.trash_dir = fs::path(*value);
        } else if (arg == "-f" || arg == "--format") {
            auto value = need_value(i, arg);
            if (!value) return std::nullopt;
            options.format = *value;
        } else if (arg == "-o" || arg == "--output") {
            auto value = need_value(i, arg);
            if (!value) return std::nullopt;
            options.output = fs::path(*value);
        } else if (arg == "-n" || arg == "--dry-run") {
            options.dry_run = true;
        } else if (arg == "-y" || arg == "--yes") {
            options.assume_yes = true;
        } else if (arg == "--no-progress") {
            options.no_progress = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            options.quiet = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        std::cerr << "Missing command\n";
        return std::nullopt;
    }
    options.command = positional[0];

    if (options.command == "config") {
        return options;
    }
    if (options.command != "scan" && options.command != "report" && options.command != "clean") {
        std::cerr << "Unknown command: " << options.command << "\n";
        return std::nullopt;
    }
    if (positional.size() != 2) {
        std::cerr << options.command << " expects exactly one directory\n";
        return std::nullopt;
    }
    options.directory = positional[1];

    if (options.format != "table" && options.format != "csv" && options.format != "json") {
        std::cerr << "Unknown format: " << options.format << "\n";
        return std::nullopt;
    }
    return options;
}

/// Command-line flags win over the config file
std::optional<dedup::Config> build_config(const CliOptions& cli) {
    dedup::Config config;
    if (cli.config_path) {
        auto loaded = dedup::load_config(*cli.config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().describe());
            return std::nullopt;
        }
        config = std::move(loaded.value());
    }

    if (!cli.file_types.empty()) {
        config.scan.file_types.clear();
        for (const auto& name : cli.file_types) {
            auto type = dedup::scan::parse_file_type(name);
            if (!type) {
                spdlog::error("Unknown file type '{}' (expected text, audio, video or archive)", name);
                return std::nullopt;
            }
            config.scan.file_types.push_back(*type);
        }
    }
    if (cli.no_default_excludes) {
        config.scan.use_default_excludes = false;
    }
    if (!cli.excludes.empty()) {
        // Extra patterns add to whichever set is active
        std::vector<std::string> patterns;
        if (config.scan.exclude_dirs) {
            patterns = *config.scan.exclude_dirs;
        } else if (config.scan.use_default_excludes) {
            patterns = dedup::scan::FileFilter::default_exclude_patterns();
        }
        patterns.insert(patterns.end(), cli.excludes.begin(), cli.excludes.end());
        config.scan.exclude_dirs = patterns;
    }
    if (cli.workers) {
        config.hash.workers = std::max<std::size_t>(1, *cli.workers);
    }
    if (cli.trash_dir) {
        config.removal.trash_dir = cli.trash_dir;
    }
    if (cli.dry_run) {
        config.removal.dry_run = true;
    }
    if (cli.verbose) {
        config.log.level = "debug";
    } else if (cli.quiet) {
        config.log.level = "warn";
    }
    return config;
}

void setup_logging(const dedup::Config& config) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::from_str(config.log.level));
}

/**
 * @brief Draws "[#####-----] 50% label" on stderr from progress events
 */
class ProgressBar {
public:
    explicit ProgressBar(EventBus& bus) {
        scan_sub_ = bus.scoped_subscribe<dedup::events::ScanProgressEvent>(
            [this](const dedup::events::ScanProgressEvent& e) {
                draw(e.percent, "Files: " + std::to_string(e.processed) + "/" +
                                std::to_string(e.estimated_total) + " Dir: " + e.current_dir);
            });
        hash_sub_ = bus.scoped_subscribe<dedup::events::HashProgressEvent>(
            [this](const dedup::events::HashProgressEvent& e) {
                draw(e.percent, "Hashing: " + std::to_string(e.completed) + "/" + std::to_string(e.total));
            });
    }

    ~ProgressBar() {
        if (drawn_) {
            std::cerr << "\n";
        }
    }

private:
    void draw(int percent, const std::string& label) {
        const int filled = percent / 10;
        std::string bar(static_cast<std::size_t>(filled), '#');
        bar += std::string(static_cast<std::size_t>(10 - filled), '-');
        std::cerr << "\r[" << bar << "] " << percent << "% " << label << "\x1b[K" << std::flush;
        drawn_ = true;
    }

    EventBus::Subscription scan_sub_;
    EventBus::Subscription hash_sub_;
    bool drawn_ = false;
};

int run_scan_like(const CliOptions& cli, const dedup::Config& config, EventBus& bus) {
    dedup::DedupSession session(config, &bus);

    std::optional<dedup::FindResult> found;
    {
        std::optional<ProgressBar> progress;
        if (!cli.no_progress && !cli.quiet) {
            progress.emplace(bus);
        }
        auto result = session.find(cli.directory);
        if (result.is_error()) {
            progress.reset();
            spdlog::error("{}", result.error().describe());
            return kExitFailure;
        }
        found = std::move(result.value());
    }

    dedup::report::Reporter reporter;
    const auto stats = reporter.calculate_stats(found->decisions, found->groups, found->scan.processed);

    if (found->scan.errors > 0 || found->hashing.failures > 0) {
        spdlog::warn("{} entries could not be scanned, {} files could not be hashed",
                     found->scan.errors, found->hashing.failures);
    }

    if (cli.command == "scan") {
        std::cout << reporter.summary(stats);
        return kExitOk;
    }

    if (cli.command == "report") {
        std::string text;
        if (cli.format == "csv") {
            text = reporter.generate_csv(found->decisions);
        } else if (cli.format == "json") {
            text = reporter.generate_json(found->decisions, stats);
        } else {
            text = reporter.generate_table(found->decisions, stats);
        }

        if (cli.output) {
            auto saved = reporter.save(*cli.output, text);
            if (saved.is_error()) {
                spdlog::error("{}", saved.error().describe());
                return kExitFailure;
            }
            spdlog::info("Report written to {}", cli.output->string());
        } else {
            std::cout << text;
        }
        return kExitOk;
    }

    // clean
    const auto to_delete = dedup::resolve::Deleter::preview(found->decisions);
    if (to_delete.empty()) {
        std::cout << "No duplicates found.\n";
        return kExitOk;
    }

    std::cout << reporter.summary(stats);
    if (config.removal.dry_run) {
        for (const auto& path : to_delete) {
            std::cout << "Would delete: " << path << "\n";
        }
    } else if (!cli.assume_yes) {
        std::cout << "Move " << to_delete.size() << " files to the trash? [y/N] " << std::flush;
        std::string answer;
        std::getline(std::cin, answer);
        if (answer != "y" && answer != "Y" && answer != "yes") {
            std::cout << "Aborted.\n";
            return kExitOk;
        }
    }

    const auto summary = session.remove(found->decisions);
    std::cout << (config.removal.dry_run ? "Dry run: " : "")
              << summary.success_count << " files moved to trash, "
              << summary.failure_count << " failed\n";
    for (const auto& outcome : summary.results) {
        if (!outcome.success && outcome.error) {
            std::cout << "  FAILED " << outcome.path << ": " << outcome.error->describe() << "\n";
        }
    }
    return summary.failure_count == 0 ? kExitOk : kExitFailure;
}

} // namespace

int main(int argc, char* argv[]) {
    auto cli = parse_args(argc, argv);
    if (!cli) {
        print_usage();
        return kExitUsage;
    }

    auto config = build_config(*cli);
    if (!config) {
        return kExitUsage;
    }
    setup_logging(*config);
    spdlog::debug("dedup {} on {}", kVersion, dedup::platform_name());

    if (cli->command == "config") {
        std::cout << dedup::config_to_json(*config).dump(2) << "\n";
        return kExitOk;
    }

    EventBus bus;
    dedup::events::LoggerComponent logger(bus);
    dedup::events::MetricsComponent metrics(bus);

    const int status = run_scan_like(*cli, *config, bus);
    if (cli->verbose) {
        metrics.log_summary();
    }
    return status;
}
