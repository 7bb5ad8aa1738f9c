/**
 * @file main.cpp
 * @brief gantt_engine command-line entry point.
 *
 * Loads a project snapshot file into an in-memory store and runs one
 * scheduling operation against it through the ScheduleService:
 *   Config → Logger → Snapshot → Store → Service → (write snapshot back)
 */

#include "analysis/critical_path.hpp"
#include "cascade/cascade_engine.hpp"
#include "core/config.hpp"
#include "core/date.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "io/snapshot_loader.hpp"
#include "service/project_store.hpp"
#include "service/schedule_service.hpp"
#include "telemetry/log_sinks.hpp"

#include <charconv>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace gantt_engine;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitRejected = 1;
constexpr int kExitUsage = 2;

void print_usage() {
    std::cout << "Usage: gantt_engine [--config <path>] <command> <snapshot.toml> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  critical-path <file>                          CPM table and critical set\n"
              << "  cascade <file> <task> [--start D] [--end D]   Preview a date change\n"
              << "  apply <file> <task> [--start D] [--end D] [--confirm]\n"
              << "                                                Change dates per the project mode\n"
              << "  add-dependency <file> <task> <depends_on> [--type FS] [--lag N]\n"
              << "  remove-dependency <file> <task> <depends_on>\n"
              << "  complete <file> <task> [--today D]            Mark completed, advance successors\n"
              << "  blocked <file>                                Tasks waiting on open predecessors or groups\n"
              << "  buffers <file>                                Buffer consumption per Buffer task\n"
              << "  set-group <file> <task> [--group G] [--depends-on-group G]\n"
              << "  reorder <file> <item> [--prev id] [--next id] Move an item in the Gantt order\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>    Configuration file (default: config/default.toml)\n"
              << "  --help, -h         Show this help message\n"
              << "\n"
              << "Dates are YYYY-MM-DD. Exit codes: 0 ok, 1 rejected, 2 usage or input error.\n";
}

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::string command;
    std::vector<std::string> positional;
    std::optional<std::string> start;
    std::optional<std::string> end;
    std::optional<std::string> today;
    std::optional<std::string> prev;
    std::optional<std::string> next;
    std::optional<std::string> group;
    std::optional<std::string> depends_on_group;
    std::string type = "FS";
    std::string lag = "0";
    bool confirm = false;
    bool help = false;
};

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto take_value = [&](auto& slot) -> bool {
            if (i + 1 >= argc) return false;
            slot = argv[++i];
            return true;
        };

        bool ok = true;
        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--config") {
            std::string path;
            ok = take_value(path);
            args.config_path = path;
        } else if (arg == "--start") {
            ok = take_value(args.start);
        } else if (arg == "--end") {
            ok = take_value(args.end);
        } else if (arg == "--today") {
            ok = take_value(args.today);
        } else if (arg == "--prev") {
            ok = take_value(args.prev);
        } else if (arg == "--next") {
            ok = take_value(args.next);
        } else if (arg == "--group") {
            ok = take_value(args.group);
        } else if (arg == "--depends-on-group") {
            ok = take_value(args.depends_on_group);
        } else if (arg == "--type") {
            ok = take_value(args.type);
        } else if (arg == "--lag") {
            ok = take_value(args.lag);
        } else if (arg == "--confirm") {
            args.confirm = true;
        } else if (arg.starts_with("--")) {
            return Error{ErrorCode::ParseError, "Unknown option: " + arg};
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.push_back(arg);
        }

        if (!ok) return Error{ErrorCode::ParseError, "Missing value for " + arg};
    }
    return args;
}

Result<std::optional<Date>> date_option(const std::optional<std::string>& text, std::string_view name) {
    if (!text) return std::optional<Date>{};
    auto date = parse_date(*text);
    if (!date) {
        return Error{ErrorCode::ParseError, std::string(name) + " expects YYYY-MM-DD, got " + *text};
    }
    return std::optional<Date>{date};
}

Date today_utc() {
    return std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
}

void print_cascade(const CascadeResult& cascade) {
    std::cout << describe(cascade) << '\n';
    for (const auto& entry : cascade.entries) {
        std::cout << "  " << std::left << std::setw(16) << entry.task_id
                  << std::setw(11) << to_string(entry.field)
                  << format_date(entry.old_value) << " -> " << format_date(entry.new_value)
                  << "  (" << (entry.days_shift > 0 ? "+" : "") << entry.days_shift << "d)\n";
    }
    for (const auto& id : cascade.held) {
        std::cout << "  " << std::left << std::setw(16) << id << "held (completed)\n";
    }
    for (const auto& warning : cascade.warnings) {
        std::cout << "  warning: " << warning.message << '\n';
    }
}

void print_critical_path(const CriticalPathResult& result) {
    if (result.empty()) {
        std::cout << "No schedule to analyse\n";
        for (const auto& warning : result.warnings) {
            std::cout << "warning: " << warning.message << '\n';
        }
        return;
    }

    std::cout << "Project " << format_date(result.project_start) << " .. "
              << format_date(result.project_finish) << '\n';
    std::cout << std::left << std::setw(16) << "task" << std::setw(12) << "ES"
              << std::setw(12) << "EF" << std::setw(12) << "LS" << std::setw(12) << "LF"
              << std::setw(7) << "slack" << '\n';
    for (const auto& s : result.schedule) {
        std::cout << std::left << std::setw(16) << s.task_id
                  << std::setw(12) << format_date(s.earliest_start)
                  << std::setw(12) << format_date(s.earliest_finish)
                  << std::setw(12) << format_date(s.latest_start)
                  << std::setw(12) << format_date(s.latest_finish)
                  << std::setw(7) << s.slack_days
                  << (s.critical ? "critical" : "") << '\n';
    }

    std::cout << "Critical path:";
    for (const auto& id : result.critical_path) std::cout << ' ' << id;
    std::cout << '\n';
    for (const auto& warning : result.warnings) {
        std::cout << "warning: " << warning.message << '\n';
    }
}

int report(const Error& error) {
    std::cerr << to_string(error.code) << ": " << error.message << '\n';
    return error.code == ErrorCode::ParseError ? kExitUsage : kExitRejected;
}

/**
 * @brief Dispatch one command. Mutating commands set `dirty`.
 */
int run_command(const CLIArgs& args, ScheduleService& service, const ProjectId& project,
                bool& dirty) {
    const auto& pos = args.positional;
    auto need = [&](size_t n) {
        if (pos.size() >= n) return true;
        std::cerr << args.command << ": expected " << n << " argument(s)\n";
        return false;
    };

    if (args.command == "critical-path") {
        auto result = service.critical_path(project);
        if (!result) return report(result.error());
        print_critical_path(*result);
        return kExitOk;
    }

    if (args.command == "blocked") {
        auto blocked = service.blocked_tasks(project);
        if (!blocked) return report(blocked.error());
        for (const auto& id : *blocked) std::cout << id << '\n';
        return kExitOk;
    }

    if (args.command == "buffers") {
        auto report_rows = service.buffer_status(project);
        if (!report_rows) return report(report_rows.error());
        for (const auto& status : *report_rows) {
            std::cout << std::left << std::setw(16) << status.task_id
                      << status.delay_days << "/" << status.buffer_size << "d  "
                      << std::fixed << std::setprecision(1) << status.consumed_percent << "%\n";
        }
        return kExitOk;
    }

    if (args.command == "set-group") {
        if (!need(2)) return kExitUsage;
        auto updated = service.update_task_groups(project, pos[1], args.group, args.depends_on_group);
        if (!updated) return report(updated.error());
        dirty = true;
        return kExitOk;
    }

    if (args.command == "cascade" || args.command == "apply") {
        if (!need(2)) return kExitUsage;
        auto start = date_option(args.start, "--start");
        if (!start) return report(start.error());
        auto end = date_option(args.end, "--end");
        if (!end) return report(end.error());
        const auto& task = pos[1];

        if (args.command == "cascade") {
            auto preview = service.preview_cascade(project, task, *start, *end);
            if (!preview) return report(preview.error());
            print_cascade(*preview);
            return kExitOk;
        }

        auto outcome = service.update_task_dates(project, task, *start, *end);
        if (!outcome) return report(outcome.error());
        dirty = outcome->applied;

        std::cout << "Mode: " << to_string(outcome->mode) << '\n';
        if (outcome->mode == DependencyMode::Off) {
            std::cout << (outcome->blocked ? "Task is blocked\n" : "Task is not blocked\n");
            return kExitOk;
        }
        if (!outcome->pending_confirmation) {
            print_cascade(outcome->cascade);
            return kExitOk;
        }

        print_cascade(outcome->cascade);
        if (!args.confirm) {
            std::cout << "Not applied; re-run with --confirm to apply the cascade\n";
            return kExitOk;
        }
        auto applied = service.apply_cascade(project, task, *start, *end, outcome->cascade);
        if (!applied) return report(applied.error());
        dirty = true;
        std::cout << "Applied\n";
        return kExitOk;
    }

    if (args.command == "add-dependency") {
        if (!need(3)) return kExitUsage;
        auto type = parse_dependency_type(args.type);
        if (!type) return report(Error{ErrorCode::ParseError, "Unknown dependency type " + args.type});

        int32_t lag = 0;
        auto [ptr, ec] = std::from_chars(args.lag.data(), args.lag.data() + args.lag.size(), lag);
        if (ec != std::errc{} || ptr != args.lag.data() + args.lag.size()) {
            return report(Error{ErrorCode::ParseError, "--lag expects an integer, got " + args.lag});
        }

        auto added = service.add_dependency(project, Dependency{
            .task = pos[1], .depends_on = pos[2], .type = *type, .lag_days = lag});
        if (!added) return report(added.error());
        dirty = true;
        std::cout << pos[1] << " now depends on " << pos[2] << " (" << short_code(*type) << ")\n";
        return kExitOk;
    }

    if (args.command == "remove-dependency") {
        if (!need(3)) return kExitUsage;
        auto removed = service.remove_dependency(project, pos[1], pos[2]);
        if (!removed) return report(removed.error());
        dirty = true;
        return kExitOk;
    }

    if (args.command == "complete") {
        if (!need(2)) return kExitUsage;
        auto today = date_option(args.today, "--today");
        if (!today) return report(today.error());

        auto advance = service.complete_task(project, pos[1], today->value_or(today_utc()));
        if (!advance) return report(advance.error());
        dirty = true;
        print_cascade(*advance);
        return kExitOk;
    }

    if (args.command == "reorder") {
        if (!need(2)) return kExitUsage;
        auto reordered = service.reorder_item(project, pos[1], args.prev, args.next);
        if (!reordered) return report(reordered.error());
        dirty = true;
        std::cout << reordered->item << " -> " << std::setprecision(12) << reordered->sort_order;
        if (reordered->renormalized) std::cout << " (renormalized " << reordered->rekeyed.size() << " items)";
        std::cout << '\n';
        return kExitOk;
    }

    std::cerr << "Unknown command: " << args.command << '\n';
    return kExitUsage;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        std::cerr << parsed.error().message << '\n';
        print_usage();
        return kExitUsage;
    }
    const auto& args = *parsed;

    if (args.help || args.command.empty()) {
        print_usage();
        return args.help ? kExitOk : kExitUsage;
    }
    if (args.positional.empty()) {
        std::cerr << args.command << ": missing snapshot file\n";
        return kExitUsage;
    }

    // Load configuration; an explicit --config must load, the default may be absent.
    EngineConfig config = default_config();
    const auto config_path = args.config_path.value_or("config/default.toml");
    if (args.config_path || std::filesystem::exists(config_path)) {
        auto loaded = load_config(config_path);
        if (!loaded) {
            std::cerr << "Failed to load config: " << loaded.error().message << '\n';
            return kExitUsage;
        }
        config = *loaded;
    }

    // ── Initialize Logger ────────────────────
    Logger logger(make_log_sink(config.logging, "gantt_engine"),
                  parse_log_level(config.logging.log_level).value_or(LogLevel::Info));

    // ── Load Snapshot ────────────────────────
    const std::filesystem::path snapshot_path = args.positional.front();
    auto snapshot = load_snapshot(snapshot_path, config.scheduling);
    if (!snapshot) {
        std::cerr << "Failed to load snapshot: " << snapshot.error().message << '\n';
        return kExitUsage;
    }
    const ProjectId project = snapshot->project_id;

    InMemoryProjectStore store;
    store.put(std::move(*snapshot));
    ScheduleService service(store, config, logger);

    bool dirty = false;
    const int rc = run_command(args, service, project, dirty);

    // ── Persist Mutations ────────────────────
    if (rc == kExitOk && dirty) {
        auto current = store.snapshot(project);
        if (!current) return report(current.error());
        if (auto saved = save_snapshot(*current, snapshot_path); !saved) {
            return report(saved.error());
        }
        logger.info("Snapshot written", {{"project", project}, {"path", snapshot_path.string()}});
    }

    logger.flush();
    return rc;
}
