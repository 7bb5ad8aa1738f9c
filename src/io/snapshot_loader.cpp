/**
 * @file snapshot_loader.cpp
 * @brief Snapshot (de)serialization with toml++.
 */

#include "io/snapshot_loader.hpp"

#include "core/date.hpp"

#include <toml++/toml.hpp>

#include <fstream>
#include <limits>
#include <sstream>

namespace gantt_engine {

namespace {

using NodeView = toml::node_view<const toml::node>;

Error parse_error(const std::string& where, const std::string& what) {
    return Error{ErrorCode::ParseError, where + ": " + what};
}

Result<std::optional<Date>> read_date(NodeView node, const std::string& where) {
    if (!node) return std::optional<Date>{};

    if (auto d = node.value<toml::date>()) {
        if (auto date = make_date(d->year, d->month, d->day)) return std::optional<Date>{date};
    } else if (auto text = node.value<std::string>()) {
        if (auto date = parse_date(*text)) return std::optional<Date>{date};
    }
    return parse_error(where, "invalid date");
}

Result<std::string> read_id(NodeView node, const std::string& where) {
    auto id = node.value<std::string>();
    if (!id || id->empty()) return parse_error(where, "missing id");
    return *id;
}

/// Integer field that has to fit an int32_t; absent reads as 0.
Result<int32_t> read_int32(NodeView node, const std::string& where) {
    if (!node) return int32_t{0};
    auto value = node.value<int64_t>();
    if (!value) return parse_error(where, "expected an integer");
    if (*value < std::numeric_limits<int32_t>::min() || *value > std::numeric_limits<int32_t>::max()) {
        return parse_error(where, "out of range " + std::to_string(*value));
    }
    return static_cast<int32_t>(*value);
}

toml::date to_toml(Date date) {
    const std::chrono::year_month_day ymd{date};
    return toml::date{static_cast<int>(ymd.year()),
                      static_cast<unsigned>(ymd.month()),
                      static_cast<unsigned>(ymd.day())};
}

Result<Task> read_task(const toml::table& tbl, uint64_t creation_index) {
    const std::string where = "tasks[" + std::to_string(creation_index) + "]";

    auto id = read_id(tbl["id"], where);
    if (!id) return id.error();

    Task task;
    task.id = std::move(*id);
    task.name = tbl["name"].value_or(task.id);
    task.sort_order = tbl["sort_order"].value_or(0.0);
    task.creation_index = creation_index;

    auto start = read_date(tbl["start_date"], where + ".start_date");
    if (!start) return start.error();
    task.start_date = *start;

    auto due = read_date(tbl["due_date"], where + ".due_date");
    if (!due) return due.error();
    task.due_date = *due;

    const auto status_text = tbl["status"].value_or(std::string{"Open"});
    auto status = parse_task_status(status_text);
    if (!status) return parse_error(where, "unknown status " + status_text);
    task.status = *status;

    task.task_group = tbl["task_group"].value_or(std::string{});
    task.depends_on_group = tbl["depends_on_group"].value_or(std::string{});

    const auto type_text = tbl["scheduling_type"].value_or(std::string{"Fixed Duration"});
    auto type = parse_scheduling_type(type_text);
    if (!type) return parse_error(where, "unknown scheduling type " + type_text);
    task.scheduling_type = *type;

    auto buffer_size = read_int32(tbl["buffer_size"], where + ".buffer_size");
    if (!buffer_size) return buffer_size.error();
    if (*buffer_size < 0) return parse_error(where, "buffer_size must not be negative");
    task.buffer_size = *buffer_size;

    return task;
}

Result<Milestone> read_milestone(const toml::table& tbl, uint64_t creation_index) {
    const std::string where = "milestones[" + std::to_string(creation_index) + "]";

    auto id = read_id(tbl["id"], where);
    if (!id) return id.error();

    Milestone milestone;
    milestone.id = std::move(*id);
    milestone.name = tbl["name"].value_or(milestone.id);
    milestone.sort_order = tbl["sort_order"].value_or(0.0);
    milestone.creation_index = creation_index;

    auto due = read_date(tbl["due_date"], where + ".due_date");
    if (!due) return due.error();
    milestone.due_date = *due;

    return milestone;
}

Result<Dependency> read_dependency(const toml::table& tbl, size_t index) {
    const std::string where = "dependencies[" + std::to_string(index) + "]";

    auto task = tbl["task"].value<std::string>();
    auto depends_on = tbl["depends_on"].value<std::string>();
    if (!task || !depends_on) return parse_error(where, "task and depends_on are required");

    const auto type_text = tbl["type"].value_or(std::string{"FS"});
    auto type = parse_dependency_type(type_text);
    if (!type) return parse_error(where, "unknown dependency type " + type_text);

    auto lag = read_int32(tbl["lag_days"], where + ".lag_days");
    if (!lag) return lag.error();

    return Dependency{
        .task = *task,
        .depends_on = *depends_on,
        .type = *type,
        .lag_days = *lag,
    };
}

Result<GraphSnapshot> from_table(const toml::table& root, const SchedulingConfig& defaults) {
    GraphSnapshot snapshot;

    const auto* project = root["project"].as_table();
    if (!project) return parse_error("project", "missing [project] table");

    auto id = read_id((*project)["id"], "project");
    if (!id) return id.error();
    snapshot.project_id = std::move(*id);

    auto start = read_date((*project)["start_date"], "project.start_date");
    if (!start) return start.error();
    snapshot.start_date = *start;

    snapshot.dependency_mode = defaults.default_dependency_mode;
    if (auto mode_text = (*project)["dependency_mode"].value<std::string>()) {
        auto mode = parse_dependency_mode(*mode_text);
        if (!mode) return parse_error("project", "unknown dependency mode " + *mode_text);
        snapshot.dependency_mode = *mode;
    }

    uint64_t creation_index = 0;

    if (const auto* tasks = root["tasks"].as_array()) {
        for (const auto& node : *tasks) {
            const auto* tbl = node.as_table();
            if (!tbl) return parse_error("tasks", "entries must be tables");
            auto task = read_task(*tbl, creation_index++);
            if (!task) return task.error();
            snapshot.tasks.push_back(std::move(*task));
        }
    }

    if (const auto* milestones = root["milestones"].as_array()) {
        for (const auto& node : *milestones) {
            const auto* tbl = node.as_table();
            if (!tbl) return parse_error("milestones", "entries must be tables");
            auto milestone = read_milestone(*tbl, creation_index++);
            if (!milestone) return milestone.error();
            snapshot.milestones.push_back(std::move(*milestone));
        }
    }

    if (const auto* deps = root["dependencies"].as_array()) {
        for (size_t i = 0; i < deps->size(); ++i) {
            const auto* tbl = (*deps)[i].as_table();
            if (!tbl) return parse_error("dependencies", "entries must be tables");
            auto dep = read_dependency(*tbl, i);
            if (!dep) return dep.error();
            snapshot.dependencies.push_back(std::move(*dep));
        }
    }

    return snapshot;
}

}  // anonymous namespace

Result<GraphSnapshot> load_snapshot(const std::filesystem::path& path,
                                    const SchedulingConfig& defaults) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ParseError, "Snapshot file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl, defaults);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<GraphSnapshot> parse_snapshot(std::string_view toml_text, const SchedulingConfig& defaults) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl, defaults);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

std::string format_snapshot(const GraphSnapshot& snapshot) {
    toml::table project{
        {"id", snapshot.project_id},
        {"dependency_mode", std::string(to_string(snapshot.dependency_mode))},
    };
    if (snapshot.start_date) project.insert("start_date", to_toml(*snapshot.start_date));

    // Creation order is file order, so write items back in that order.
    auto tasks_in_order = snapshot.tasks;
    std::ranges::stable_sort(tasks_in_order, {}, &Task::creation_index);
    auto milestones_in_order = snapshot.milestones;
    std::ranges::stable_sort(milestones_in_order, {}, &Milestone::creation_index);

    toml::array tasks;
    for (const auto& task : tasks_in_order) {
        toml::table entry{
            {"id", task.id},
            {"name", task.name},
            {"status", std::string(to_string(task.status))},
            {"sort_order", task.sort_order},
        };
        if (task.start_date) entry.insert("start_date", to_toml(*task.start_date));
        if (task.due_date) entry.insert("due_date", to_toml(*task.due_date));
        if (!task.task_group.empty()) entry.insert("task_group", task.task_group);
        if (!task.depends_on_group.empty()) entry.insert("depends_on_group", task.depends_on_group);
        if (task.scheduling_type != SchedulingType::FixedDuration) {
            entry.insert("scheduling_type", std::string(to_string(task.scheduling_type)));
        }
        if (task.buffer_size != 0) entry.insert("buffer_size", static_cast<int64_t>(task.buffer_size));
        tasks.push_back(std::move(entry));
    }

    toml::array milestones;
    for (const auto& milestone : milestones_in_order) {
        toml::table entry{
            {"id", milestone.id},
            {"name", milestone.name},
            {"sort_order", milestone.sort_order},
        };
        if (milestone.due_date) entry.insert("due_date", to_toml(*milestone.due_date));
        milestones.push_back(std::move(entry));
    }

    toml::array dependencies;
    for (const auto& dep : snapshot.dependencies) {
        dependencies.push_back(toml::table{
            {"task", dep.task},
            {"depends_on", dep.depends_on},
            {"type", std::string(short_code(dep.type))},
            {"lag_days", static_cast<int64_t>(dep.lag_days)},
        });
    }

    toml::table root{{"project", std::move(project)}};
    if (!tasks.empty()) root.insert("tasks", std::move(tasks));
    if (!milestones.empty()) root.insert("milestones", std::move(milestones));
    if (!dependencies.empty()) root.insert("dependencies", std::move(dependencies));

    std::ostringstream out;
    out << root << '\n';
    return out.str();
}

Result<void> save_snapshot(const GraphSnapshot& snapshot, const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return Error{ErrorCode::StoreFailure, "Cannot open " + path.string() + " for writing"};
    }
    file << format_snapshot(snapshot);
    file.flush();
    if (!file) {
        return Error{ErrorCode::StoreFailure, "Failed writing " + path.string()};
    }
    return {};
}

}  // namespace gantt_engine
