#include "displaysnap/workspace_keeper.hpp"

#include "displaysnap/json_utils.hpp"
#include "displaysnap/logging.hpp"

#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace displaysnap {

    namespace {

        constexpr std::string_view kContext = "workspaces";

        std::expected<std::vector<WorkspacePlacement>, std::string> load_cache(const std::filesystem::path& path) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) {
                if (ec) {
                    return std::unexpected("failed to read " + path.string());
                }
                return std::vector<WorkspacePlacement>{};
            }
            std::ifstream input(path);
            if (!input.good()) {
                return std::unexpected("failed to read " + path.string());
            }
            std::ostringstream buffer;
            buffer << input.rdbuf();
            return parse_placements_json(buffer.str());
        }

        std::optional<std::string> store_cache(const std::filesystem::path& path, const std::vector<WorkspacePlacement>& placements) {
            std::error_code ec;
            if (placements.empty()) {
                std::filesystem::remove(path, ec);
                return ec ? std::optional<std::string>("failed to remove " + path.string()) : std::nullopt;
            }
            if (const auto parent = path.parent_path(); !parent.empty()) {
                std::filesystem::create_directories(parent, ec);
                if (ec) {
                    return "failed to create " + parent.string();
                }
            }
            auto temp = path;
            temp += ".tmp";
            {
                std::ofstream output(temp, std::ios::trunc);
                output << render_placements_json(placements);
                output.flush();
                if (!output.good()) {
                    return "failed to write " + temp.string();
                }
            }
            std::filesystem::rename(temp, path, ec);
            if (ec) {
                std::filesystem::remove(temp, ec);
                return "failed to replace " + path.string();
            }
            return std::nullopt;
        }

        std::string note(std::string message) {
            error_log(kContext, message);
            return message;
        }

        // Step that brought back the display a workspace was recorded on, matched by its old or planned path.
        const StepOutcome* enabling_step(const std::vector<const StepOutcome*>& enabled, std::string_view monitor) {
            const auto it = std::ranges::find_if(enabled, [&](const StepOutcome* step) {
                return step->operation.identity.path == monitor || step->operation.target_identity.path == monitor;
            });
            return it == enabled.end() ? nullptr : *it;
        }

    } // namespace

    std::expected<std::vector<WorkspacePlacement>, std::string> parse_placements_json(std::string_view text) {
        const auto root = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
        if (root.is_discarded() || !root.is_object()) {
            return std::unexpected(std::string("invalid workspace cache"));
        }
        const auto entries = root.value("workspaces", nlohmann::json::array());
        if (!entries.is_array()) {
            return std::unexpected(std::string("invalid workspace cache"));
        }
        std::vector<WorkspacePlacement> placements;
        placements.reserve(entries.size());
        for (const auto& entry : entries) {
            if (!entry.is_object()) {
                return std::unexpected(std::string("invalid workspace cache entry"));
            }
            const auto id      = optional_int_field(entry, "id");
            const auto monitor = optional_string_field(entry, "monitor");
            if (!id || !monitor) {
                return std::unexpected(std::string("invalid workspace cache entry"));
            }
            placements.push_back(WorkspacePlacement{
                .id      = *id,
                .name    = optional_string_field(entry, "name").value_or(std::to_string(*id)),
                .monitor = *monitor,
            });
        }
        return placements;
    }

    std::string render_placements_json(const std::vector<WorkspacePlacement>& placements) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& placement : placements) {
            entries.push_back({{"id", placement.id}, {"name", placement.name}, {"monitor", placement.monitor}});
        }
        return nlohmann::json{{"workspaces", entries}}.dump(2);
    }

    WorkspaceKeeper::WorkspaceKeeper(WorkspaceBackend& backend, std::filesystem::path cache_path, bool debug_logging) :
        backend_(backend), cache_path_(std::move(cache_path)), debug_logging_(debug_logging) {}

    std::vector<std::string> WorkspaceKeeper::remember(const ReconciliationPlan& plan) {
        std::vector<std::string> leaving;
        for (const auto& operation : plan.operations) {
            if (operation.kind == OperationKind::kDisable) {
                leaving.push_back(operation.identity.path);
            }
        }
        if (leaving.empty()) {
            return {};
        }

        const auto current = backend_.list_workspaces();
        if (!current) {
            return {note("could not record workspace placement: " + format_backend_error(current.error()))};
        }
        auto cached = load_cache(cache_path_);
        if (!cached) {
            debug_log(debug_logging_, kContext, cached.error() + "; starting a new cache");
            cached = std::vector<WorkspacePlacement>{};
        }

        for (const auto& workspace : *current) {
            if (workspace.id <= 0 || std::ranges::find(leaving, workspace.monitor) == leaving.end()) {
                continue;
            }
            std::erase_if(*cached, [&](const WorkspacePlacement& placement) { return placement.id == workspace.id; });
            cached->push_back(workspace);
            debug_log(debug_logging_, kContext, "workspace " + workspace.name + " belongs on " + workspace.monitor);
        }

        if (const auto error = store_cache(cache_path_, *cached)) {
            return {note(*error)};
        }
        return {};
    }

    std::vector<std::string> WorkspaceKeeper::restore(const ApplyReport& report) {
        std::vector<const StepOutcome*> enabled;
        for (const auto& step : report.steps) {
            if (step.operation.kind == OperationKind::kEnable && step.status == StepStatus::kSucceeded) {
                enabled.push_back(&step);
            }
        }
        if (enabled.empty()) {
            return {};
        }

        const auto cached = load_cache(cache_path_);
        if (!cached) {
            return {note(cached.error())};
        }
        if (cached->empty()) {
            return {};
        }
        const auto current = backend_.list_workspaces();
        if (!current) {
            return {note("could not restore workspaces: " + format_backend_error(current.error()))};
        }

        std::vector<std::string>        notes;
        std::vector<WorkspacePlacement> remaining;
        for (const auto& placement : *cached) {
            const auto* step = enabling_step(enabled, placement.monitor);
            if (!step) {
                remaining.push_back(placement);
                continue;
            }
            const auto  destination = step->resolved_identity.value_or(step->operation.identity).path;
            const auto  live        = std::ranges::find_if(*current, [&](const WorkspacePlacement& workspace) { return workspace.id == placement.id; });
            if (live == current->end()) {
                debug_log(debug_logging_, kContext, "workspace " + placement.name + " no longer exists");
                continue;
            }
            if (live->monitor == destination) {
                continue;
            }
            const auto moved = backend_.move_workspace(placement.id, destination);
            if (!moved) {
                notes.push_back(note("workspace " + placement.name + " not moved to " + destination + ": " + format_backend_error(moved.error())));
                remaining.push_back(placement);
                continue;
            }
            debug_log(debug_logging_, kContext, "workspace " + placement.name + " moved back to " + destination);
        }

        if (const auto error = store_cache(cache_path_, remaining)) {
            notes.push_back(note(*error));
        }
        return notes;
    }

} // namespace displaysnap
