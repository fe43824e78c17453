#include "displaysnap/report.hpp"

#include "displaysnap/notifications.hpp"

#include <sstream>

#include <nlohmann/json.hpp>

namespace displaysnap {

    namespace {

        std::string mode_label(Resolution resolution, int refresh_hz) {
            return std::to_string(resolution.width) + "x" + std::to_string(resolution.height) + "@" + std::to_string(refresh_hz);
        }

        std::string position_label(Position position) {
            return "+" + std::to_string(position.x) + "+" + std::to_string(position.y);
        }

        nlohmann::json display_json(const DisplayState& display) {
            nlohmann::json entry{
                {"path", display.identity.path},
                {"ordinal", display.identity.ordinal},
                {"enabled", display.enabled},
                {"width", display.resolution.width},
                {"height", display.resolution.height},
                {"refresh_hz", display.refresh_hz},
                {"x", display.position.x},
                {"y", display.position.y},
                {"primary", display.is_primary},
                {"scale", display.scale},
                {"transform", display.transform},
            };
            entry["description"] = display.description ? nlohmann::json(*display.description) : nlohmann::json(nullptr);
            return entry;
        }

        nlohmann::json operation_json(const Operation& operation) {
            nlohmann::json entry{
                {"kind", std::string(operation_kind_name(operation.kind))},
                {"display", operation.identity.path},
                {"target", operation.target_identity.path},
            };
            if (operation.kind != OperationKind::kDisable) {
                entry["width"]      = operation.resolution.width;
                entry["height"]     = operation.resolution.height;
                entry["refresh_hz"] = operation.refresh_hz;
                entry["x"]          = operation.position.x;
                entry["y"]          = operation.position.y;
            }
            return entry;
        }

        nlohmann::json warnings_json(const std::vector<PlanWarning>& warnings) {
            nlohmann::json list = nlohmann::json::array();
            for (const auto& warning : warnings) {
                list.push_back(nlohmann::json{{"kind", std::string(warning_kind_name(warning.kind))}, {"message", warning.message}, {"displays", warning.paths}});
            }
            return list;
        }

        void render_warnings(std::ostringstream& output, const std::vector<PlanWarning>& warnings) {
            for (const auto& warning : warnings) {
                output << "warning: " << warning.message << "\n";
            }
        }

    } // namespace

    std::string describe_display(const DisplayState& display) {
        std::string text = display.identity.path;
        if (!display.enabled) {
            return text + " disabled";
        }
        text += " " + mode_label(display.resolution, display.refresh_hz) + " " + position_label(display.position);
        if (display.is_primary) {
            text += " primary";
        }
        return text;
    }

    std::string describe_operation(const Operation& operation) {
        const auto& path = operation.identity.path;
        switch (operation.kind) {
            case OperationKind::kDisable: return "disable " + path;
            case OperationKind::kEnable: return "enable " + path + " " + mode_label(operation.resolution, operation.refresh_hz) + " " + position_label(operation.position);
            case OperationKind::kReposition:
                return "reposition " + path + " " + mode_label(operation.resolution, operation.refresh_hz) + " " + position_label(operation.position);
            case OperationKind::kSetPrimary: return "set primary " + path;
        }
        return path;
    }

    std::string render_displays(const std::vector<DisplayState>& displays) {
        if (displays.empty()) {
            return "No displays found\n";
        }
        std::ostringstream output;
        for (const auto& display : displays) {
            output << display.identity.ordinal << ": " << describe_display(display);
            if (display.description) {
                output << " (" << *display.description << ")";
            }
            output << "\n";
        }
        return output.str();
    }

    std::string render_displays_json(const std::vector<DisplayState>& displays) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& display : displays) {
            list.push_back(display_json(display));
        }
        return nlohmann::json{{"displays", list}}.dump();
    }

    std::string render_profile_list(const std::vector<Profile>& profiles) {
        if (profiles.empty()) {
            return "No saved profiles\n";
        }
        std::ostringstream output;
        for (size_t i = 0; i < profiles.size(); ++i) {
            const auto& profile = profiles[i];
            size_t      enabled = 0;
            for (const auto& display : profile.displays) {
                enabled += display.enabled ? 1 : 0;
            }
            output << (i + 1) << ". " << profile.name << " (" << enabled << " of " << profile.displays.size() << " displays enabled)\n";
        }
        return output.str();
    }

    std::string render_profile_list_json(const std::vector<Profile>& profiles) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& profile : profiles) {
            list.push_back(nlohmann::json{{"name", profile.name}, {"displays", profile.displays.size()}, {"updated_at", profile.updated_at}});
        }
        return nlohmann::json{{"profiles", list}}.dump();
    }

    std::string render_profile(const Profile& profile) {
        std::ostringstream output;
        output << "Profile: " << profile.name << "\n";
        if (!profile.created_at.empty()) {
            output << "Created: " << profile.created_at << "\n";
        }
        if (!profile.updated_at.empty()) {
            output << "Updated: " << profile.updated_at << "\n";
        }
        for (const auto& display : profile.displays) {
            output << "  " << describe_display(display) << "\n";
        }
        return output.str();
    }

    std::string render_profile_json(const Profile& profile) {
        nlohmann::json displays = nlohmann::json::array();
        for (const auto& display : profile.displays) {
            displays.push_back(display_json(display));
        }
        return nlohmann::json{
            {"name", profile.name},
            {"created_at", profile.created_at},
            {"updated_at", profile.updated_at},
            {"displays", displays},
        }
            .dump();
    }

    std::string render_plan(const ReconciliationPlan& plan) {
        std::ostringstream output;
        output << "Plan for " << plan.profile_name << ":\n";
        if (plan.operations.empty()) {
            output << "  (no changes)\n";
        }
        for (size_t i = 0; i < plan.operations.size(); ++i) {
            output << "  " << (i + 1) << ". " << describe_operation(plan.operations[i]) << "\n";
        }
        render_warnings(output, plan.warnings);
        return output.str();
    }

    std::string render_plan_json(const ReconciliationPlan& plan) {
        nlohmann::json operations = nlohmann::json::array();
        for (const auto& operation : plan.operations) {
            operations.push_back(operation_json(operation));
        }
        return nlohmann::json{{"profile", plan.profile_name}, {"operations", operations}, {"warnings", warnings_json(plan.warnings)}}.dump();
    }

    std::string render_apply_report(const ApplyReport& report) {
        std::ostringstream output;
        output << apply_headline(report) << "\n";
        for (const auto& step : report.steps) {
            output << "  [" << step_status_name(step.status) << "] " << describe_operation(step.operation);
            if (step.resolved_identity) {
                output << " (now " << step.resolved_identity->path << ")";
            }
            if (!step.reason.empty()) {
                output << ": " << step.reason;
            }
            if (step.attempts > 1) {
                output << " after " << step.attempts << " attempts";
            }
            output << "\n";
        }
        render_warnings(output, report.warnings);
        for (const auto& note : report.notes) {
            output << "note: " << note << "\n";
        }
        return output.str();
    }

    std::string render_apply_report_json(const ApplyReport& report) {
        const auto     summary = summarize_report(report);
        nlohmann::json steps   = nlohmann::json::array();
        for (const auto& step : report.steps) {
            auto entry        = operation_json(step.operation);
            entry["status"]   = std::string(step_status_name(step.status));
            entry["attempts"] = step.attempts;
            if (!step.reason.empty()) {
                entry["reason"] = step.reason;
            }
            if (step.resolved_identity) {
                entry["resolved"] = step.resolved_identity->path;
            }
            steps.push_back(std::move(entry));
        }
        return nlohmann::json{
            {"profile", report.profile_name},
            {"success", report.success()},
            {"applied", summary.applied},
            {"disabled", summary.disabled},
            {"skipped", summary.skipped},
            {"failed", summary.failed},
            {"steps", steps},
            {"warnings", warnings_json(report.warnings)},
            {"notes", report.notes},
        }
            .dump();
    }

} // namespace displaysnap
