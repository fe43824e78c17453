#include "displaysnap/notifications.hpp"

namespace displaysnap {

    namespace {

        std::string_view action_label(ProfileAction action) {
            switch (action) {
                case ProfileAction::kSave: return "save";
                case ProfileAction::kApply: return "apply";
            }
            return "action";
        }

        std::string_view action_verb(ProfileAction action) {
            switch (action) {
                case ProfileAction::kSave: return "saved";
                case ProfileAction::kApply: return "applied";
            }
            return "completed";
        }

        void append_count(std::string& message, std::size_t count, std::string_view label, bool& first) {
            if (count == 0) {
                return;
            }
            message += first ? "(" : ", ";
            message += std::to_string(count);
            message += " ";
            message += label;
            first = false;
        }

    } // namespace

    ApplySummary summarize_report(const ApplyReport& report) {
        ApplySummary summary;
        for (const auto& step : report.steps) {
            switch (step.status) {
                case StepStatus::kSucceeded:
                    if (step.operation.kind == OperationKind::kDisable) {
                        ++summary.disabled;
                    } else {
                        ++summary.applied;
                    }
                    break;
                case StepStatus::kSkipped: ++summary.skipped; break;
                case StepStatus::kFailed: ++summary.failed; break;
            }
        }
        return summary;
    }

    std::string profile_notification_text(ProfileAction action, bool success, std::string_view profile, std::string_view detail) {
        std::string message = "Profile '";
        message += profile;
        message += "' ";
        if (!success) {
            message += action_label(action);
            message += " failed";
            if (!detail.empty()) {
                message += ": ";
                message += detail;
            }
            return message;
        }
        message += action_verb(action);
        if (!detail.empty()) {
            message += " ";
            message += detail;
        }
        return message;
    }

    std::string apply_headline(const ApplyReport& report) {
        const auto summary = summarize_report(report);
        if (summary.failed > 0) {
            const auto detail = std::to_string(summary.failed) + " of " + std::to_string(report.steps.size()) + " steps failed";
            return profile_notification_text(ProfileAction::kApply, false, report.profile_name, detail);
        }
        if (report.steps.empty()) {
            return profile_notification_text(ProfileAction::kApply, true, report.profile_name, "(already up to date)");
        }
        std::string detail;
        bool        first = true;
        append_count(detail, summary.applied, "applied", first);
        append_count(detail, summary.disabled, "disabled", first);
        append_count(detail, summary.skipped, "skipped", first);
        if (!first) {
            detail += ")";
        }
        return profile_notification_text(ProfileAction::kApply, true, report.profile_name, detail);
    }

} // namespace displaysnap
