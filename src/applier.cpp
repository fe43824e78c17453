#include "displaysnap/applier.hpp"

#include "displaysnap/logging.hpp"
#include "displaysnap/matching.hpp"

#include <algorithm>
#include <iterator>

namespace displaysnap {

    namespace {

        constexpr std::string_view kContext = "apply";

        bool changes_topology(OperationKind kind) {
            return kind == OperationKind::kDisable || kind == OperationKind::kEnable;
        }

        bool retryable(const StepOutcome& step) {
            return step.status == StepStatus::kFailed && (step.operation.kind == OperationKind::kEnable || step.operation.kind == OperationKind::kReposition);
        }

        std::vector<std::string> other_paths(const std::vector<std::string>& plan_paths, const std::string& own) {
            std::vector<std::string> paths;
            std::ranges::copy_if(plan_paths, std::back_inserter(paths), [&](const std::string& path) { return path != own; });
            return paths;
        }

        std::string describe(const Operation& operation) {
            return std::string(operation_kind_name(operation.kind)) + " " + operation.identity.path;
        }

    } // namespace

    std::size_t ApplyReport::count(StepStatus status) const {
        return static_cast<std::size_t>(std::ranges::count(steps, status, &StepOutcome::status));
    }

    std::string_view step_status_name(StepStatus status) {
        switch (status) {
            case StepStatus::kSucceeded: return "succeeded";
            case StepStatus::kFailed: return "failed";
            case StepStatus::kSkipped: return "skipped";
        }
        return "unknown";
    }

    ConfigurationApplier::ConfigurationApplier(DisplayBackend& backend, DisplayEnumerator& enumerator, ApplierOptions options) :
        backend_(backend), enumerator_(enumerator), options_(options) {}

    ApplyReport ConfigurationApplier::apply(const ReconciliationPlan& plan) {
        ApplyReport report{.profile_name = plan.profile_name, .steps = {}, .warnings = plan.warnings};
        live_.reset();

        std::vector<std::string> plan_paths;
        for (const auto& operation : plan.operations) {
            if (std::ranges::find(plan_paths, operation.identity.path) == plan_paths.end()) {
                plan_paths.push_back(operation.identity.path);
            }
        }

        report.steps.reserve(plan.operations.size());
        for (std::size_t index = 0; index < plan.operations.size(); ++index) {
            const bool refresh = index > 0 && changes_topology(plan.operations[index - 1].kind);
            report.steps.push_back(StepOutcome{.operation = plan.operations[index]});
            run_step(report.steps.back(), plan_paths, refresh);
        }

        if (!options_.retry_failed) {
            return report;
        }
        bool                         first = true;
        std::optional<OperationKind> previous;
        for (auto& step : report.steps) {
            if (!retryable(step)) {
                continue;
            }
            debug_log(options_.debug_logging, kContext, "retrying " + describe(step.operation));
            const bool refresh = first || (previous && changes_topology(*previous));
            run_step(step, plan_paths, refresh);
            first    = false;
            previous = step.operation.kind;
        }
        return report;
    }

    void ConfigurationApplier::run_step(StepOutcome& step, const std::vector<std::string>& plan_paths, bool refresh) {
        const auto& operation = step.operation;
        ++step.attempts;
        step.reason.clear();

        if (refresh) {
            auto fresh = enumerator_.enumerate();
            if (!fresh) {
                live_.reset();
                step.status = StepStatus::kFailed;
                step.reason = "re-enumeration failed: " + fresh.error().message;
                return;
            }
            live_ = std::move(*fresh);
        }

        DisplayIdentity identity = operation.identity;
        if (live_) {
            const auto match = resolve_display(operation.expected, *live_, other_paths(plan_paths, operation.identity.path));
            if (!match) {
                step.status = StepStatus::kSkipped;
                step.reason = operation.identity.path + " is no longer connected";
                debug_log(options_.debug_logging, kContext, "skipping " + describe(operation) + ": " + step.reason);
                return;
            }
            identity = (*live_)[match->live_index].identity;
            if (identity.path != operation.identity.path) {
                step.resolved_identity = identity;
                debug_log(options_.debug_logging, kContext, operation.identity.path + " re-enumerated as " + identity.path);
            }
        }

        const DisplayRequest request{
            .identity   = identity,
            .enabled    = operation.kind != OperationKind::kDisable,
            .resolution = operation.resolution,
            .refresh_hz = operation.refresh_hz,
            .position   = operation.position,
            .is_primary = operation.kind == OperationKind::kSetPrimary,
        };
        debug_log(options_.debug_logging, kContext, describe(operation));
        const auto result = backend_.set_display_state(request);
        if (!result) {
            step.status = StepStatus::kFailed;
            step.reason = format_backend_error(result.error());
            return;
        }
        step.status = StepStatus::kSucceeded;
    }

} // namespace displaysnap
