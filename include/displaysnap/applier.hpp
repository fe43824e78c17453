#ifndef DISPLAYSNAP_APPLIER_HPP
#define DISPLAYSNAP_APPLIER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "displaysnap/display_backend.hpp"
#include "displaysnap/enumerator.hpp"
#include "displaysnap/reconcile.hpp"

namespace displaysnap {

    enum class StepStatus {
        kSucceeded,
        kFailed,
        kSkipped,
    };

    struct StepOutcome {
        Operation                      operation;
        StepStatus                     status   = StepStatus::kSucceeded;
        std::string                    reason   = {};
        int                            attempts = 0;
        std::optional<DisplayIdentity> resolved_identity = std::nullopt;
    };

    struct ApplyReport {
        std::string              profile_name;
        std::vector<StepOutcome> steps;
        std::vector<PlanWarning> warnings;
        // Best-effort follow-up problems that do not fail the apply.
        std::vector<std::string> notes = {};

        std::size_t              count(StepStatus status) const;
        bool                     success() const {
            return count(StepStatus::kFailed) == 0;
        }
    };

    struct ApplierOptions {
        bool retry_failed  = true;
        bool debug_logging = false;
    };

    std::string_view step_status_name(StepStatus status);

    // Runs a plan strictly in order. Failed steps never stop the plan; failed enables and repositions get one
    // more attempt once the plan has finished.
    class ConfigurationApplier {
      public:
        ConfigurationApplier(DisplayBackend& backend, DisplayEnumerator& enumerator, ApplierOptions options);

        ApplyReport apply(const ReconciliationPlan& plan);

      private:
        void                     run_step(StepOutcome& step, const std::vector<std::string>& plan_paths, bool refresh);

        DisplayBackend&          backend_;
        DisplayEnumerator&       enumerator_;
        ApplierOptions           options_;
        std::optional<LiveState> live_;
    };

} // namespace displaysnap

#endif // DISPLAYSNAP_APPLIER_HPP
