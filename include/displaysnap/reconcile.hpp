#ifndef DISPLAYSNAP_RECONCILE_HPP
#define DISPLAYSNAP_RECONCILE_HPP

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "displaysnap/profile.hpp"
#include "displaysnap/types.hpp"

namespace displaysnap {

    enum class OperationKind {
        kDisable,
        kEnable,
        kReposition,
        kSetPrimary,
    };

    struct Operation {
        OperationKind   kind;
        DisplayIdentity identity;
        DisplayIdentity target_identity;
        Resolution      resolution = {};
        int             refresh_hz = 0;
        Position        position   = {};
        // Live state of the display when the plan was built.
        DisplayState    expected = {};

        bool            operator==(const Operation&) const = default;
    };

    enum class WarningKind {
        kTargetNotFound,
        kIdentityDrift,
        kOverlap,
        kPrimaryDisabled,
    };

    struct PlanWarning {
        WarningKind              kind;
        std::string              message;
        std::vector<std::string> paths = {};
    };

    struct ReconciliationPlan {
        std::string              profile_name;
        std::vector<Operation>   operations;
        std::vector<PlanWarning> warnings;

        bool                     empty() const {
            return operations.empty();
        }
    };

    struct PlanError {
        std::string message;
    };

    std::string_view                              operation_kind_name(OperationKind kind);
    std::string_view                              warning_kind_name(WarningKind kind);

    // Layout-space extent of a mode: pixels divided by scale, swapped for 90 and 270 degree transforms.
    Resolution                                    logical_size(const Resolution& resolution, double scale, int transform);

    // Builds the ordered plan that moves the live layout toward the profile: disables first, then enables in
    // profile order, then geometry changes and the primary switch. Fails when every active display would be
    // disabled.
    std::expected<ReconciliationPlan, PlanError> reconcile(const std::vector<DisplayState>& live, const Profile& profile, bool auto_disable_extras);

} // namespace displaysnap

#endif // DISPLAYSNAP_RECONCILE_HPP
