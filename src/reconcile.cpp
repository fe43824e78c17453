#include "displaysnap/reconcile.hpp"

#include "displaysnap/matching.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>

namespace displaysnap {

    namespace {

        struct Projected {
            std::string path;
            bool        enabled;
            Resolution  resolution;
            Position    position;
            double      scale;
            int         transform;
        };

        bool same_geometry(const DisplayState& live, const DisplayState& target) {
            return live.resolution == target.resolution && live.refresh_hz == target.refresh_hz && live.position == target.position;
        }

        Operation make_operation(OperationKind kind, const DisplayState& live, const DisplayState& target) {
            return Operation{
                .kind            = kind,
                .identity        = live.identity,
                .target_identity = target.identity,
                .resolution      = target.resolution,
                .refresh_hz      = target.refresh_hz,
                .position        = target.position,
                .expected        = live,
            };
        }

        bool overlaps(const Projected& lhs, const Projected& rhs) {
            const auto      lhs_size = logical_size(lhs.resolution, lhs.scale, lhs.transform);
            const auto      rhs_size = logical_size(rhs.resolution, rhs.scale, rhs.transform);
            const long long left     = std::max(lhs.position.x, rhs.position.x);
            const long long right    = std::min<long long>(static_cast<long long>(lhs.position.x) + lhs_size.width, static_cast<long long>(rhs.position.x) + rhs_size.width);
            const long long top      = std::max(lhs.position.y, rhs.position.y);
            const long long bottom   = std::min<long long>(static_cast<long long>(lhs.position.y) + lhs_size.height, static_cast<long long>(rhs.position.y) + rhs_size.height);
            return left < right && top < bottom;
        }

        void add_overlap_warnings(const std::vector<Projected>& layout, std::vector<PlanWarning>& warnings) {
            for (std::size_t i = 0; i < layout.size(); ++i) {
                if (!layout[i].enabled) {
                    continue;
                }
                for (std::size_t j = i + 1; j < layout.size(); ++j) {
                    if (!layout[j].enabled || !overlaps(layout[i], layout[j])) {
                        continue;
                    }
                    warnings.push_back(PlanWarning{
                        .kind    = WarningKind::kOverlap,
                        .message = layout[i].path + " overlaps " + layout[j].path,
                        .paths   = {layout[i].path, layout[j].path},
                    });
                }
            }
        }

    } // namespace

    Resolution logical_size(const Resolution& resolution, double scale, int transform) {
        const double divisor = scale > 0.0 ? scale : 1.0;
        Resolution   size{
            .width  = static_cast<int>(std::lround(resolution.width / divisor)),
            .height = static_cast<int>(std::lround(resolution.height / divisor)),
        };
        if (transform % 2 != 0) {
            std::swap(size.width, size.height);
        }
        return size;
    }

    std::string_view operation_kind_name(OperationKind kind) {
        switch (kind) {
            case OperationKind::kDisable: return "disable";
            case OperationKind::kEnable: return "enable";
            case OperationKind::kReposition: return "reposition";
            case OperationKind::kSetPrimary: return "set_primary";
        }
        return "unknown";
    }

    std::string_view warning_kind_name(WarningKind kind) {
        switch (kind) {
            case WarningKind::kTargetNotFound: return "target_not_found";
            case WarningKind::kIdentityDrift: return "identity_drift";
            case WarningKind::kOverlap: return "overlap";
            case WarningKind::kPrimaryDisabled: return "primary_disabled";
        }
        return "unknown";
    }

    std::expected<ReconciliationPlan, PlanError> reconcile(const std::vector<DisplayState>& live, const Profile& profile, bool auto_disable_extras) {
        const auto&        targets = profile.displays;
        const auto         matched = match_displays(targets, live);
        ReconciliationPlan plan{.profile_name = profile.name, .operations = {}, .warnings = {}};

        for (const auto index : matched.unmatched_targets) {
            const auto& path = targets[index].identity.path;
            plan.warnings.push_back(PlanWarning{.kind = WarningKind::kTargetNotFound, .message = path + " not found", .paths = {path}});
        }
        for (const auto& match : matched.matches) {
            if (match.stage == MatchStage::kExact) {
                continue;
            }
            const auto& target = targets[match.target_index].identity.path;
            const auto& found  = live[match.live_index].identity.path;
            plan.warnings.push_back(PlanWarning{
                .kind    = WarningKind::kIdentityDrift,
                .message = target + " matched to " + found + " by " + std::string(match_stage_name(match.stage)),
                .paths   = {target, found},
            });
        }

        std::vector<Projected> layout;
        layout.reserve(live.size());
        for (const auto& display : live) {
            layout.push_back(Projected{
                .path       = display.identity.path,
                .enabled    = display.enabled,
                .resolution = display.resolution,
                .position   = display.position,
                .scale      = display.scale,
                .transform  = display.transform,
            });
        }

        for (const auto& match : matched.matches) {
            const auto& target  = targets[match.target_index];
            const auto& current = live[match.live_index];
            if (!target.enabled && current.enabled) {
                plan.operations.push_back(make_operation(OperationKind::kDisable, current, target));
                layout[match.live_index].enabled = false;
            }
        }
        if (auto_disable_extras) {
            for (const auto index : matched.unmatched_live) {
                const auto& extra = live[index];
                if (extra.enabled) {
                    plan.operations.push_back(make_operation(OperationKind::kDisable, extra, extra));
                    layout[index].enabled = false;
                }
            }
        }

        const bool has_disable = !plan.operations.empty();
        const bool any_active  = std::ranges::any_of(live, &DisplayState::enabled);
        const bool keeps_one   = std::ranges::any_of(layout, &Projected::enabled);
        if (has_disable && any_active && !keeps_one) {
            return std::unexpected(PlanError{.message = "profile " + profile.name + " would disable every active display"});
        }

        for (const auto& match : matched.matches) {
            const auto& target  = targets[match.target_index];
            const auto& current = live[match.live_index];
            if (target.enabled && !current.enabled) {
                plan.operations.push_back(make_operation(OperationKind::kEnable, current, target));
            }
        }

        for (const auto& match : matched.matches) {
            const auto& target  = targets[match.target_index];
            const auto& current = live[match.live_index];
            if (target.is_primary && !target.enabled) {
                plan.warnings.push_back(PlanWarning{
                    .kind    = WarningKind::kPrimaryDisabled,
                    .message = target.identity.path + " is marked primary but disabled",
                    .paths   = {target.identity.path},
                });
            }
            if (!target.enabled) {
                continue;
            }
            if (current.enabled && !same_geometry(current, target)) {
                plan.operations.push_back(make_operation(OperationKind::kReposition, current, target));
            }
            if (target.is_primary && !current.is_primary) {
                plan.operations.push_back(make_operation(OperationKind::kSetPrimary, current, target));
            }
            auto& projected      = layout[match.live_index];
            projected.enabled    = true;
            projected.resolution = target.resolution;
            projected.position   = target.position;
        }

        add_overlap_warnings(layout, plan.warnings);
        return plan;
    }

} // namespace displaysnap
