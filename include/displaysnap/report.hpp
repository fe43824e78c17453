#ifndef DISPLAYSNAP_REPORT_HPP
#define DISPLAYSNAP_REPORT_HPP

#include <string>
#include <vector>

#include "displaysnap/applier.hpp"
#include "displaysnap/profile.hpp"
#include "displaysnap/reconcile.hpp"
#include "displaysnap/types.hpp"

namespace displaysnap {

    std::string describe_display(const DisplayState& display);
    std::string describe_operation(const Operation& operation);

    std::string render_displays(const std::vector<DisplayState>& displays);
    std::string render_displays_json(const std::vector<DisplayState>& displays);

    std::string render_profile_list(const std::vector<Profile>& profiles);
    std::string render_profile_list_json(const std::vector<Profile>& profiles);
    std::string render_profile(const Profile& profile);
    std::string render_profile_json(const Profile& profile);

    std::string render_plan(const ReconciliationPlan& plan);
    std::string render_plan_json(const ReconciliationPlan& plan);

    std::string render_apply_report(const ApplyReport& report);
    std::string render_apply_report_json(const ApplyReport& report);

} // namespace displaysnap

#endif // DISPLAYSNAP_REPORT_HPP
