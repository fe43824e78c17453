#ifndef DISPLAYSNAP_HYPRLAND_BACKEND_HPP
#define DISPLAYSNAP_HYPRLAND_BACKEND_HPP

#include <string_view>
#include <vector>

#include "displaysnap/display_backend.hpp"
#include "displaysnap/hyprctl.hpp"
#include "displaysnap/notifications.hpp"
#include "displaysnap/workspace_keeper.hpp"

namespace displaysnap {

    struct HyprlandBackendOptions {
        bool mode_fallback = false;
        bool debug_logging = false;
    };

    RawDisplay to_raw_display(const HyprMonitor& monitor);

    // Hyprland has no primary output; the focused monitor stands in for it.
    class HyprlandDisplayBackend : public DisplayBackend {
      public:
        HyprlandDisplayBackend(HyprctlClient& client, HyprlandBackendOptions options);

        BackendResult<std::vector<RawDisplay>> enumerate_displays() override;
        BackendResult<void>                    set_display_state(const DisplayRequest& request) override;

      private:
        BackendResult<void>    send_keyword(const std::string& rule);
        BackendResult<void>    focus(const std::string& name);

        HyprctlClient&         client_;
        HyprlandBackendOptions options_;
    };

    // Special workspaces and workspaces without a monitor are left out of listings.
    class HyprlandWorkspaceBackend : public WorkspaceBackend {
      public:
        HyprlandWorkspaceBackend(HyprctlClient& client, bool debug_logging);

        BackendResult<std::vector<WorkspacePlacement>> list_workspaces() override;
        BackendResult<void>                            move_workspace(int id, std::string_view monitor) override;

      private:
        HyprctlClient& client_;
        bool           debug_logging_;
    };

    class HyprlandNotifier : public Notifier {
      public:
        HyprlandNotifier(HyprctlClient& client, int timeout_ms);

        void notify(bool success, std::string_view text) override;

      private:
        HyprctlClient& client_;
        int            timeout_ms_;
    };

} // namespace displaysnap

#endif // DISPLAYSNAP_HYPRLAND_BACKEND_HPP
