#include "displaysnap/hyprland_backend.hpp"

#include "displaysnap/display_modes.hpp"
#include "displaysnap/logging.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace displaysnap {

    namespace {

        constexpr std::string_view kContext = "hyprland";

        BackendError failure(std::string message) {
            BackendError error{.context = std::string(kContext), .message = std::move(message)};
            error_log(error.context, error.message);
            return error;
        }

        std::string describe_request(const DisplayRequest& request) {
            return std::to_string(request.resolution.width) + "x" + std::to_string(request.resolution.height) + "@" + std::to_string(request.refresh_hz);
        }

        bool already_matches(const RawDisplay& current, const DisplayRequest& request) {
            return current.enabled && current.width == request.resolution.width && current.height == request.resolution.height &&
                std::lround(current.refresh_rate) == request.refresh_hz && current.x == request.position.x && current.y == request.position.y;
        }

    } // namespace

    RawDisplay to_raw_display(const HyprMonitor& monitor) {
        return RawDisplay{
            .path         = monitor.name,
            .description  = monitor.description,
            .enabled      = !monitor.disabled,
            .width        = monitor.width,
            .height       = monitor.height,
            .refresh_rate = monitor.refresh_rate,
            .x            = monitor.x,
            .y            = monitor.y,
            .scale        = monitor.scale,
            .transform    = monitor.transform,
            .primary      = monitor.focused && !monitor.disabled,
            .modes        = parse_display_modes(monitor.available_modes),
        };
    }

    HyprlandDisplayBackend::HyprlandDisplayBackend(HyprctlClient& client, HyprlandBackendOptions options) : client_(client), options_(options) {}

    BackendResult<std::vector<RawDisplay>> HyprlandDisplayBackend::enumerate_displays() {
        try {
            const auto monitors = client_.monitors_all();
            if (!monitors) {
                return std::unexpected(failure(format_hyprctl_error(monitors.error())));
            }
            std::vector<RawDisplay> displays;
            displays.reserve(monitors->size());
            for (const auto& monitor : *monitors) {
                displays.push_back(to_raw_display(monitor));
            }
            return displays;
        } catch (const HyprctlError& ex) { return std::unexpected(failure(ex.what())); }
    }

    BackendResult<void> HyprlandDisplayBackend::set_display_state(const DisplayRequest& request) {
        const auto& name = request.identity.path;
        if (!request.enabled) {
            return send_keyword(build_monitor_disable_rule(name));
        }

        const auto displays = enumerate_displays();
        if (!displays) {
            return std::unexpected(displays.error());
        }
        const auto current = std::ranges::find_if(*displays, [&](const RawDisplay& display) { return display.path == name; });
        if (current == displays->end()) {
            return std::unexpected(failure("display " + name + " not found"));
        }

        if (!already_matches(*current, request)) {
            DisplayMode mode{.resolution = request.resolution, .refresh_hz = static_cast<double>(request.refresh_hz)};
            if (!current->modes.empty()) {
                const auto choice = pick_display_mode(current->modes, request.resolution, request.refresh_hz, options_.mode_fallback);
                if (!choice) {
                    return std::unexpected(failure("unsupported mode " + describe_request(request) + " for " + name));
                }
                if (!choice->exact) {
                    debug_log(options_.debug_logging, kContext, "using " + format_mode(choice->mode) + " for " + name + " instead of " + describe_request(request));
                }
                mode = choice->mode;
            }
            const auto rule   = build_monitor_rule(name, format_mode(mode), request.position.x, request.position.y, current->scale, current->transform);
            const auto result = send_keyword(rule);
            if (!result) {
                return result;
            }
        } else {
            debug_log(options_.debug_logging, kContext, name + " already in requested state");
        }

        if (request.is_primary && !current->primary) {
            return focus(name);
        }
        return {};
    }

    BackendResult<void> HyprlandDisplayBackend::send_keyword(const std::string& rule) {
        debug_log(options_.debug_logging, kContext, "keyword monitor " + rule);
        try {
            const auto output = client_.keyword("monitor", rule);
            if (!is_ok_response(output)) {
                return std::unexpected(failure("monitor " + rule + " rejected: " + output));
            }
        } catch (const HyprctlError& ex) { return std::unexpected(failure(ex.what())); }
        return {};
    }

    BackendResult<void> HyprlandDisplayBackend::focus(const std::string& name) {
        debug_log(options_.debug_logging, kContext, "focusmonitor " + name);
        try {
            const auto output = client_.dispatch("focusmonitor", name);
            if (!is_ok_response(output)) {
                return std::unexpected(failure("focusmonitor " + name + " rejected: " + output));
            }
        } catch (const HyprctlError& ex) { return std::unexpected(failure(ex.what())); }
        return {};
    }

    HyprlandWorkspaceBackend::HyprlandWorkspaceBackend(HyprctlClient& client, bool debug_logging) : client_(client), debug_logging_(debug_logging) {}

    BackendResult<std::vector<WorkspacePlacement>> HyprlandWorkspaceBackend::list_workspaces() {
        try {
            const auto workspaces = client_.workspaces();
            if (!workspaces) {
                return std::unexpected(failure(format_hyprctl_error(workspaces.error())));
            }
            std::vector<WorkspacePlacement> placements;
            for (const auto& workspace : *workspaces) {
                if (workspace.id <= 0 || !workspace.monitor) {
                    continue;
                }
                placements.push_back(WorkspacePlacement{
                    .id      = workspace.id,
                    .name    = workspace.name.value_or(std::to_string(workspace.id)),
                    .monitor = *workspace.monitor,
                });
            }
            return placements;
        } catch (const HyprctlError& ex) { return std::unexpected(failure(ex.what())); }
    }

    BackendResult<void> HyprlandWorkspaceBackend::move_workspace(int id, std::string_view monitor) {
        const auto argument = std::to_string(id) + " " + std::string(monitor);
        debug_log(debug_logging_, kContext, "moveworkspacetomonitor " + argument);
        try {
            const auto output = client_.dispatch("moveworkspacetomonitor", argument);
            if (!is_ok_response(output)) {
                return std::unexpected(failure("moveworkspacetomonitor " + argument + " rejected: " + output));
            }
        } catch (const HyprctlError& ex) { return std::unexpected(failure(ex.what())); }
        return {};
    }

    HyprlandNotifier::HyprlandNotifier(HyprctlClient& client, int timeout_ms) : client_(client), timeout_ms_(timeout_ms) {}

    void HyprlandNotifier::notify(bool success, std::string_view text) {
        try {
            const auto output = client_.notify(success ? HyprNotifyIcon::kOk : HyprNotifyIcon::kError, timeout_ms_, text);
            if (!is_ok_response(output)) {
                error_log("notify", "notification rejected: " + output);
            }
        } catch (const HyprctlError& ex) { error_log("notify", ex.what()); }
    }

} // namespace displaysnap
