#include <gtest/gtest.h>

#include "displaysnap/hyprland_backend.hpp"

namespace {

    constexpr const char* kTwoMonitors =
        R"([{"id":0,"name":"DP-1","description":"Dell","width":1920,"height":1080,"refreshRate":60.0,"x":0,"y":0,"scale":1.0,)"
        R"("focused":true,"disabled":false,"availableModes":["1920x1080@60.00Hz"]},)"
        R"({"id":1,"name":"DP-2","description":"LG","width":1920,"height":1080,"refreshRate":60.0,"x":1920,"y":0,"scale":1.0,)"
        R"("focused":false,"disabled":false,"availableModes":["2560x1440@59.95Hz","2560x1440@143.91Hz","1920x1080@60.00Hz"]}])";

    constexpr const char* kPortraitMonitor =
        R"([{"id":0,"name":"DP-3","description":"Dell","width":2560,"height":1440,"refreshRate":59.95,"x":0,"y":0,"scale":1.25,)"
        R"("transform":1,"focused":false,"disabled":false,"availableModes":["2560x1440@59.95Hz"]}])";

    struct FakeInvoker : public displaysnap::HyprctlInvoker {
        struct Call {
            std::string call;
            std::string args;
            std::string format;
        };

        std::vector<Call>        calls;
        std::vector<std::string> responses;
        bool                     fail = false;

        std::string              invoke(std::string_view call, std::string_view args, std::string_view format) override {
            calls.push_back({std::string(call), std::string(args), std::string(format)});
            if (fail) {
                throw displaysnap::HyprctlError("unable to connect");
            }
            if (responses.empty()) {
                return "ok";
            }
            auto response = responses.front();
            responses.erase(responses.begin());
            return response;
        }
    };

    displaysnap::DisplayRequest request_for(std::string path, int width, int height, int refresh, int x, int y, bool primary = false) {
        return displaysnap::DisplayRequest{
            .identity   = {.path = std::move(path), .ordinal = -1},
            .enabled    = true,
            .resolution = {.width = width, .height = height},
            .refresh_hz = refresh,
            .position   = {.x = x, .y = y},
            .is_primary = primary,
        };
    }

} // namespace

TEST(HyprlandBackend, ConvertsMonitorsToRawDisplays) {
    FakeInvoker invoker;
    invoker.responses.push_back(kTwoMonitors);
    displaysnap::HyprctlClient          client(invoker);
    displaysnap::HyprlandDisplayBackend backend(client, {});

    const auto                          displays = backend.enumerate_displays();

    ASSERT_TRUE(displays.has_value());
    ASSERT_EQ(displays->size(), 2u);
    EXPECT_EQ((*displays)[0].path, "DP-1");
    EXPECT_TRUE((*displays)[0].primary);
    EXPECT_TRUE((*displays)[0].enabled);
    EXPECT_EQ((*displays)[1].x, 1920);
    EXPECT_FALSE((*displays)[1].primary);
    EXPECT_EQ((*displays)[1].modes.size(), 3u);
    EXPECT_EQ((*displays)[1].transform, 0);
}

TEST(HyprlandBackend, DisabledMonitorIsNeverPrimary) {
    const displaysnap::HyprMonitor monitor{
        .name         = "HDMI-A-1",
        .id           = -1,
        .description  = std::nullopt,
        .width        = 1920,
        .height       = 1080,
        .refresh_rate = 60.0,
        .x            = 0,
        .y            = 0,
        .focused      = true,
        .disabled     = true,
    };

    const auto raw = displaysnap::to_raw_display(monitor);

    EXPECT_FALSE(raw.enabled);
    EXPECT_FALSE(raw.primary);
}

TEST(HyprlandBackend, EnumerationReportsParseErrors) {
    FakeInvoker invoker;
    invoker.responses.push_back("garbage");
    displaysnap::HyprctlClient          client(invoker);
    displaysnap::HyprlandDisplayBackend backend(client, {});

    const auto                          displays = backend.enumerate_displays();

    ASSERT_FALSE(displays.has_value());
    EXPECT_EQ(displays.error().context, "hyprland");
    EXPECT_EQ(displays.error().message, "monitors: invalid json");
}

TEST(HyprlandBackend, DisableSendsDisableRule) {
    FakeInvoker                         invoker;
    displaysnap::HyprctlClient          client(invoker);
    displaysnap::HyprlandDisplayBackend backend(client, {});

    auto                                request = request_for("DP-2", 0, 0, 0, 0, 0);
    request.enabled                             = false;

    EXPECT_TRUE(backend.set_display_state(request).has_value());
    ASSERT_EQ(invoker.calls.size(), 1u);
    EXPECT_EQ(invoker.calls[0].call, "keyword");
    EXPECT_EQ(invoker.calls[0].args, "monitor DP-2,disable");
}

TEST(HyprlandBackend, EnablePicksAdvertisedMode) {
    FakeInvoker invoker;
    invoker.responses.push_back(kTwoMonitors);
    displaysnap::HyprctlClient          client(invoker);
    displaysnap::HyprlandDisplayBackend backend(client, {});

    EXPECT_TRUE(backend.set_display_state(request_for("DP-2", 2560, 1440, 60, 1920, 0)).has_value());

    ASSERT_EQ(invoker.calls.size(), 2u);
    EXPECT_EQ(invoker.calls[0].call, "monitors");
    EXPECT_EQ(invoker.calls[1].args, "monitor DP-2,2560x1440@59.95,1920x0,1");
}

TEST(HyprlandBackend, RepositionKeepsScaleAndRotation) {
    FakeInvoker invoker;
    invoker.responses.push_back(kPortraitMonitor);
    displaysnap::HyprctlClient          client(invoker);
    displaysnap::HyprlandDisplayBackend backend(client, {});

    EXPECT_TRUE(backend.set_display_state(request_for("DP-3", 2560, 1440, 60, 1920, 0)).has_value());

    ASSERT_EQ(invoker.calls.size(), 2u);
    EXPECT_EQ(invoker.calls[1].args, "monitor DP-3,2560x1440@59.95,1920x0,1.25,transform,1");
}

TEST(HyprlandBackend, UnsupportedModeFailsWithoutFallback) {
    FakeInvoker invoker;
    invoker.responses.push_back(kTwoMonitors);
    displaysnap::HyprctlClient          client(invoker);
    displaysnap::HyprlandDisplayBackend backend(client, {});

    const auto                          result = backend.set_display_state(request_for("DP-2", 3840, 2160, 60, 1920, 0));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "unsupported mode 3840x2160@60 for DP-2");
    EXPECT_EQ(invoker.calls.size(), 1u);
}

TEST(HyprlandBackend, FallbackUsesLargestMode) {
    FakeInvoker invoker;
    invoker.responses.push_back(kTwoMonitors);
    displaysnap::HyprctlClient          client(invoker);
    displaysnap::HyprlandDisplayBackend backend(client, {.mode_fallback = true});

    EXPECT_TRUE(backend.set_display_state(request_for("DP-2", 3840, 2160, 60, 1920, 0)).has_value());

    ASSERT_EQ(invoker.calls.size(), 2u);
    EXPECT_EQ(invoker.calls[1].args, "monitor DP-2,2560x1440@143.91,1920x0,1");
}

TEST(HyprlandBackend, PrimaryFocusesMonitor) {
    FakeInvoker invoker;
    invoker.responses.push_back(kTwoMonitors);
    displaysnap::HyprctlClient          client(invoker);
    displaysnap::HyprlandDisplayBackend backend(client, {});

    EXPECT_TRUE(backend.set_display_state(request_for("DP-2", 1920, 1080, 60, 1920, 0, true)).has_value());

    ASSERT_EQ(invoker.calls.size(), 2u);
    EXPECT_EQ(invoker.calls[1].call, "dispatch");
    EXPECT_EQ(invoker.calls[1].args, "focusmonitor DP-2");
}

TEST(HyprlandBackend, UnknownDisplayFails) {
    FakeInvoker invoker;
    invoker.responses.push_back(kTwoMonitors);
    displaysnap::HyprctlClient          client(invoker);
    displaysnap::HyprlandDisplayBackend backend(client, {});

    const auto                          result = backend.set_display_state(request_for("DP-9", 1920, 1080, 60, 0, 0));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "display DP-9 not found");
}

TEST(HyprlandBackend, RejectedKeywordIsAnError) {
    FakeInvoker invoker;
    invoker.responses.push_back("invalid monitor rule");
    displaysnap::HyprctlClient          client(invoker);
    displaysnap::HyprlandDisplayBackend backend(client, {});

    auto                                request = request_for("DP-2", 0, 0, 0, 0, 0);
    request.enabled                             = false;
    const auto result                           = backend.set_display_state(request);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "monitor DP-2,disable rejected: invalid monitor rule");
}

TEST(HyprlandBackend, TransportErrorsBecomeBackendErrors) {
    FakeInvoker invoker;
    invoker.fail = true;
    displaysnap::HyprctlClient          client(invoker);
    displaysnap::HyprlandDisplayBackend backend(client, {});

    const auto                          displays = backend.enumerate_displays();

    ASSERT_FALSE(displays.has_value());
    EXPECT_EQ(displays.error().context, "hyprland");
    EXPECT_EQ(displays.error().message, "unable to connect");
}

TEST(HyprlandWorkspaces, ListsRegularWorkspacesWithMonitors) {
    FakeInvoker invoker;
    invoker.responses.push_back(R"([{"id":1,"name":"web","monitor":"DP-1","windows":2},{"id":-98,"name":"special:scratch","monitor":"DP-1","windows":1},)"
                                R"({"id":3,"windows":0},{"id":4,"monitor":"DP-2","windows":1}])");
    displaysnap::HyprctlClient            client(invoker);
    displaysnap::HyprlandWorkspaceBackend workspaces(client, false);

    const auto                            listed = workspaces.list_workspaces();

    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(*listed, (std::vector<displaysnap::WorkspacePlacement>{
                           {.id = 1, .name = "web", .monitor = "DP-1"},
                           {.id = 4, .name = "4", .monitor = "DP-2"},
                       }));
}

TEST(HyprlandWorkspaces, MovesWorkspaceToMonitor) {
    FakeInvoker                           invoker;
    displaysnap::HyprctlClient            client(invoker);
    displaysnap::HyprlandWorkspaceBackend workspaces(client, false);

    EXPECT_TRUE(workspaces.move_workspace(3, "DP-2").has_value());

    ASSERT_EQ(invoker.calls.size(), 1u);
    EXPECT_EQ(invoker.calls[0].call, "dispatch");
    EXPECT_EQ(invoker.calls[0].args, "moveworkspacetomonitor 3 DP-2");
}

TEST(HyprlandWorkspaces, RejectedMoveIsAnError) {
    FakeInvoker invoker;
    invoker.responses.push_back("workspace not found");
    displaysnap::HyprctlClient            client(invoker);
    displaysnap::HyprlandWorkspaceBackend workspaces(client, false);

    const auto                            result = workspaces.move_workspace(7, "DP-2");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(displaysnap::format_backend_error(result.error()), "hyprland: moveworkspacetomonitor 7 DP-2 rejected: workspace not found");
}

TEST(HyprlandNotifier, SendsIconByOutcome) {
    FakeInvoker                   invoker;
    displaysnap::HyprctlClient    client(invoker);
    displaysnap::HyprlandNotifier notifier(client, 4000);

    notifier.notify(true, "Profile 'desk' saved (2 displays)");
    notifier.notify(false, "Profile 'desk' apply failed: 1 of 2 steps failed");

    ASSERT_EQ(invoker.calls.size(), 2u);
    EXPECT_EQ(invoker.calls[0].call, "notify");
    EXPECT_EQ(invoker.calls[0].args, "5 4000 0 Profile 'desk' saved (2 displays)");
    EXPECT_EQ(invoker.calls[1].args, "3 4000 0 Profile 'desk' apply failed: 1 of 2 steps failed");
}

TEST(HyprlandNotifier, TransportErrorsAreSwallowedIntoTheLog) {
    FakeInvoker invoker;
    invoker.fail = true;
    displaysnap::HyprctlClient    client(invoker);
    displaysnap::HyprlandNotifier notifier(client, 4000);

    EXPECT_NO_THROW(notifier.notify(true, "Profile 'desk' saved (2 displays)"));
    EXPECT_EQ(invoker.calls.size(), 1u);
}
