#ifndef DISPLAYSNAP_RUNTIME_HPP
#define DISPLAYSNAP_RUNTIME_HPP

#include <filesystem>
#include <functional>
#include <string>

#include "displaysnap/command.hpp"
#include "displaysnap/config.hpp"
#include "displaysnap/display_backend.hpp"
#include "displaysnap/notifications.hpp"
#include "displaysnap/paths.hpp"
#include "displaysnap/profile_store.hpp"
#include "displaysnap/workspace_keeper.hpp"

namespace displaysnap {

    struct RuntimeConfig {
        Paths  paths;
        Config config;
    };

    struct CommandOutput {
        bool        success;
        std::string output;
    };

    // Optional compositor services. Each is used only when present and switched on in the config.
    struct RuntimeServices {
        WorkspaceBackend* workspaces = nullptr;
        Notifier*         notifier   = nullptr;
    };

    using TimestampSource = std::function<std::string()>;

    // UTC time formatted as ISO 8601 with second precision.
    std::string           current_timestamp();

    RuntimeConfig         load_runtime_config(const Paths& paths, const ConfigOverrides& overrides);
    std::filesystem::path effective_profiles_path(const RuntimeConfig& runtime_config);

    CommandOutput         run_command(DisplayBackend& backend, ProfileStore& store, const RuntimeConfig& runtime_config, const Command& command,
                                      const TimestampSource& now = current_timestamp, const RuntimeServices& services = {});

} // namespace displaysnap

#endif // DISPLAYSNAP_RUNTIME_HPP
