#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "displaysnap/command.hpp"
#include "displaysnap/config.hpp"
#include "displaysnap/failsafe.hpp"
#include "displaysnap/hyprctl.hpp"
#include "displaysnap/hyprctl_socket.hpp"
#include "displaysnap/hyprland_backend.hpp"
#include "displaysnap/logging.hpp"
#include "displaysnap/paths.hpp"
#include "displaysnap/profile_store.hpp"
#include "displaysnap/runtime.hpp"

namespace {

    void write_stderr(std::string_view message) {
        std::cerr << message << '\n';
    }

    int run(const std::vector<std::string>& args) {
        using namespace displaysnap;

        const auto parsed = parse_command(args);
        if (std::holds_alternative<ParseError>(parsed)) {
            std::cerr << std::get<ParseError>(parsed).message << "\n\n" << usage_text();
            return 2;
        }
        const auto& command = std::get<Command>(parsed);

        const auto paths = try_resolve_paths_from_env();
        if (!paths) {
            std::cerr << "unable to resolve config paths: HOME is not set\n";
            return 1;
        }

        ConfigOverrides overrides;
        const auto      config_path = command.config_path ? std::filesystem::path(*command.config_path) : paths->config_path;
        if (const auto error = load_config_file(config_path, &overrides)) {
            std::cerr << *error << '\n';
            return 1;
        }
        if (command.verbose) {
            overrides.debug_logging = true;
        }
        const auto runtime_config = load_runtime_config(*paths, overrides);
        if (runtime_config.config.debug_logging) {
            set_debug_log_sink(write_stderr);
            set_error_log_sink(write_stderr);
        }

        const auto socket = runtime_config.config.hyprland_socket ? runtime_config.config.hyprland_socket : paths->hyprland_socket;
        if (!socket) {
            debug_log(runtime_config.config.debug_logging, "main", "no Hyprland instance signature");
        }

        ProfileStore             store(effective_profiles_path(runtime_config));
        SocketHyprctlInvoker     invoker(socket.value_or(std::filesystem::path{}));
        HyprctlClient            client(invoker);
        HyprlandDisplayBackend   backend(client,
                                         HyprlandBackendOptions{
                                             .mode_fallback = runtime_config.config.mode_fallback,
                                             .debug_logging = runtime_config.config.debug_logging,
                                         });
        HyprlandWorkspaceBackend workspaces(client, runtime_config.config.debug_logging);
        HyprlandNotifier         notifier(client, runtime_config.config.notify_timeout_ms);

        const auto               result = run_command(backend, store, runtime_config, command, current_timestamp, RuntimeServices{.workspaces = &workspaces, .notifier = &notifier});
        auto&                    stream = result.success ? std::cout : std::cerr;
        stream << result.output;
        if (!result.output.empty() && !result.output.ends_with('\n')) {
            stream << '\n';
        }
        return result.success ? 0 : 1;
    }

} // namespace

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    return displaysnap::failsafe::guard([&] { return run(args); },
                                        [](std::string_view context, std::string_view message) { write_stderr(displaysnap::format_log_entry(context, message)); },
                                        "displaysnap");
}
