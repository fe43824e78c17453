#include "displaysnap/paths.hpp"

#include <cstdlib>
#include <stdexcept>

namespace displaysnap {

    namespace {

        std::optional<std::string> get_env(const char* name) {
            if (const char* value = std::getenv(name)) {
                if (*value != '\0') {
                    return std::string(value);
                }
            }
            return std::nullopt;
        }

        EnvConfig env_from_process() {
            return EnvConfig{
                .home                        = get_env("HOME"),
                .xdg_config_home             = get_env("XDG_CONFIG_HOME"),
                .xdg_state_home              = get_env("XDG_STATE_HOME"),
                .xdg_runtime_dir             = get_env("XDG_RUNTIME_DIR"),
                .hyprland_instance_signature = get_env("HYPRLAND_INSTANCE_SIGNATURE"),
            };
        }

        std::filesystem::path config_root(const EnvConfig& env) {
            if (env.xdg_config_home) {
                return std::filesystem::path(*env.xdg_config_home);
            }
            if (env.home) {
                return std::filesystem::path(*env.home) / ".config";
            }
            throw std::runtime_error("missing HOME for config root");
        }

        std::filesystem::path state_root(const EnvConfig& env) {
            if (env.xdg_state_home) {
                return std::filesystem::path(*env.xdg_state_home);
            }
            if (env.home) {
                return std::filesystem::path(*env.home) / ".local" / "state";
            }
            throw std::runtime_error("missing HOME for state root");
        }

        std::optional<std::filesystem::path> hyprland_socket_path(const EnvConfig& env) {
            if (!env.hyprland_instance_signature) {
                return std::nullopt;
            }
            const auto runtime_root = env.xdg_runtime_dir ? std::filesystem::path(*env.xdg_runtime_dir) / "hypr" : std::filesystem::path("/tmp/hypr");
            return runtime_root / *env.hyprland_instance_signature / ".socket.sock";
        }

    } // namespace

    Paths resolve_paths(const EnvConfig& env) {
        const auto base_dir  = config_root(env) / "displaysnap";
        const auto state_dir = state_root(env) / "displaysnap";
        return Paths{
            .base_dir             = base_dir,
            .config_path          = base_dir / "displaysnap.conf",
            .profiles_path        = base_dir / "profiles.json",
            .state_dir            = state_dir,
            .lock_path            = state_dir / "action.lock",
            .hyprland_socket      = hyprland_socket_path(env),
            .workspace_cache_path = state_dir / "workspaces.json",
        };
    }

    std::optional<Paths> try_resolve_paths(const EnvConfig& env) {
        if (!env.xdg_config_home && !env.home) {
            return std::nullopt;
        }
        if (!env.xdg_state_home && !env.home) {
            return std::nullopt;
        }
        return resolve_paths(env);
    }

    std::optional<Paths> try_resolve_paths_from_env() {
        return try_resolve_paths(env_from_process());
    }

} // namespace displaysnap
