#ifndef DISPLAYSNAP_PATHS_HPP
#define DISPLAYSNAP_PATHS_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace displaysnap {

    struct EnvConfig {
        std::optional<std::string> home;
        std::optional<std::string> xdg_config_home;
        std::optional<std::string> xdg_state_home;
        std::optional<std::string> xdg_runtime_dir             = std::nullopt;
        std::optional<std::string> hyprland_instance_signature = std::nullopt;
    };

    struct Paths {
        std::filesystem::path                base_dir;
        std::filesystem::path                config_path;
        std::filesystem::path                profiles_path;
        std::filesystem::path                state_dir;
        std::filesystem::path                lock_path;
        std::optional<std::filesystem::path> hyprland_socket;
        std::filesystem::path                workspace_cache_path = {};
    };

    Paths                resolve_paths(const EnvConfig& env);
    std::optional<Paths> try_resolve_paths(const EnvConfig& env);
    std::optional<Paths> try_resolve_paths_from_env();

} // namespace displaysnap

#endif // DISPLAYSNAP_PATHS_HPP
