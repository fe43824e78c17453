#ifndef DISPLAYSNAP_CONFIG_HPP
#define DISPLAYSNAP_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace displaysnap {

    struct Config {
        bool                                 auto_disable_extras = false;
        bool                                 retry_failed        = true;
        bool                                 mode_fallback       = false;
        bool                                 debug_logging       = false;
        std::optional<std::filesystem::path> profiles_path       = std::nullopt;
        std::optional<std::filesystem::path> hyprland_socket     = std::nullopt;
        bool                                 manage_workspaces   = false;
        bool                                 notify              = false;
        int                                  notify_timeout_ms   = 3000;
    };

    struct ConfigOverrides {
        std::optional<bool>                  auto_disable_extras;
        std::optional<bool>                  retry_failed;
        std::optional<bool>                  mode_fallback;
        std::optional<bool>                  debug_logging;
        std::optional<std::filesystem::path> profiles_path     = std::nullopt;
        std::optional<std::filesystem::path> hyprland_socket   = std::nullopt;
        std::optional<bool>                  manage_workspaces = std::nullopt;
        std::optional<bool>                  notify            = std::nullopt;
        std::optional<int>                   notify_timeout_ms = std::nullopt;
    };

    // Parses "key = value" lines. Throws std::runtime_error naming the offending line.
    ConfigOverrides            parse_config_text(std::string_view text);
    std::optional<std::string> load_config_file(const std::filesystem::path& path, ConfigOverrides* overrides);
    Config                     apply_overrides(const Config& base, const ConfigOverrides& overrides);
    std::optional<std::string> normalize_override_string(std::string_view value);

} // namespace displaysnap

#endif // DISPLAYSNAP_CONFIG_HPP
