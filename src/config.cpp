#include "displaysnap/config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "displaysnap/strings.hpp"

namespace displaysnap {

    namespace {

        bool require_bool(std::string_view value, std::string_view key) {
            const auto parsed = parse_bool(value);
            if (!parsed) {
                throw std::runtime_error("invalid boolean for " + std::string(key));
            }
            return *parsed;
        }

        int require_non_negative_int(std::string_view value, std::string_view key) {
            const auto parsed = parse_int(value);
            if (!parsed || *parsed < 0) {
                throw std::runtime_error("invalid non-negative integer for " + std::string(key));
            }
            return *parsed;
        }

        std::filesystem::path require_path(std::string_view value, std::string_view key) {
            const auto normalized = normalize_override_string(value);
            if (!normalized) {
                throw std::runtime_error("empty path for " + std::string(key));
            }
            return std::filesystem::path(*normalized);
        }

        void apply_line(ConfigOverrides& overrides, std::string_view line) {
            const auto [key, value] = split_key_value(line, '=');
            if (key == "auto_disable_extras") {
                overrides.auto_disable_extras = require_bool(value, key);
                return;
            }
            if (key == "retry_failed") {
                overrides.retry_failed = require_bool(value, key);
                return;
            }
            if (key == "mode_fallback") {
                overrides.mode_fallback = require_bool(value, key);
                return;
            }
            if (key == "debug_logging") {
                overrides.debug_logging = require_bool(value, key);
                return;
            }
            if (key == "profiles_path") {
                overrides.profiles_path = require_path(value, key);
                return;
            }
            if (key == "hyprland_socket") {
                overrides.hyprland_socket = require_path(value, key);
                return;
            }
            if (key == "manage_workspaces") {
                overrides.manage_workspaces = require_bool(value, key);
                return;
            }
            if (key == "notify") {
                overrides.notify = require_bool(value, key);
                return;
            }
            if (key == "notify_timeout_ms") {
                overrides.notify_timeout_ms = require_non_negative_int(value, key);
                return;
            }
            throw std::runtime_error("unknown config key " + key);
        }

    } // namespace

    ConfigOverrides parse_config_text(std::string_view text) {
        ConfigOverrides overrides;
        size_t          line_number = 0;
        for (const auto& raw : split_tokens(text, '\n')) {
            ++line_number;
            const auto comment = raw.find('#');
            const auto line    = trim_view(std::string_view(raw).substr(0, comment));
            if (line.empty()) {
                continue;
            }
            try {
                apply_line(overrides, line);
            } catch (const std::exception& ex) { throw std::runtime_error("line " + std::to_string(line_number) + ": " + ex.what()); }
        }
        return overrides;
    }

    std::optional<std::string> load_config_file(const std::filesystem::path& path, ConfigOverrides* overrides) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            if (ec) {
                return "failed to read config file";
            }
            return std::nullopt;
        }
        std::ifstream input(path);
        if (!input.good()) {
            return "failed to read config file";
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();
        try {
            *overrides = parse_config_text(buffer.str());
        } catch (const std::exception& ex) { return path.string() + ": " + ex.what(); }
        return std::nullopt;
    }

    Config apply_overrides(const Config& base, const ConfigOverrides& overrides) {
        Config merged = base;
        if (overrides.auto_disable_extras) {
            merged.auto_disable_extras = *overrides.auto_disable_extras;
        }
        if (overrides.retry_failed) {
            merged.retry_failed = *overrides.retry_failed;
        }
        if (overrides.mode_fallback) {
            merged.mode_fallback = *overrides.mode_fallback;
        }
        if (overrides.debug_logging) {
            merged.debug_logging = *overrides.debug_logging;
        }
        if (overrides.profiles_path) {
            merged.profiles_path = *overrides.profiles_path;
        }
        if (overrides.hyprland_socket) {
            merged.hyprland_socket = *overrides.hyprland_socket;
        }
        if (overrides.manage_workspaces) {
            merged.manage_workspaces = *overrides.manage_workspaces;
        }
        if (overrides.notify) {
            merged.notify = *overrides.notify;
        }
        if (overrides.notify_timeout_ms) {
            merged.notify_timeout_ms = *overrides.notify_timeout_ms;
        }
        return merged;
    }

    std::optional<std::string> normalize_override_string(std::string_view value) {
        const auto trimmed = trim_copy(value);
        if (trimmed.empty()) {
            return std::nullopt;
        }
        return trimmed;
    }

} // namespace displaysnap
