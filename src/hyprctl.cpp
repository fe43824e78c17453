#include "displaysnap/hyprctl.hpp"

#include "displaysnap/json_utils.hpp"
#include "displaysnap/strings.hpp"

#include <sstream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace displaysnap {

    namespace {

        constexpr std::string_view kContext = "monitors";

        HyprctlResult<nlohmann::json> parse_json(std::string_view json_text, std::string_view context) {
            auto parsed = nlohmann::json::parse(json_text.begin(), json_text.end(), nullptr, false);
            if (parsed.is_discarded()) {
                return std::unexpected(HyprctlErrorInfo{std::string(context), "invalid json"});
            }
            return parsed;
        }

        HyprctlResult<std::string> required_string_field(const nlohmann::json& obj, std::string_view key, std::string_view context) {
            if (!obj.contains(key)) {
                return std::unexpected(HyprctlErrorInfo{std::string(context), std::string(key) + " missing"});
            }
            const auto& value = obj.at(key);
            if (!value.is_string()) {
                return std::unexpected(HyprctlErrorInfo{std::string(context), std::string(key) + " invalid"});
            }
            return value.get<std::string>();
        }

        HyprctlResult<int> required_int_field(const nlohmann::json& obj, std::string_view key, std::string_view context) {
            if (!obj.contains(key)) {
                return std::unexpected(HyprctlErrorInfo{std::string(context), std::string(key) + " missing"});
            }
            const auto& value = obj.at(key);
            if (!value.is_number_integer()) {
                return std::unexpected(HyprctlErrorInfo{std::string(context), std::string(key) + " invalid"});
            }
            return value.get<int>();
        }

        HyprctlResult<double> required_number_field(const nlohmann::json& obj, std::string_view key, std::string_view context) {
            if (!obj.contains(key)) {
                return std::unexpected(HyprctlErrorInfo{std::string(context), std::string(key) + " missing"});
            }
            const auto& value = obj.at(key);
            if (!value.is_number()) {
                return std::unexpected(HyprctlErrorInfo{std::string(context), std::string(key) + " invalid"});
            }
            return value.get<double>();
        }

        std::vector<std::string> string_array_field(const nlohmann::json& obj, const char* key) {
            std::vector<std::string> values;
            if (!obj.contains(key) || !obj.at(key).is_array()) {
                return values;
            }
            for (const auto& entry : obj.at(key)) {
                if (entry.is_string()) {
                    values.push_back(entry.get<std::string>());
                }
            }
            return values;
        }

        std::string format_scale(double scale) {
            std::ostringstream output;
            output << scale;
            return output.str();
        }

    } // namespace

    HyprctlResult<std::vector<HyprMonitor>> parse_monitors(std::string_view json_text) {
        const auto json = parse_json(json_text, kContext);
        if (!json) {
            return std::unexpected(json.error());
        }
        if (!json->is_array()) {
            return std::unexpected(HyprctlErrorInfo{std::string(kContext), "not array"});
        }
        std::vector<HyprMonitor> monitors;
        monitors.reserve(json->size());
        for (const auto& monitor : *json) {
            if (!monitor.is_object()) {
                return std::unexpected(HyprctlErrorInfo{std::string(kContext), "entry not object"});
            }
            const auto name = required_string_field(monitor, "name", kContext);
            if (!name) {
                return std::unexpected(name.error());
            }
            const auto id = required_int_field(monitor, "id", kContext);
            if (!id) {
                return std::unexpected(id.error());
            }
            const auto width = required_int_field(monitor, "width", kContext);
            if (!width) {
                return std::unexpected(width.error());
            }
            const auto height = required_int_field(monitor, "height", kContext);
            if (!height) {
                return std::unexpected(height.error());
            }
            const auto refresh = required_number_field(monitor, "refreshRate", kContext);
            if (!refresh) {
                return std::unexpected(refresh.error());
            }
            const auto x = required_int_field(monitor, "x", kContext);
            if (!x) {
                return std::unexpected(x.error());
            }
            const auto y = required_int_field(monitor, "y", kContext);
            if (!y) {
                return std::unexpected(y.error());
            }
            monitors.push_back(HyprMonitor{
                .name            = *name,
                .id              = *id,
                .description     = optional_string_field(monitor, "description"),
                .width           = *width,
                .height          = *height,
                .refresh_rate    = *refresh,
                .x               = *x,
                .y               = *y,
                .scale           = optional_number_field(monitor, "scale").value_or(1.0),
                .transform       = optional_int_field(monitor, "transform").value_or(0),
                .focused         = optional_bool_field(monitor, "focused").value_or(false),
                .disabled        = optional_bool_field(monitor, "disabled").value_or(false),
                .available_modes = string_array_field(monitor, "availableModes"),
            });
        }
        return monitors;
    }

    HyprctlResult<std::vector<HyprWorkspace>> parse_workspaces(std::string_view json_text) {
        const auto json = parse_json(json_text, "workspaces");
        if (!json) {
            return std::unexpected(json.error());
        }
        if (!json->is_array()) {
            return std::unexpected(HyprctlErrorInfo{"workspaces", "not array"});
        }
        std::vector<HyprWorkspace> workspaces;
        workspaces.reserve(json->size());
        for (const auto& workspace : *json) {
            if (!workspace.is_object()) {
                return std::unexpected(HyprctlErrorInfo{"workspaces", "entry not object"});
            }
            const auto id = required_int_field(workspace, "id", "workspaces");
            if (!id) {
                return std::unexpected(id.error());
            }
            workspaces.push_back(HyprWorkspace{
                .id      = *id,
                .windows = optional_int_field(workspace, "windows").value_or(0),
                .name    = optional_string_field(workspace, "name"),
                .monitor = optional_string_field(workspace, "monitor"),
            });
        }
        return workspaces;
    }

    HyprctlClient::HyprctlClient(HyprctlInvoker& invoker) : invoker_(invoker) {}

    HyprctlResult<std::vector<HyprMonitor>> HyprctlClient::monitors_all() {
        const auto output = invoker_.invoke("monitors", "all", "j");
        return parse_monitors(output);
    }

    HyprctlResult<std::vector<HyprWorkspace>> HyprctlClient::workspaces() {
        const auto output = invoker_.invoke("workspaces", "", "j");
        return parse_workspaces(output);
    }

    std::string HyprctlClient::dispatch(const std::string& dispatcher, const std::string& argument) {
        const auto args = argument.empty() ? dispatcher : dispatcher + " " + argument;
        return invoker_.invoke("dispatch", args, "");
    }

    std::string HyprctlClient::keyword(const std::string& name, const std::string& value) {
        if (value.empty()) {
            return invoker_.invoke("keyword", name, "");
        }
        return invoker_.invoke("keyword", name + " " + value, "");
    }

    // Color 0 keeps the compositor's default for the icon.
    std::string HyprctlClient::notify(HyprNotifyIcon icon, int timeout_ms, std::string_view message) {
        std::string args = std::to_string(static_cast<int>(icon));
        args.append(" ");
        args.append(std::to_string(timeout_ms > 0 ? timeout_ms : 0));
        args.append(" 0 ");
        args.append(message);
        return invoker_.invoke("notify", args, "");
    }

    std::string build_monitor_rule(std::string_view name, const std::string& mode, int x, int y, double scale, int transform) {
        std::string rule(name);
        rule.append(",");
        rule.append(mode);
        rule.append(",");
        rule.append(std::to_string(x));
        rule.append("x");
        rule.append(std::to_string(y));
        rule.append(",");
        rule.append(format_scale(scale > 0.0 ? scale : 1.0));
        if (transform != 0) {
            rule.append(",transform,");
            rule.append(std::to_string(transform));
        }
        return rule;
    }

    std::string build_monitor_disable_rule(std::string_view name) {
        return std::string(name) + ",disable";
    }

    bool is_ok_response(std::string_view output) {
        if (output.empty()) {
            return false;
        }
        constexpr std::string_view kDelimiter = "\n\n\n";
        size_t                     start      = 0;
        while (start <= output.size()) {
            const auto end   = output.find(kDelimiter, start);
            const auto slice = trim_view(output.substr(start, end == std::string_view::npos ? output.size() - start : end - start));
            if (slice.empty()) {
                if (end == std::string_view::npos) {
                    break;
                }
                return false;
            }
            if (slice != "ok") {
                return false;
            }
            if (end == std::string_view::npos) {
                break;
            }
            start = end + kDelimiter.size();
        }
        return true;
    }

} // namespace displaysnap
