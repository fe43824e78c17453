#ifndef DISPLAYSNAP_HYPRCTL_HPP
#define DISPLAYSNAP_HYPRCTL_HPP

#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace displaysnap {

    class HyprctlError : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    struct HyprctlErrorInfo {
        std::string context;
        std::string message;
    };

    inline std::string format_hyprctl_error(const HyprctlErrorInfo& error) {
        std::string text = error.context;
        if (!text.empty() && !error.message.empty()) {
            text.append(": ");
        }
        text.append(error.message);
        return text;
    }

    template <typename T>
    using HyprctlResult = std::expected<T, HyprctlErrorInfo>;

    struct HyprMonitor {
        std::string                name;
        int                        id;
        std::optional<std::string> description;
        int                        width;
        int                        height;
        double                     refresh_rate;
        int                        x;
        int                        y;
        double                     scale           = 1.0;
        int                        transform       = 0;
        bool                       focused         = false;
        bool                       disabled        = false;
        std::vector<std::string>   available_modes = {};
    };

    struct HyprWorkspace {
        int                        id;
        int                        windows;
        std::optional<std::string> name;
        std::optional<std::string> monitor;
    };

    // Icons accepted by hyprctl notify.
    enum class HyprNotifyIcon : int {
        kNone    = -1,
        kWarning = 0,
        kInfo    = 1,
        kError   = 3,
        kOk      = 5,
    };

    // Transport for hyprctl requests. Implementations throw HyprctlError when the compositor cannot be reached.
    class HyprctlInvoker {
      public:
        virtual ~HyprctlInvoker()                                                                         = default;
        virtual std::string invoke(std::string_view call, std::string_view args, std::string_view format) = 0;
    };

    HyprctlResult<std::vector<HyprMonitor>>   parse_monitors(std::string_view json_text);
    HyprctlResult<std::vector<HyprWorkspace>> parse_workspaces(std::string_view json_text);

    class HyprctlClient {
      public:
        explicit HyprctlClient(HyprctlInvoker& invoker);

        HyprctlResult<std::vector<HyprMonitor>>   monitors_all();
        HyprctlResult<std::vector<HyprWorkspace>> workspaces();

        std::string                               dispatch(const std::string& dispatcher, const std::string& argument);
        std::string                               keyword(const std::string& name, const std::string& value);
        std::string                               notify(HyprNotifyIcon icon, int timeout_ms, std::string_view message);

      private:
        HyprctlInvoker& invoker_;
    };

    // Transform 0 is left out of the rule; any other value is appended so the output keeps its orientation.
    std::string build_monitor_rule(std::string_view name, const std::string& mode, int x, int y, double scale, int transform = 0);
    std::string build_monitor_disable_rule(std::string_view name);
    bool        is_ok_response(std::string_view output);

} // namespace displaysnap

#endif // DISPLAYSNAP_HYPRCTL_HPP
