#ifndef DISPLAYSNAP_DISPLAY_BACKEND_HPP
#define DISPLAYSNAP_DISPLAY_BACKEND_HPP

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "displaysnap/types.hpp"

namespace displaysnap {

    struct RawDisplay {
        std::string                path;
        std::optional<std::string> description;
        bool                       enabled      = false;
        int                        width        = 0;
        int                        height       = 0;
        double                     refresh_rate = 0.0;
        int                        x            = 0;
        int                        y            = 0;
        double                     scale        = 1.0;
        int                        transform    = 0;
        bool                       primary      = false;
        std::vector<DisplayMode>   modes        = {};
    };

    struct DisplayRequest {
        DisplayIdentity identity;
        bool            enabled    = true;
        Resolution      resolution = {};
        int             refresh_hz = 0;
        Position        position   = {};
        bool            is_primary = false;
    };

    struct BackendError {
        std::string context;
        std::string message;
    };

    inline std::string format_backend_error(const BackendError& error) {
        std::string text = error.context;
        if (!text.empty() && !error.message.empty()) {
            text.append(": ");
        }
        text.append(error.message);
        return text;
    }

    template <typename T>
    using BackendResult = std::expected<T, BackendError>;

    // OS display-configuration capability. Calls block until the OS answers.
    class DisplayBackend {
      public:
        virtual ~DisplayBackend()                                                                        = default;
        virtual BackendResult<std::vector<RawDisplay>> enumerate_displays()                             = 0;
        virtual BackendResult<void>                    set_display_state(const DisplayRequest& request) = 0;
    };

} // namespace displaysnap

#endif // DISPLAYSNAP_DISPLAY_BACKEND_HPP
