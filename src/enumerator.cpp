#include "displaysnap/enumerator.hpp"

#include "displaysnap/logging.hpp"

#include <cmath>
#include <unordered_set>

namespace displaysnap {

    namespace {

        EnumerationError fail(std::string message) {
            error_log("enumerate", message);
            return EnumerationError{.message = std::move(message)};
        }

    } // namespace

    std::expected<LiveState, EnumerationError> normalize_displays(const std::vector<RawDisplay>& raw) {
        LiveState                       live;
        std::unordered_set<std::string> seen;
        live.reserve(raw.size());
        bool primary_taken = false;

        for (size_t index = 0; index < raw.size(); ++index) {
            const auto& display = raw[index];
            if (display.path.empty()) {
                return std::unexpected(fail("display " + std::to_string(index) + " has no path"));
            }
            if (!seen.insert(display.path).second) {
                return std::unexpected(fail("duplicate display " + display.path));
            }
            if (display.enabled && (display.width <= 0 || display.height <= 0)) {
                return std::unexpected(fail("display " + display.path + " reports an invalid resolution"));
            }
            const bool primary = display.enabled && display.primary && !primary_taken;
            primary_taken      = primary_taken || primary;
            live.push_back(DisplayState{
                .identity    = {.path = display.path, .ordinal = static_cast<int>(index)},
                .enabled     = display.enabled,
                .resolution  = {.width = display.width, .height = display.height},
                .refresh_hz  = static_cast<int>(std::lround(display.refresh_rate)),
                .position    = {.x = display.x, .y = display.y},
                .is_primary  = primary,
                .description = display.description,
                .scale       = display.scale > 0.0 ? display.scale : 1.0,
                .transform   = display.transform,
            });
        }
        return live;
    }

    DisplayEnumerator::DisplayEnumerator(DisplayBackend& backend) : backend_(backend) {}

    std::expected<LiveState, EnumerationError> DisplayEnumerator::enumerate() {
        const auto raw = backend_.enumerate_displays();
        if (!raw) {
            return std::unexpected(fail(format_backend_error(raw.error())));
        }
        return normalize_displays(*raw);
    }

} // namespace displaysnap
