#include "displaysnap/profile.hpp"

#include "displaysnap/strings.hpp"

#include <algorithm>
#include <unordered_set>

namespace displaysnap {

    namespace {

        std::unexpected<ValidationError> reject(ValidationErrorKind kind, std::string message) {
            return std::unexpected(ValidationError{.kind = kind, .message = std::move(message)});
        }

    } // namespace

    std::string_view validation_kind_name(ValidationErrorKind kind) {
        switch (kind) {
            case ValidationErrorKind::kEmptyName: return "empty_name";
            case ValidationErrorKind::kEmptyIdentity: return "empty_identity";
            case ValidationErrorKind::kDuplicateIdentity: return "duplicate_identity";
            case ValidationErrorKind::kMultiplePrimary: return "multiple_primary";
            case ValidationErrorKind::kInvalidMode: return "invalid_mode";
        }
        return "unknown";
    }

    std::expected<void, ValidationError> validate_profile(const Profile& profile) {
        if (trim_view(profile.name).empty()) {
            return reject(ValidationErrorKind::kEmptyName, "profile name is empty");
        }
        std::unordered_set<std::string> paths;
        int                             primaries = 0;
        for (const auto& display : profile.displays) {
            if (display.identity.path.empty()) {
                return reject(ValidationErrorKind::kEmptyIdentity, "profile " + profile.name + " has a display without identity");
            }
            if (!paths.insert(display.identity.path).second) {
                return reject(ValidationErrorKind::kDuplicateIdentity, "profile " + profile.name + " lists " + display.identity.path + " twice");
            }
            if (display.enabled && (display.resolution.width <= 0 || display.resolution.height <= 0 || display.refresh_hz <= 0)) {
                return reject(ValidationErrorKind::kInvalidMode, "profile " + profile.name + " has an invalid mode for " + display.identity.path);
            }
            if (display.is_primary && ++primaries > 1) {
                return reject(ValidationErrorKind::kMultiplePrimary, "profile " + profile.name + " has more than one primary display");
            }
        }
        return {};
    }

    Profile capture_profile(std::string name, const std::vector<DisplayState>& live, const std::vector<std::string>& disabled_paths, const std::string& timestamp) {
        Profile profile{.name = std::move(name), .displays = {}, .created_at = timestamp, .updated_at = timestamp};
        profile.displays.reserve(live.size());
        for (auto display : live) {
            if (std::ranges::find(disabled_paths, display.identity.path) != disabled_paths.end()) {
                display.enabled    = false;
                display.is_primary = false;
            }
            profile.displays.push_back(std::move(display));
        }
        return profile;
    }

    const DisplayState* find_display(const std::vector<DisplayState>& displays, std::string_view path) {
        const auto it = std::ranges::find_if(displays, [&](const DisplayState& display) { return display.identity.path == path; });
        return it == displays.end() ? nullptr : &*it;
    }

} // namespace displaysnap
