#ifndef DISPLAYSNAP_PROFILE_HPP
#define DISPLAYSNAP_PROFILE_HPP

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "displaysnap/types.hpp"

namespace displaysnap {

    struct Profile {
        std::string               name;
        std::vector<DisplayState> displays;
        std::string               created_at;
        std::string               updated_at;

        bool                      operator==(const Profile&) const = default;
    };

    enum class ValidationErrorKind {
        kEmptyName,
        kEmptyIdentity,
        kDuplicateIdentity,
        kMultiplePrimary,
        kInvalidMode,
    };

    struct ValidationError {
        ValidationErrorKind kind;
        std::string         message;
    };

    std::string_view                       validation_kind_name(ValidationErrorKind kind);
    std::expected<void, ValidationError>   validate_profile(const Profile& profile);

    // Snapshot of the live layout. Displays listed in disabled_paths are stored as disabled.
    Profile                                capture_profile(std::string name, const std::vector<DisplayState>& live, const std::vector<std::string>& disabled_paths,
                                                           const std::string& timestamp);

    const DisplayState*                    find_display(const std::vector<DisplayState>& displays, std::string_view path);

} // namespace displaysnap

#endif // DISPLAYSNAP_PROFILE_HPP
