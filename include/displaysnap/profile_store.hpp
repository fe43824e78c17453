#ifndef DISPLAYSNAP_PROFILE_STORE_HPP
#define DISPLAYSNAP_PROFILE_STORE_HPP

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "displaysnap/profile.hpp"

namespace displaysnap {

    struct StoreError {
        std::string message;
    };

    template <typename T>
    using StoreResult = std::expected<T, StoreError>;

    StoreResult<std::vector<Profile>> parse_profiles_json(std::string_view text);
    std::string                       render_profiles_json(const std::vector<Profile>& profiles);

    // Ordered catalog of uniquely named profiles persisted as one JSON document. Every mutation reloads the
    // file, validates, and rewrites it atomically.
    class ProfileStore {
      public:
        explicit ProfileStore(std::filesystem::path path);

        StoreResult<std::vector<Profile>> load_all() const;
        StoreResult<Profile>              find(std::string_view name) const;

        StoreResult<void>                 save(Profile profile);
        StoreResult<void>                 remove(std::string_view name);
        StoreResult<void>                 rename(std::string_view old_name, const std::string& new_name, const std::string& timestamp);
        StoreResult<void>                 move(std::size_t from, std::size_t to);

        StoreResult<void>                 export_to(const std::filesystem::path& destination) const;
        StoreResult<std::size_t>          import_from(const std::filesystem::path& source);

        const std::filesystem::path&      path() const {
            return path_;
        }

      private:
        StoreResult<void>     write_all(const std::vector<Profile>& profiles) const;

        std::filesystem::path path_;
    };

} // namespace displaysnap

#endif // DISPLAYSNAP_PROFILE_STORE_HPP
