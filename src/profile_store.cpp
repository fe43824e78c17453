#include "displaysnap/profile_store.hpp"

#include "displaysnap/json_utils.hpp"
#include "displaysnap/logging.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace displaysnap {

    namespace {

        constexpr int kStoreVersion = 1;

        std::unexpected<StoreError> store_error(std::string message) {
            error_log("profiles", message);
            return std::unexpected(StoreError{.message = std::move(message)});
        }

        StoreResult<std::string> read_text_file(const std::filesystem::path& path) {
            std::ifstream input(path);
            if (!input.good()) {
                return store_error("failed to read " + path.string());
            }
            std::ostringstream buffer;
            buffer << input.rdbuf();
            return buffer.str();
        }

        StoreResult<void> write_text_file(const std::filesystem::path& path, const std::string& contents) {
            std::error_code ec;
            if (const auto parent = path.parent_path(); !parent.empty()) {
                std::filesystem::create_directories(parent, ec);
                if (ec) {
                    return store_error("failed to create " + parent.string());
                }
            }
            auto temp = path;
            temp += ".tmp";
            {
                std::ofstream output(temp, std::ios::trunc);
                if (!output.good()) {
                    return store_error("failed to write " + temp.string());
                }
                output << contents;
                output.flush();
                if (!output.good()) {
                    return store_error("failed to write " + temp.string());
                }
            }
            std::filesystem::rename(temp, path, ec);
            if (ec) {
                std::filesystem::remove(temp, ec);
                return store_error("failed to replace " + path.string());
            }
            return {};
        }

        std::optional<int> int_member(const nlohmann::json& obj, const char* key) {
            if (!obj.is_object()) {
                return std::nullopt;
            }
            return optional_int_field(obj, key);
        }

        StoreResult<DisplayState> parse_display(const nlohmann::json& entry, const std::string& profile_name) {
            const auto invalid = [&](std::string_view what) { return store_error("profile " + profile_name + ": invalid display " + std::string(what)); };
            if (!entry.is_object()) {
                return invalid("entry");
            }
            if (!entry.contains("identity") || !entry.at("identity").is_object()) {
                return invalid("identity");
            }
            const auto& identity = entry.at("identity");
            const auto  path     = optional_string_field(identity, "path");
            if (!path) {
                return invalid("identity path");
            }
            const auto enabled = optional_bool_field(entry, "enabled");
            if (!enabled) {
                return invalid("enabled flag");
            }
            const auto resolution = entry.value("resolution", nlohmann::json::object());
            const auto width      = int_member(resolution, "width");
            const auto height     = int_member(resolution, "height");
            if (!width || !height) {
                return invalid("resolution");
            }
            const auto refresh = optional_int_field(entry, "refresh_hz");
            if (!refresh) {
                return invalid("refresh_hz");
            }
            const auto position = entry.value("position", nlohmann::json::object());
            const auto x        = int_member(position, "x");
            const auto y        = int_member(position, "y");
            if (!x || !y) {
                return invalid("position");
            }
            return DisplayState{
                .identity    = {.path = *path, .ordinal = optional_int_field(identity, "ordinal").value_or(-1)},
                .enabled     = *enabled,
                .resolution  = {.width = *width, .height = *height},
                .refresh_hz  = *refresh,
                .position    = {.x = *x, .y = *y},
                .is_primary  = optional_bool_field(entry, "primary").value_or(false),
                .description = optional_string_field(entry, "description"),
                .scale       = optional_number_field(entry, "scale").value_or(1.0),
                .transform   = optional_int_field(entry, "transform").value_or(0),
            };
        }

        StoreResult<Profile> parse_profile(const nlohmann::json& entry) {
            if (!entry.is_object()) {
                return store_error("invalid profile entry");
            }
            Profile profile{
                .name       = optional_string_field(entry, "name").value_or(""),
                .displays   = {},
                .created_at = optional_string_field(entry, "created_at").value_or(""),
                .updated_at = optional_string_field(entry, "updated_at").value_or(""),
            };
            const auto displays = entry.value("displays", nlohmann::json::array());
            if (!displays.is_array()) {
                return store_error("profile " + profile.name + ": displays is not a list");
            }
            for (const auto& display : displays) {
                auto parsed = parse_display(display, profile.name);
                if (!parsed) {
                    return std::unexpected(parsed.error());
                }
                profile.displays.push_back(std::move(*parsed));
            }
            if (const auto valid = validate_profile(profile); !valid) {
                return store_error("invalid profile '" + profile.name + "': " + valid.error().message);
            }
            return profile;
        }

        nlohmann::json display_to_json(const DisplayState& display) {
            nlohmann::json entry;
            entry["identity"] = {{"path", display.identity.path}, {"ordinal", display.identity.ordinal}};
            if (display.description) {
                entry["description"] = *display.description;
            }
            entry["enabled"]    = display.enabled;
            entry["resolution"] = {{"width", display.resolution.width}, {"height", display.resolution.height}};
            entry["refresh_hz"] = display.refresh_hz;
            entry["position"]   = {{"x", display.position.x}, {"y", display.position.y}};
            entry["primary"]    = display.is_primary;
            entry["scale"]      = display.scale;
            entry["transform"]  = display.transform;
            return entry;
        }

        auto find_profile(std::vector<Profile>& profiles, std::string_view name) {
            return std::ranges::find_if(profiles, [&](const Profile& profile) { return profile.name == name; });
        }

    } // namespace

    StoreResult<std::vector<Profile>> parse_profiles_json(std::string_view text) {
        const auto root = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
        if (root.is_discarded() || !root.is_object()) {
            return store_error("invalid profile store");
        }
        const auto version = root.contains("version") ? optional_int_field(root, "version") : std::optional<int>(kStoreVersion);
        if (!version || *version != kStoreVersion) {
            return store_error("unsupported profile store version");
        }
        const auto entries = root.value("profiles", nlohmann::json::array());
        if (!entries.is_array()) {
            return store_error("invalid profile store");
        }
        std::vector<Profile> profiles;
        for (const auto& entry : entries) {
            auto profile = parse_profile(entry);
            if (!profile) {
                return std::unexpected(profile.error());
            }
            if (find_profile(profiles, profile->name) != profiles.end()) {
                return store_error("duplicate profile '" + profile->name + "'");
            }
            profiles.push_back(std::move(*profile));
        }
        return profiles;
    }

    std::string render_profiles_json(const std::vector<Profile>& profiles) {
        nlohmann::json root;
        root["version"]  = kStoreVersion;
        root["profiles"] = nlohmann::json::array();
        for (const auto& profile : profiles) {
            nlohmann::json entry;
            entry["name"]       = profile.name;
            entry["created_at"] = profile.created_at;
            entry["updated_at"] = profile.updated_at;
            entry["displays"]   = nlohmann::json::array();
            for (const auto& display : profile.displays) {
                entry["displays"].push_back(display_to_json(display));
            }
            root["profiles"].push_back(std::move(entry));
        }
        return root.dump(2) + "\n";
    }

    ProfileStore::ProfileStore(std::filesystem::path path) : path_(std::move(path)) {}

    StoreResult<std::vector<Profile>> ProfileStore::load_all() const {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) {
            if (ec) {
                return store_error("failed to read " + path_.string());
            }
            return std::vector<Profile>{};
        }
        const auto contents = read_text_file(path_);
        if (!contents) {
            return std::unexpected(contents.error());
        }
        return parse_profiles_json(*contents);
    }

    StoreResult<Profile> ProfileStore::find(std::string_view name) const {
        auto profiles = load_all();
        if (!profiles) {
            return std::unexpected(profiles.error());
        }
        const auto it = find_profile(*profiles, name);
        if (it == profiles->end()) {
            return std::unexpected(StoreError{.message = "profile '" + std::string(name) + "' not found"});
        }
        return std::move(*it);
    }

    StoreResult<void> ProfileStore::save(Profile profile) {
        if (const auto valid = validate_profile(profile); !valid) {
            return std::unexpected(StoreError{.message = valid.error().message});
        }
        auto profiles = load_all();
        if (!profiles) {
            return std::unexpected(profiles.error());
        }
        const auto existing = find_profile(*profiles, profile.name);
        if (existing == profiles->end()) {
            profiles->push_back(std::move(profile));
        } else {
            if (!existing->created_at.empty()) {
                profile.created_at = existing->created_at;
            }
            *existing = std::move(profile);
        }
        return write_all(*profiles);
    }

    StoreResult<void> ProfileStore::remove(std::string_view name) {
        auto profiles = load_all();
        if (!profiles) {
            return std::unexpected(profiles.error());
        }
        const auto it = find_profile(*profiles, name);
        if (it == profiles->end()) {
            return std::unexpected(StoreError{.message = "profile '" + std::string(name) + "' not found"});
        }
        profiles->erase(it);
        return write_all(*profiles);
    }

    StoreResult<void> ProfileStore::rename(std::string_view old_name, const std::string& new_name, const std::string& timestamp) {
        auto profiles = load_all();
        if (!profiles) {
            return std::unexpected(profiles.error());
        }
        const auto it = find_profile(*profiles, old_name);
        if (it == profiles->end()) {
            return std::unexpected(StoreError{.message = "profile '" + std::string(old_name) + "' not found"});
        }
        if (new_name != old_name && find_profile(*profiles, new_name) != profiles->end()) {
            return std::unexpected(StoreError{.message = "profile '" + new_name + "' already exists"});
        }
        Profile renamed    = *it;
        renamed.name       = new_name;
        renamed.updated_at = timestamp;
        if (const auto valid = validate_profile(renamed); !valid) {
            return std::unexpected(StoreError{.message = valid.error().message});
        }
        *it = std::move(renamed);
        return write_all(*profiles);
    }

    StoreResult<void> ProfileStore::move(std::size_t from, std::size_t to) {
        auto profiles = load_all();
        if (!profiles) {
            return std::unexpected(profiles.error());
        }
        if (from >= profiles->size() || to >= profiles->size()) {
            return std::unexpected(StoreError{.message = "profile position out of range"});
        }
        if (from == to) {
            return {};
        }
        std::swap((*profiles)[from], (*profiles)[to]);
        return write_all(*profiles);
    }

    StoreResult<void> ProfileStore::export_to(const std::filesystem::path& destination) const {
        const auto profiles = load_all();
        if (!profiles) {
            return std::unexpected(profiles.error());
        }
        return write_text_file(destination, render_profiles_json(*profiles));
    }

    StoreResult<std::size_t> ProfileStore::import_from(const std::filesystem::path& source) {
        const auto contents = read_text_file(source);
        if (!contents) {
            return std::unexpected(contents.error());
        }
        auto imported = parse_profiles_json(*contents);
        if (!imported) {
            return std::unexpected(imported.error());
        }
        auto profiles = load_all();
        if (!profiles) {
            return std::unexpected(profiles.error());
        }
        for (auto& profile : *imported) {
            const auto existing = find_profile(*profiles, profile.name);
            if (existing == profiles->end()) {
                profiles->push_back(std::move(profile));
            } else {
                *existing = std::move(profile);
            }
        }
        const auto count = imported->size();
        if (const auto written = write_all(*profiles); !written) {
            return std::unexpected(written.error());
        }
        return count;
    }

    StoreResult<void> ProfileStore::write_all(const std::vector<Profile>& profiles) const {
        return write_text_file(path_, render_profiles_json(profiles));
    }

} // namespace displaysnap
