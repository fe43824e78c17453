#include "displaysnap/runtime.hpp"

#include <chrono>
#include <ctime>
#include <iterator>
#include <optional>
#include <vector>

#include "displaysnap/action_lock.hpp"
#include "displaysnap/applier.hpp"
#include "displaysnap/enumerator.hpp"
#include "displaysnap/logging.hpp"
#include "displaysnap/notifications.hpp"
#include "displaysnap/reconcile.hpp"
#include "displaysnap/report.hpp"
#include "displaysnap/version.hpp"

namespace displaysnap {

    namespace {

        CommandOutput failure(std::string message) {
            return CommandOutput{false, std::move(message)};
        }

        CommandOutput from_store(const StoreResult<void>& result, std::string message) {
            if (!result) {
                return failure(result.error().message);
            }
            return CommandOutput{true, std::move(message)};
        }

        bool is_json(const Command& command) {
            return command.format == OutputFormat::kJson;
        }

        void announce(const RuntimeServices& services, const RuntimeConfig& runtime_config, bool success, const std::string& text) {
            if (runtime_config.config.notify && services.notifier) {
                services.notifier->notify(success, text);
            }
        }

        CommandOutput show_displays(DisplayEnumerator& enumerator, const Command& command) {
            const auto live = enumerator.enumerate();
            if (!live) {
                return failure(live.error().message);
            }
            return CommandOutput{true, is_json(command) ? render_displays_json(*live) : render_displays(*live)};
        }

        CommandOutput save_profile(DisplayEnumerator& enumerator, ProfileStore& store, const RuntimeConfig& runtime_config, const Command& command, const TimestampSource& now,
                                   const RuntimeServices& services) {
            const auto& name = *command.profile_name;
            const auto  fail = [&](std::string_view detail) {
                auto text = profile_notification_text(ProfileAction::kSave, false, name, detail);
                announce(services, runtime_config, false, text);
                return failure(std::move(text));
            };
            const auto live = enumerator.enumerate();
            if (!live) {
                return fail(live.error().message);
            }
            for (const auto& path : command.disabled_displays) {
                if (!find_display(*live, path)) {
                    return fail("unknown display " + path);
                }
            }
            auto profile = capture_profile(name, *live, command.disabled_displays, now());
            if (const auto valid = validate_profile(profile); !valid) {
                return fail(valid.error().message);
            }
            const auto count  = profile.displays.size();
            const auto result = store.save(std::move(profile));
            if (!result) {
                return fail(result.error().message);
            }
            auto text = profile_notification_text(ProfileAction::kSave, true, name, "(" + std::to_string(count) + " displays)");
            announce(services, runtime_config, true, text);
            return CommandOutput{true, std::move(text)};
        }

        CommandOutput plan_or_apply(DisplayBackend& backend, DisplayEnumerator& enumerator, ProfileStore& store, const RuntimeConfig& runtime_config, const Command& command,
                                    const RuntimeServices& services) {
            const auto& name  = *command.profile_name;
            const bool  apply = command.kind == CommandKind::kApply;
            const auto  fail  = [&](std::string_view detail) {
                auto text = profile_notification_text(ProfileAction::kApply, false, name, detail);
                if (apply) {
                    announce(services, runtime_config, false, text);
                }
                return failure(std::move(text));
            };
            const auto profile = store.find(name);
            if (!profile) {
                return fail(profile.error().message);
            }
            const auto live = enumerator.enumerate();
            if (!live) {
                return fail(live.error().message);
            }
            const bool disable_extras = command.auto_disable_extras.value_or(runtime_config.config.auto_disable_extras);
            const auto plan           = reconcile(*live, *profile, disable_extras);
            if (!plan) {
                return fail(plan.error().message);
            }
            for (const auto& warning : plan->warnings) {
                debug_log(runtime_config.config.debug_logging, "plan", warning.message);
            }
            if (!apply) {
                return CommandOutput{true, is_json(command) ? render_plan_json(*plan) : render_plan(*plan)};
            }

            std::optional<WorkspaceKeeper> keeper;
            if (runtime_config.config.manage_workspaces && services.workspaces) {
                keeper.emplace(*services.workspaces, runtime_config.paths.workspace_cache_path, runtime_config.config.debug_logging);
            }
            std::vector<std::string> notes;
            if (keeper) {
                notes = keeper->remember(*plan);
            }

            const ApplierOptions options{
                .retry_failed  = runtime_config.config.retry_failed,
                .debug_logging = runtime_config.config.debug_logging,
            };
            ConfigurationApplier applier(backend, enumerator, options);
            auto                 report = applier.apply(*plan);
            if (keeper) {
                auto restored = keeper->restore(report);
                notes.insert(notes.end(), std::make_move_iterator(restored.begin()), std::make_move_iterator(restored.end()));
            }
            report.notes = std::move(notes);
            announce(services, runtime_config, report.success(), apply_headline(report));
            return CommandOutput{report.success(), is_json(command) ? render_apply_report_json(report) : render_apply_report(report)};
        }

    } // namespace

    std::string current_timestamp() {
        const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm    utc{};
        gmtime_r(&now, &utc);
        char buffer[32] = {};
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
        return buffer;
    }

    RuntimeConfig load_runtime_config(const Paths& paths, const ConfigOverrides& overrides) {
        return RuntimeConfig{
            .paths  = paths,
            .config = apply_overrides(Config{}, overrides),
        };
    }

    std::filesystem::path effective_profiles_path(const RuntimeConfig& runtime_config) {
        return runtime_config.config.profiles_path.value_or(runtime_config.paths.profiles_path);
    }

    CommandOutput run_command(DisplayBackend& backend, ProfileStore& store, const RuntimeConfig& runtime_config, const Command& command, const TimestampSource& now,
                              const RuntimeServices& services) {
        DisplayEnumerator         enumerator(backend);
        std::optional<ActionLock> lock;
        if (command.kind == CommandKind::kSave || command.kind == CommandKind::kApply) {
            auto acquired = ActionLock::acquire(runtime_config.paths.lock_path);
            if (!acquired) {
                error_log("lock", acquired.error());
                return failure(acquired.error());
            }
            lock.emplace(std::move(*acquired));
        }

        switch (command.kind) {
            case CommandKind::kHelp: return CommandOutput{true, std::string(usage_text())};
            case CommandKind::kVersion: return CommandOutput{true, "displaysnap " + std::string(kVersion)};
            case CommandKind::kDisplays: return show_displays(enumerator, command);
            case CommandKind::kList: {
                const auto profiles = store.load_all();
                if (!profiles) {
                    return failure(profiles.error().message);
                }
                return CommandOutput{true, is_json(command) ? render_profile_list_json(*profiles) : render_profile_list(*profiles)};
            }
            case CommandKind::kShow: {
                const auto profile = store.find(*command.profile_name);
                if (!profile) {
                    return failure(profile.error().message);
                }
                return CommandOutput{true, is_json(command) ? render_profile_json(*profile) : render_profile(*profile)};
            }
            case CommandKind::kSave: return save_profile(enumerator, store, runtime_config, command, now, services);
            case CommandKind::kPlan:
            case CommandKind::kApply: return plan_or_apply(backend, enumerator, store, runtime_config, command, services);
            case CommandKind::kDelete: return from_store(store.remove(*command.profile_name), "Profile '" + *command.profile_name + "' deleted");
            case CommandKind::kRename:
                return from_store(store.rename(*command.profile_name, *command.new_name, now()),
                                  "Profile '" + *command.profile_name + "' renamed to '" + *command.new_name + "'");
            case CommandKind::kMove:
                return from_store(store.move(*command.from_index, *command.to_index),
                                  "Moved profile " + std::to_string(*command.from_index + 1) + " to " + std::to_string(*command.to_index + 1));
            case CommandKind::kExport: return from_store(store.export_to(*command.file), "Exported profiles to " + *command.file);
            case CommandKind::kImport: {
                const auto imported = store.import_from(*command.file);
                if (!imported) {
                    return failure(imported.error().message);
                }
                return CommandOutput{true, "Imported " + std::to_string(*imported) + " profiles from " + *command.file};
            }
        }
        return failure("unknown command");
    }

} // namespace displaysnap
