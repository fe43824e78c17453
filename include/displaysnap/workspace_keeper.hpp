#ifndef DISPLAYSNAP_WORKSPACE_KEEPER_HPP
#define DISPLAYSNAP_WORKSPACE_KEEPER_HPP

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "displaysnap/applier.hpp"
#include "displaysnap/display_backend.hpp"
#include "displaysnap/reconcile.hpp"

namespace displaysnap {

    struct WorkspacePlacement {
        int         id;
        std::string name;
        std::string monitor;

        bool        operator==(const WorkspacePlacement&) const = default;
    };

    // Compositor workspace control used to put workspaces back on displays that come back.
    class WorkspaceBackend {
      public:
        virtual ~WorkspaceBackend()                                                                             = default;
        virtual BackendResult<std::vector<WorkspacePlacement>> list_workspaces()                                = 0;
        virtual BackendResult<void>                            move_workspace(int id, std::string_view monitor) = 0;
    };

    std::expected<std::vector<WorkspacePlacement>, std::string> parse_placements_json(std::string_view text);
    std::string                                                 render_placements_json(const std::vector<WorkspacePlacement>& placements);

    // Records where workspaces live before an apply disables displays, and moves them back once an apply
    // re-enables those displays. Every call is best-effort: problems come back as notes, never as failures.
    class WorkspaceKeeper {
      public:
        WorkspaceKeeper(WorkspaceBackend& backend, std::filesystem::path cache_path, bool debug_logging);

        std::vector<std::string> remember(const ReconciliationPlan& plan);
        std::vector<std::string> restore(const ApplyReport& report);

      private:
        WorkspaceBackend&     backend_;
        std::filesystem::path cache_path_;
        bool                  debug_logging_;
    };

} // namespace displaysnap

#endif // DISPLAYSNAP_WORKSPACE_KEEPER_HPP
