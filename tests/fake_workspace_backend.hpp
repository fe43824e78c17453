#pragma once

#include <algorithm>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "displaysnap/workspace_keeper.hpp"

namespace displaysnap::fakes {

    // In-memory workspace table. Accepted moves update the stored placement.
    class FakeWorkspaceBackend : public WorkspaceBackend {
      public:
        std::vector<WorkspacePlacement>          workspaces;
        std::vector<std::pair<int, std::string>> moves;
        bool                                     fail_listing = false;
        std::set<int>                            reject_moves;

        BackendResult<std::vector<WorkspacePlacement>> list_workspaces() override {
            if (fail_listing) {
                return std::unexpected(BackendError{.context = "fake", .message = "workspaces unavailable"});
            }
            return workspaces;
        }

        BackendResult<void> move_workspace(int id, std::string_view monitor) override {
            moves.emplace_back(id, std::string(monitor));
            if (reject_moves.contains(id)) {
                return std::unexpected(BackendError{.context = "fake", .message = "rejected workspace " + std::to_string(id)});
            }
            const auto it = std::ranges::find_if(workspaces, [&](const WorkspacePlacement& workspace) { return workspace.id == id; });
            if (it == workspaces.end()) {
                return std::unexpected(BackendError{.context = "fake", .message = "no workspace " + std::to_string(id)});
            }
            it->monitor = std::string(monitor);
            return {};
        }
    };

    inline WorkspacePlacement workspace(int id, std::string monitor) {
        return WorkspacePlacement{.id = id, .name = std::to_string(id), .monitor = std::move(monitor)};
    }

} // namespace displaysnap::fakes
