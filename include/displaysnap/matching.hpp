#ifndef DISPLAYSNAP_MATCHING_HPP
#define DISPLAYSNAP_MATCHING_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "displaysnap/types.hpp"

namespace displaysnap {

    enum class MatchStage {
        kExact,
        kOrdinal,
        kClosestMode,
    };

    struct DisplayMatch {
        std::size_t target_index = 0;
        std::size_t live_index   = 0;
        MatchStage  stage        = MatchStage::kExact;
    };

    struct MatchResult {
        std::vector<DisplayMatch> matches;
        std::vector<std::size_t>  unmatched_targets;
        std::vector<std::size_t>  unmatched_live;

        const DisplayMatch*       for_target(std::size_t target_index) const;
    };

    std::string_view match_stage_name(MatchStage stage);

    // Pairs targets with live displays in three passes: exact path, enumeration ordinal, then closest mode
    // (same or rotated resolution, nearest refresh, lowest ordinal on ties). Each pass completes before the
    // next starts and a live display is paired at most once. Matches are ordered by target index.
    MatchResult                 match_displays(const std::vector<DisplayState>& targets, const std::vector<DisplayState>& live);

    // Resolves a single display against a fresh enumeration with the same passes, ignoring excluded paths.
    std::optional<DisplayMatch> resolve_display(const DisplayState& expected, const std::vector<DisplayState>& live, const std::vector<std::string>& excluded_paths);

} // namespace displaysnap

#endif // DISPLAYSNAP_MATCHING_HPP
