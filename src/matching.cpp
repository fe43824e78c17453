#include "displaysnap/matching.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>

namespace displaysnap {

    namespace {

        constexpr std::array kStages = {MatchStage::kExact, MatchStage::kOrdinal, MatchStage::kClosestMode};

        bool mode_compatible(const DisplayState& target, const DisplayState& candidate) {
            const auto& wanted = target.resolution;
            const auto& have   = candidate.resolution;
            if (wanted.width <= 0 || wanted.height <= 0) {
                return false;
            }
            return have == wanted || (have.width == wanted.height && have.height == wanted.width);
        }

        std::optional<std::size_t> find_candidate(const DisplayState& target, const std::vector<DisplayState>& live, const std::vector<bool>& taken, MatchStage stage) {
            std::optional<std::size_t> best;
            for (std::size_t index = 0; index < live.size(); ++index) {
                if (taken[index]) {
                    continue;
                }
                const auto& candidate = live[index];
                switch (stage) {
                    case MatchStage::kExact:
                        if (candidate.identity.path == target.identity.path) {
                            return index;
                        }
                        break;
                    case MatchStage::kOrdinal:
                        if (target.identity.ordinal >= 0 && candidate.identity.ordinal == target.identity.ordinal) {
                            return index;
                        }
                        break;
                    case MatchStage::kClosestMode: {
                        if (!mode_compatible(target, candidate)) {
                            break;
                        }
                        if (!best) {
                            best = index;
                            break;
                        }
                        const auto& current = live[*best];
                        const int   diff    = std::abs(candidate.refresh_hz - target.refresh_hz);
                        const int   known   = std::abs(current.refresh_hz - target.refresh_hz);
                        if (diff < known || (diff == known && candidate.identity.ordinal < current.identity.ordinal)) {
                            best = index;
                        }
                        break;
                    }
                }
            }
            return best;
        }

    } // namespace

    const DisplayMatch* MatchResult::for_target(std::size_t target_index) const {
        const auto it = std::ranges::find_if(matches, [&](const DisplayMatch& match) { return match.target_index == target_index; });
        return it == matches.end() ? nullptr : &*it;
    }

    std::string_view match_stage_name(MatchStage stage) {
        switch (stage) {
            case MatchStage::kExact: return "exact";
            case MatchStage::kOrdinal: return "ordinal";
            case MatchStage::kClosestMode: return "closest_mode";
        }
        return "unknown";
    }

    MatchResult match_displays(const std::vector<DisplayState>& targets, const std::vector<DisplayState>& live) {
        MatchResult       result;
        std::vector<bool> target_done(targets.size(), false);
        std::vector<bool> taken(live.size(), false);

        for (const auto stage : kStages) {
            for (std::size_t target = 0; target < targets.size(); ++target) {
                if (target_done[target]) {
                    continue;
                }
                const auto candidate = find_candidate(targets[target], live, taken, stage);
                if (!candidate) {
                    continue;
                }
                target_done[target] = true;
                taken[*candidate]   = true;
                result.matches.push_back(DisplayMatch{.target_index = target, .live_index = *candidate, .stage = stage});
            }
        }

        std::ranges::sort(result.matches, {}, &DisplayMatch::target_index);
        for (std::size_t target = 0; target < targets.size(); ++target) {
            if (!target_done[target]) {
                result.unmatched_targets.push_back(target);
            }
        }
        for (std::size_t index = 0; index < live.size(); ++index) {
            if (!taken[index]) {
                result.unmatched_live.push_back(index);
            }
        }
        return result;
    }

    std::optional<DisplayMatch> resolve_display(const DisplayState& expected, const std::vector<DisplayState>& live, const std::vector<std::string>& excluded_paths) {
        std::vector<bool> taken(live.size(), false);
        for (std::size_t index = 0; index < live.size(); ++index) {
            const auto& path = live[index].identity.path;
            taken[index]     = path != expected.identity.path && std::ranges::find(excluded_paths, path) != excluded_paths.end();
        }
        for (const auto stage : kStages) {
            if (const auto candidate = find_candidate(expected, live, taken, stage)) {
                return DisplayMatch{.target_index = 0, .live_index = *candidate, .stage = stage};
            }
        }
        return std::nullopt;
    }

} // namespace displaysnap
