//
// Presets.hpp
//

#ifndef POLYBOARD_PRESETS_HPP
#define POLYBOARD_PRESETS_HPP

#include <optional>
#include <string>
#include <string_view>
#include "Types.hpp"

namespace polyboard::core::presets
{
    // Shared 40-space loop, properties with rent and bankruptcy, doubles roll again.
    auto Trading() -> RuleConfiguration;
    // Two players on separate 10x10 grids, hidden tokens, combat only.
    auto GridCombat() -> RuleConfiguration;
    // First to the last space of a 20-space track.
    auto Race() -> RuleConfiguration;
    // Every feature switched on, separate boards, 3000 balance target.
    auto Custom() -> RuleConfiguration;

    // "trading" | "gridcombat" | "race" | "custom"
    auto ByName(std::string_view name) -> std::optional<RuleConfiguration>;

    auto Summary(RuleConfiguration const& rules) -> std::string;
}

#endif //POLYBOARD_PRESETS_HPP
