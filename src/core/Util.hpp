//
// Util.hpp
//

#ifndef POLYBOARD_UTIL_HPP
#define POLYBOARD_UTIL_HPP

#include <algorithm>
#include <span>
#include <memory>
#include "OmegaException.hpp"
#include "State.hpp"

namespace polyboard::core::util
{
    // Dependent false for exhaustive `if constexpr` chains over a variant.
    template <typename>
    inline constexpr bool always_false_v = false;

    inline auto IsKnownPlayer(Roster const& roster, PlayerIdT id) noexcept -> bool
    {
        return static_cast<std::size_t>(id) < roster.size();
    }

    inline auto CountActive(Roster const& roster) -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::count_if(roster, [](PlayerState const& p) { return p.active; }));
    }

    // Lowest id among active players, empty when nobody is active.
    inline auto FirstActive(Roster const& roster) -> std::optional<PlayerIdT>
    {
        auto const it = std::ranges::find_if(roster, [](PlayerState const& p) { return p.active; });
        return (it != std::cend(roster)) ? std::optional<PlayerIdT>{it->id} : std::nullopt;
    }

    class DuplicateCounter
    {
    public:
        DuplicateCounter():
            counts_{}, best_(0) {}
        auto Add(uint8_t face) -> void
        {
            uint8_t& c = counts_[face];
            ++c;
            best_ = std::max(best_, c);
        }
        // Size of the largest group of equal faces seen so far.
        [[nodiscard]]
        auto Largest() const -> uint8_t
        {
            return best_;
        }
    private:
        std::array<uint8_t, 256> counts_;
        uint8_t best_;
    };
}

#endif //POLYBOARD_UTIL_HPP
