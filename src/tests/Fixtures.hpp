//
// Fixtures.hpp
//

#ifndef POLYBOARD_TEST_FIXTURES_HPP
#define POLYBOARD_TEST_FIXTURES_HPP

#include <format>
#include <memory>
#include <vector>

#include "../core/Composer.hpp"
#include "../core/Match.hpp"
#include "../core/Presets.hpp"
#include "../debug/Inspector.hpp"

namespace polyboard::test
{
    using namespace polyboard::core;

    // Throws std::bad_expected_access when the composer refuses, which fails the calling test.
    inline auto MakeMatch(RuleConfiguration const& rules, uint8_t players = 2, uint64_t seed = 42)
        -> std::unique_ptr<MatchState>
    {
        return std::move(Composer::Build(rules, players, seed).value());
    }

    inline auto Record(PosT pos, MoneyT price, MoneyT rent, std::optional<PlayerIdT> owner = std::nullopt)
        -> PropertyRecord
    {
        return PropertyRecord{ .position = pos, .name = std::format("Lot {}", pos),
                               .price = price, .rent = rent, .owner = owner };
    }

    // A roster seeded the way the composer would seed it.
    inline auto MakeRoster(std::size_t n, MoneyT balance = 0, int32_t health = 0) -> Roster
    {
        Roster r(n);
        for (std::size_t i{}; i < n; ++i)
        {
            r[i].id = static_cast<PlayerIdT>(i);
            r[i].balance = balance;
            r[i].health = health;
        }
        return r;
    }

    inline auto Move(PlayerIdT p, uint32_t spaces) -> Intent
    {
        return Intent{ .player = p, .action = MoveIntent{ .spaces = spaces } };
    }
}

#endif //POLYBOARD_TEST_FIXTURES_HPP
