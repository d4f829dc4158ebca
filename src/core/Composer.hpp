//
// Composer.hpp
//

#ifndef POLYBOARD_COMPOSER_HPP
#define POLYBOARD_COMPOSER_HPP

#include <expected>
#include <memory>
#include "Types.hpp"
#include "RuleAnalyzer.hpp"
#include "Match.hpp"

namespace polyboard::core
{
    enum class ConstructionErrorCode : uint8_t
    {
        InvalidConfiguration,  // analyzer found conflicts
        ModuleDisabled,        // archetype needs a module its flag turns off
        MissingDependency      // a module needs another one that is absent
    };

    struct ConstructionError
    {
        ConstructionErrorCode       code{};
        std::string                 message{};
        std::vector<ConfigConflict> conflicts{};
    };

    auto describe(ConstructionError const& e) -> std::string;

    // Which optional modules a match carries. Board and movement are always there.
    struct ModulePlan
    {
        bool currency{false};
        bool property{false};
        bool combat{false};
    };

    class Composer
    {
    public:
        using BuildResult = std::expected<std::unique_ptr<MatchState>, ConstructionError>;

        // Nothing is returned unless every module was wired.
        static auto Build(RuleConfiguration const& rules, uint8_t requested_players, uint64_t seed) -> BuildResult;

        static auto RequiredBy(Archetype const& archetype) -> ModulePlan;
        static auto EnabledBy(RuleConfiguration const& rules) noexcept -> ModulePlan;
        static auto ClampPlayers(PlayerBounds bounds, uint8_t requested) noexcept -> uint8_t;

    private:
        static auto PlaceProperties(MatchState& match) -> void;
    };
}

#endif //POLYBOARD_COMPOSER_HPP
