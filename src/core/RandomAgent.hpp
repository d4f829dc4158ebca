//
// RandomAgent.hpp
//

#ifndef POLYBOARD_RANDOMAGENT_HPP
#define POLYBOARD_RANDOMAGENT_HPP

#include <random>
#include "Agent.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace polyboard::core
{
    class RandomAgent final : public polyboard::core::Agent
    {
    public:
        RandomAgent(uint64_t rng_seed, RuleConfiguration const& rules);

        auto Decide(std::shared_ptr<MatchSnapshot const> snapshot) -> Intent override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

        auto chance(uint32_t one_in) -> bool
        {
            return std::uniform_int_distribution<uint32_t>{1, one_in}(rng_) == 1;
        }

        auto TryPurchase(MatchSnapshot const& s) -> std::optional<Intent>;
        auto TryTrade(MatchSnapshot const& s) -> std::optional<Intent>;
        auto TryAttack(MatchSnapshot const& s) -> std::optional<Intent>;

    private:
        std::mt19937 rng_;
        PropertyRules property_;
        bool combat_;
    };
}

#endif //POLYBOARD_RANDOMAGENT_HPP
