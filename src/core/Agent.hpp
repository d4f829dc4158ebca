//
// Agent.hpp
//

#ifndef POLYBOARD_AGENT_HPP
#define POLYBOARD_AGENT_HPP

#include <memory>
#include "Actions.hpp"
#include "State.hpp"

namespace polyboard::core
{
    class Agent
    {
    public:
        virtual ~Agent() = default;

        // Called by whoever drives the match (self-play loop, network adapter) for the player on turn.
        // The returned intent may still be rejected by the resolver.
        virtual auto Decide(std::shared_ptr<MatchSnapshot const> snapshot) -> Intent = 0;
    };
}
#endif //POLYBOARD_AGENT_HPP
