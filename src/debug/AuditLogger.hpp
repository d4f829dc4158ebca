//
// AuditLogger.hpp
//

#ifndef POLYBOARD_AUDITLOGGER_HPP
#define POLYBOARD_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Match.hpp"
#include "../core/Events.hpp"
#include "../core/Actions.hpp"
#include "../core/Exception.hpp"
#include "../core/Types.hpp"

namespace polyboard::core::debug
{
    // Match transcript. Subscribe it to a resolver to get one line per event.
    class AuditLogger final : public EventSink
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger() override;

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        // Session header (seed, archetype, topology, players, rules)
        auto start(MatchState const& match) -> void;

        // Per intent, before it is resolved
        auto intent(Intent const& i) -> void;

        auto rejected(error::RuleViolation const& v) -> void;

        // Per resolution, after events were published
        auto outcome(ResolutionOutcome o) -> void;

        auto Publish(MatchEvent const& event) -> void override;

        // Match end footer (winner; -1 if none)
        auto end(MatchState const& match) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
    };

    auto describe(Intent const& i) -> std::string;
    auto describe(MatchEvent const& e) -> std::string;
}

#endif //POLYBOARD_AUDITLOGGER_HPP
