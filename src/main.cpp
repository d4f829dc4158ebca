//
// main.cpp
//
// Headless self-play: composes a match from a preset or a rule document and lets random agents
// play it to the end, writing a transcript.
//

#include <charconv>
#include <cstdint>
#include <cstring>
#include <memory>
#include <print>
#include <string>
#include <vector>

#include "core/Agent.hpp"
#include "core/Composer.hpp"
#include "core/Exception.hpp"
#include "core/Presets.hpp"
#include "core/RandomAgent.hpp"
#include "core/RuleAnalyzer.hpp"
#include "core/TurnResolver.hpp"
#include "debug/AuditLogger.hpp"
#include "debug/Invariants.hpp"
#include "net/Codec.hpp"

namespace
{
    struct CmdLine
    {
        std::string   preset{"trading"};
        std::string   rules_path{};
        std::string   save_rules_path{};
        std::string   log_path{"polyboard_selfplay.log"};
        std::uint32_t n_players{2};
        std::uint64_t seed{123456789ULL};
        std::uint64_t max_steps{5000};
    };

    auto ParseArgs(int argc, char** argv) -> CmdLine
    {
        CmdLine cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            auto next_str = [&](std::string& out)
            {
                if (i + 1 >= argc) { return false; }
                out = argv[++i];
                return true;
            };

            if (arg == "--preset")
            {
                next_str(cfg.preset);
            }
            else if (arg == "--rules")
            {
                next_str(cfg.rules_path);
            }
            else if (arg == "--save-rules")
            {
                next_str(cfg.save_rules_path);
            }
            else if (arg == "--log")
            {
                next_str(cfg.log_path);
            }
            else if (arg == "--players")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.n_players = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--max-steps")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.max_steps = v; }
            }
            else
            {
                std::print("[selfplay] ignoring unknown argument '{}'\n", arg);
            }
        }
        return cfg;
    }

    auto LoadRules(CmdLine const& cl) -> std::optional<polyboard::core::RuleConfiguration>
    {
        using namespace polyboard::core;

        if (!cl.rules_path.empty())
        {
            auto doc = net::LoadRuleDocument(cl.rules_path);
            if (!doc)
            {
                std::print("[selfplay] cannot load '{}': {}\n", cl.rules_path, doc.error().message);
                return std::nullopt;
            }
            return *doc;
        }

        auto rules = presets::ByName(cl.preset);
        if (!rules) std::print("[selfplay] unknown preset '{}'\n", cl.preset);
        return rules;
    }
}

int main(int argc, char** argv)
{
    using namespace polyboard::core;

    CmdLine const cl = ParseArgs(argc, argv);

    std::optional<RuleConfiguration> const rules = LoadRules(cl);
    if (!rules) return 2;

    std::print("{}", RuleAnalyzer::Report(*rules));

    if (!cl.save_rules_path.empty())
    {
        if (auto saved = net::SaveRuleDocument(cl.save_rules_path, *rules); !saved)
        {
            std::print("[selfplay] cannot save '{}': {}\n", cl.save_rules_path, saved.error().message);
            return 2;
        }
        std::print("[selfplay] rules written to {}\n", cl.save_rules_path);
    }

    auto built = Composer::Build(*rules, static_cast<uint8_t>(cl.n_players), cl.seed);
    if (!built)
    {
        std::print("[selfplay] {}\n", describe(built.error()));
        return 1;
    }
    std::unique_ptr<MatchState> match = std::move(*built);

    try
    {
        TurnResolver resolver(*match);
        debug::AuditLogger log(cl.log_path);
        resolver.Subscribe(&log);
        log.start(*match);

        std::vector<std::unique_ptr<Agent>> agents;
        agents.reserve(match->PlayerCount());
        for (std::size_t i = 0; i < match->PlayerCount(); ++i)
        {
            agents.emplace_back(std::make_unique<RandomAgent>(cl.seed + static_cast<uint64_t>(i * 1337u), *rules));
        }

        std::uint64_t steps{};
        while (!match->IsOver() && steps < cl.max_steps)
        {
            PlayerIdT const actor = match->CurrentPlayer();
            Intent intent = agents[actor]->Decide(match->SnapshotFor(actor));
            log.intent(intent);

            TurnResolver::Result res = resolver.ResolveIntent(intent);
            if (!res)
            {
                log.rejected(res.error());
                // rolling is always legal for the turn holder
                intent = Intent{ .player = actor, .action = RollIntent{} };
                log.intent(intent);
                res = resolver.ResolveIntent(intent);
                if (!res)
                {
                    std::print("[selfplay] {}\n", error::describe(res.error()));
                    return 1;
                }
            }
            log.outcome(res->outcome);
            debug::CheckInvariants(*match);
            ++steps;
        }

        log.end(*match);

        if (match->Winner().has_value())
            std::print("[selfplay] P{} wins after {} turns ({} steps)\n",
                       static_cast<int>(*match->Winner()), match->TurnNumber(), steps);
        else if (match->IsOver())
            std::print("[selfplay] match over without a winner after {} steps\n", steps);
        else
            std::print("[selfplay] stopped after {} steps, no result\n", steps);
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("{}", e.to_str());
        return 1;
    }

    return 0;
}
