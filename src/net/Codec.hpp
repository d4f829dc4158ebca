//
// Codec.hpp
//

#ifndef POLYBOARD_CODEC_HPP
#define POLYBOARD_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <span>
#include <string>
#include <expected>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Events.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/polyboard_net_generated.h"
#include "generated/flatbuffers/polyboard_rules_generated.h"

namespace polyboard::core::net
{
    struct ParseError
    {
        std::string message;
    };

    // What an inbound intent decodes into
    struct DecodedIntent
    {
        std::uint64_t msg_id{};
        polyboard::core::Intent intent{};
    };

    auto ToFbPhase(polyboard::core::TurnPhase p) noexcept -> polyboard::gen::net::Phase;
    auto FromFbPhase(polyboard::gen::net::Phase p) noexcept -> polyboard::core::TurnPhase;
    auto ToFbShape(polyboard::core::BoardShape s) noexcept -> polyboard::gen::net::BoardShape;
    auto FromFbShape(polyboard::gen::net::BoardShape s) noexcept -> polyboard::core::BoardShape;

    auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>;

    // ----- Rule document (persistence) -----

    auto EncodeRuleDocument(polyboard::core::RuleConfiguration const& rules) -> flatbuffers::DetachedBuffer;

    // Verifies the buffer; absent fields take their defaults. Conflicts are the composer's business.
    auto DecodeRuleDocument(std::span<std::byte const> bytes)
        -> std::expected<polyboard::core::RuleConfiguration, ParseError>;

    auto SaveRuleDocument(std::string const& path, polyboard::core::RuleConfiguration const& rules)
        -> std::expected<void, ParseError>;
    auto LoadRuleDocument(std::string const& path)
        -> std::expected<polyboard::core::RuleConfiguration, ParseError>;

    // ----- Outbound (authority -> client) -----

    auto BuildSnapshot(polyboard::core::MatchSnapshot const& snap,
                       std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildEvent(polyboard::core::MatchEvent const& event,
                    std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildViolation(polyboard::core::error::RuleViolation const& v,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // ----- Client -> authority -----

    auto BuildIntent(polyboard::core::Intent const& intent,
                     std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto DecodeIntent(std::span<std::byte const> bytes)
        -> std::expected<DecodedIntent, ParseError>;

    // Verified access to any envelope.
    auto ReadEnvelope(std::span<std::byte const> bytes)
        -> std::expected<polyboard::gen::net::Envelope const*, ParseError>;
} // namespace polyboard::core::net


#endif //POLYBOARD_CODEC_HPP
