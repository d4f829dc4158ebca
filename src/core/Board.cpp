//
// Board.cpp
//

#include "Board.hpp"

#include <algorithm>
#include <format>
#include "Exception.hpp"

namespace polyboard::core
{
    BoardModel::BoardModel(RuleConfiguration const& rules) :
        topology_(ComputeTopology(rules))
    {
        PBD_ASSERT(topology_.size > 0, "Board built with zero spaces");
    }

    auto BoardModel::ComputeTopology(RuleConfiguration const& rules) noexcept -> BoardTopology
    {
        uint32_t const side = rules.board.tiles_per_side;
        if (rules.board.separate_boards)
        {
            return BoardTopology{ .size = side * side, .shape = BoardShape::SquareGrid, .side = side };
        }
        // trading matches always play on the standard loop
        if (rules.currency.enabled && rules.property.purchasable)
        {
            return BoardTopology{ .size = constants::StandardLoopSize, .shape = BoardShape::LinearLoop, .side = 0 };
        }
        return BoardTopology{ .size = side, .shape = BoardShape::LinearLoop, .side = 0 };
    }

    auto BoardModel::ToGrid(PosT const pos) const -> GridCoord
    {
        if (!IsGrid())
            PBD_THROW(error::Code::State, "ToGrid called on a loop board");
        if (!IsValid(pos))
            PBD_THROW(error::Code::State, std::format("Position {} outside board of {}", pos, topology_.size));
        return GridCoord{ .x = pos % topology_.side, .y = pos / topology_.side };
    }

    auto BoardModel::FromGrid(GridCoord const coord) const -> PosT
    {
        if (!IsGrid())
            PBD_THROW(error::Code::State, "FromGrid called on a loop board");
        if (coord.x >= topology_.side || coord.y >= topology_.side)
            PBD_THROW(error::Code::State, std::format("Coordinate ({}, {}) outside {}x{} grid",
                                                      coord.x, coord.y, topology_.side, topology_.side));
        return coord.y * topology_.side + coord.x;
    }

    auto BoardModel::IsSpecial(PosT const pos) const -> bool
    {
        if (!IsValid(pos)) return false;

        uint32_t const s = topology_.size;
        if (IsGrid())
        {
            uint32_t const w = topology_.side;
            return pos == 0 || pos == w - 1 || pos == s - w || pos == s - 1;
        }
        return pos == 0 || pos == s / 4 || pos == s / 2 || pos == (3 * s) / 4;
    }

    auto BoardModel::Classify(PosT const pos) const -> SpaceKind
    {
        if (!IsValid(pos))
            PBD_THROW(error::Code::State, std::format("Position {} outside board of {}", pos, topology_.size));

        if (pos == 0) return SpaceKind::Start;
        if (pos == Goal()) return SpaceKind::Goal;
        if (IsSpecial(pos)) return SpaceKind::Special;
        return SpaceKind::Normal;
    }

    auto BoardModel::Distance(PosT const a, PosT const b) const -> uint32_t
    {
        uint32_t const linear = (a > b) ? a - b : b - a;
        if (IsGrid()) return linear;

        uint32_t const s = topology_.size;
        uint32_t const forward = (b + s - (a % s)) % s;
        uint32_t const backward = (a + s - (b % s)) % s;
        return std::min(forward, backward);
    }
}
