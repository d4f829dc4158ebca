//
// Board.hpp
//

#ifndef POLYBOARD_BOARD_HPP
#define POLYBOARD_BOARD_HPP

#include "Types.hpp"

namespace polyboard::core
{
    class BoardModel
    {
    public:
        BoardModel() = delete;
        explicit BoardModel(RuleConfiguration const& rules);

        // Single source of truth for board size; every other module asks the board.
        static auto ComputeTopology(RuleConfiguration const& rules) noexcept -> BoardTopology;

        auto Size() const noexcept     -> uint32_t      { return topology_.size; }
        auto Shape() const noexcept    -> BoardShape    { return topology_.shape; }
        auto Topology() const noexcept -> BoardTopology { return topology_; }
        auto Goal() const noexcept     -> PosT          { return topology_.size - 1; }

        auto IsValid(PosT pos) const noexcept -> bool { return pos < topology_.size; }
        auto IsGrid() const noexcept -> bool { return topology_.shape == BoardShape::SquareGrid; }

        // Grid boards only; throws on a loop or an out of range position.
        auto ToGrid(PosT pos) const -> GridCoord;
        auto FromGrid(GridCoord coord) const -> PosT;

        auto IsSpecial(PosT pos) const -> bool;
        auto Classify(PosT pos) const -> SpaceKind;
        auto Distance(PosT a, PosT b) const -> uint32_t;

    private:
        BoardTopology topology_;
    };
}

#endif //POLYBOARD_BOARD_HPP
