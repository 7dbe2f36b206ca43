#pragma once

#include <vector>

#include "lyne_board.hpp"
#include "visit_ledger.hpp"

struct Move {
    int cell = -1; // cell entered
    int edge = -1; // edge walked to get there
};

class MoveGenerator {
public:
    explicit MoveGenerator(const LyneBoard& board) : board(board) {}

    // Legal next steps for a path of `color` whose head is `head`, in neighbor order.
    // Empty when the path is at a dead end.
    std::vector<Move> legal_moves(int head, Color color, const VisitLedger& ledger) const;

    // Color rule only: numbered cells and cells of the path's own color
    bool can_enter(int cell, Color color) const;

private:
    const LyneBoard& board;
};
