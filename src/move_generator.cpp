#include "move_generator.hpp"

bool MoveGenerator::can_enter(int cell, Color color) const {
    const Cell& c = board.cell(cell);
    switch (c.kind) {
    case CellKind::Blank:
        return false;
    case CellKind::Numbered:
        return true;
    case CellKind::Endpoint:
    case CellKind::ColorNode:
        return c.color == color;
    }
    return false;
}

std::vector<Move> MoveGenerator::legal_moves(int head, Color color, const VisitLedger& ledger) const {
    std::vector<Move> moves;
    for (const Link& link : board.links(head)) {
        if (ledger.remaining(link.to) <= 0) continue;
        if (ledger.edge_used(link.edge)) continue;
        if (ledger.edge_used(link.crossing)) continue;
        if (!can_enter(link.to, color)) continue;
        moves.push_back({link.to, link.edge});
    }
    return moves;
}
