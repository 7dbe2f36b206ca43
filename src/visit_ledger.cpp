#include "visit_ledger.hpp"

#include "lyne_board.hpp"

void VisitLedger::reset(const LyneBoard& board) {
    remaining_visits.resize(board.cell_count());
    for (int i = 0; i < board.cell_count(); ++i) remaining_visits[i] = board.cell(i).capacity;
    used_edges.assign(board.edge_count(), 0);
    total = board.total_capacity();
    free_edges = board.edge_count();
}

void VisitLedger::enter(int cell) {
    --remaining_visits[cell];
    --total;
}

void VisitLedger::undo_enter(int cell) {
    ++remaining_visits[cell];
    ++total;
}

void VisitLedger::use_edge(int edge) {
    used_edges[edge] = 1;
    --free_edges;
}

void VisitLedger::release_edge(int edge) {
    used_edges[edge] = 0;
    ++free_edges;
}
