#include "search_pruning.hpp"

bool exceeds_edge_budget(const VisitLedger& ledger, int unstarted) {
    return ledger.remaining_total() - unstarted > ledger.unused_edges();
}

bool is_stranded(const LyneBoard& board, const VisitLedger& ledger, int cell, int head, Color active) {
    const int left = ledger.remaining(cell);
    if (left <= 0 || cell == head) return false;

    const Cell& c = board.cell(cell);
    const int needed = c.kind == CellKind::Endpoint ? 1 : 2 * left;

    int open = 0;
    for (const Link& link : board.links(cell)) {
        if (ledger.edge_used(link.edge) || ledger.edge_used(link.crossing)) continue;

        const Cell& other = board.cell(link.to);
        if (c.is_colored() && other.is_colored() && other.color != c.color) continue;

        const bool live = ledger.remaining(link.to) > 0 ||
                          (link.to == head && (!c.is_colored() || c.color == active));
        if (live && ++open >= needed) return false;
    }
    return true;
}
