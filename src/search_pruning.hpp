#pragma once

#include "lyne_board.hpp"
#include "visit_ledger.hpp"

// Every remaining entry walks its own unused edge. Start endpoints of the
// `unstarted` colors are entered without one.
bool exceeds_edge_budget(const VisitLedger& ledger, int unstarted);

// A cell that still needs visits but can no longer get them: an endpoint needs one
// open edge, a node or numbered cell two per remaining visit. An edge is open when unused,
// not crossed, and leads to a compatible cell that is either the active head or still enterable.
// `head` is -1 when no path is being extended.
bool is_stranded(const LyneBoard& board, const VisitLedger& ledger, int cell, int head, Color active);
