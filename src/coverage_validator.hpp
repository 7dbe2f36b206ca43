#pragma once

#include "lyne_board.hpp"
#include "visit_ledger.hpp"

// Terminal-state check used by the search: the ledger is fully consumed and
// every path runs between its color's two endpoints.
bool validate_coverage(const LyneBoard& board, const Solution& solution, const VisitLedger& ledger);

// Full check of a solution from its paths alone, independent of any search state:
// one path per color between its endpoints, adjacent steps, no edge walked twice,
// no crossed diagonals, no cell of another color, and every cell visited exactly
// as many times as its capacity.
bool validate_solution(const LyneBoard& board, const Solution& solution);
