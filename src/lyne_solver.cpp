#include "lyne_solver.hpp"

#include <utility>

#include "coverage_validator.hpp"
#include "search_pruning.hpp"

/**
 * LYNE path search
 * * Colors are routed one at a time in board order: a path grows from the
 *   color's first endpoint until it enters the second one, then the next color starts.
 * * A single VisitLedger is mutated in place; every step is undone exactly on backtrack.
 * * Pruning:
 *   1. Premature closure: the far endpoint may only be entered once all color nodes are visited.
 *   2. Stranded cells: a cell that still needs visits must keep enough open, live edges.
 *   3. Edge budget: each remaining entry needs its own unused edge.
 */

const char* status_name(SolveStatus status) {
    switch (status) {
    case SolveStatus::Solved:
        return "Solved";
    case SolveStatus::Unsolvable:
        return "Unsolvable";
    case SolveStatus::BudgetExhausted:
        return "BudgetExhausted";
    }
    return "Unsolvable";
}

SolveResult LyneSolver::solve(const LyneBoard& input) {
    // Reset state
    board = &input;
    generator.emplace(input);
    ledger.reset(input);
    paths.assign(input.colors().size(), {});
    outstanding.assign(input.colors().size(), 0);
    nodes = 0;
    aborted = false;

    SolveResult result;
    if (solve_color(0)) {
        result.status = SolveStatus::Solved;
        result.solution = collect_solution();
    } else {
        result.status = aborted ? SolveStatus::BudgetExhausted : SolveStatus::Unsolvable;
    }
    result.nodes = nodes;

    generator.reset();
    board = nullptr;
    return result;
}

// Apply one step of path k (ledger entry, edge, path append)
void LyneSolver::place(size_t k, const Move& move) {
    ledger.enter(move.cell);
    ledger.use_edge(move.edge);
    paths[k].push_back(move.cell);
    if (board->cell(move.cell).kind == CellKind::ColorNode) --outstanding[k];
}

// Exact inverse of place()
void LyneSolver::remove(size_t k, const Move& move) {
    if (board->cell(move.cell).kind == CellKind::ColorNode) ++outstanding[k];
    paths[k].pop_back();
    ledger.release_edge(move.edge);
    ledger.undo_enter(move.cell);
}

bool LyneSolver::solve_color(size_t k) {
    const std::vector<EndpointPair>& colors = board->colors();
    if (k == colors.size()) {
        return validate_coverage(*board, collect_solution(), ledger);
    }

    const EndpointPair& pair = colors[k];
    const int start = board->index(pair.first);
    ledger.enter(start);
    paths[k].push_back(start);
    outstanding[k] = pair.node_count;

    if (solve_recursive(k, start)) return true;

    // backtrack into the previous color
    paths[k].pop_back();
    ledger.undo_enter(start);
    return false;
}

bool LyneSolver::solve_recursive(size_t k, int head) {
    if (options.max_nodes != 0 && nodes >= options.max_nodes) {
        aborted = true;
        return false;
    }
    ++nodes;

    const EndpointPair& pair = board->colors()[k];
    const int target = board->index(pair.second);

    for (const Move& move : generator->legal_moves(head, pair.color, ledger)) {
        const bool closing = move.cell == target;
        if (closing && outstanding[k] > 0) continue;

        place(k, move);
        if (!pruned(k, head, move.cell, closing)) {
            if (closing ? solve_color(k + 1) : solve_recursive(k, move.cell)) return true;
        }
        remove(k, move);

        if (aborted) return false;
    }
    return false; // dead end
}

bool LyneSolver::pruned(size_t k, int from, int dest, bool closing) const {
    // Start endpoints of colors not yet routed are entered without walking an edge
    const int unstarted = static_cast<int>(board->colors().size() - k - 1);
    if (exceeds_edge_budget(ledger, unstarted)) return true;

    const int head = closing ? -1 : dest;
    const Color active = board->colors()[k].color;

    if (is_stranded(*board, ledger, from, head, active) || is_stranded(*board, ledger, dest, head, active)) return true;
    for (const Link& link : board->links(from)) {
        if (is_stranded(*board, ledger, link.to, head, active)) return true;
    }
    for (const Link& link : board->links(dest)) {
        if (is_stranded(*board, ledger, link.to, head, active)) return true;
    }
    return false;
}

Solution LyneSolver::collect_solution() const {
    Solution solution;
    solution.reserve(paths.size());
    for (size_t k = 0; k < paths.size(); ++k) {
        Path path;
        path.color = board->colors()[k].color;
        for (int idx : paths[k]) path.cells.push_back(board->position(idx));
        solution.push_back(std::move(path));
    }
    return solution;
}
