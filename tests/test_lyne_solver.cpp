#include "lyne_solver.hpp"
#include "coverage_validator.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool ok, const std::string& what) {
    std::cout << (ok ? "[ok]   " : "[FAIL] ") << what << "\n";
    if (!ok) ++failures;
}

static bool same_solution(const Solution& a, const Solution& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].color != b[i].color || a[i].cells != b[i].cells) return false;
    }
    return true;
}

// Invariants checked directly from the paths, without the validator
static void check_invariants(const LyneBoard& board, const Solution& solution, const std::string& name) {
    std::vector<int> visits(board.cell_count(), 0);
    bool adjacent = true;
    bool ends = true;
    bool no_foreign = true;

    for (const Path& path : solution) {
        const EndpointPair* pair = board.find_color(path.color);
        ends = ends && pair != nullptr && path.cells.size() >= 2 &&
               ((path.cells.front() == pair->first && path.cells.back() == pair->second) ||
                (path.cells.front() == pair->second && path.cells.back() == pair->first));

        for (size_t i = 0; i < path.cells.size(); ++i) {
            const Cell& c = board.cell(path.cells[i]);
            if (c.is_colored() && c.color != path.color) no_foreign = false;
            ++visits[board.index(path.cells[i])];
            if (i == 0) continue;
            const int dr = std::abs(path.cells[i].row - path.cells[i - 1].row);
            const int dc = std::abs(path.cells[i].col - path.cells[i - 1].col);
            const bool step_ok = board.adjacency() == Adjacency::Orthogonal ? dr + dc == 1
                                                                             : std::max(dr, dc) == 1;
            adjacent = adjacent && step_ok;
        }
    }

    bool coverage = true;
    for (int i = 0; i < board.cell_count(); ++i) {
        coverage = coverage && visits[i] == board.cell(i).capacity;
    }

    check(coverage, name + ": every cell visited exactly its capacity");
    check(ends, name + ": every path joins its two endpoints");
    check(adjacent, name + ": consecutive cells are adjacent");
    check(no_foreign, name + ": no path enters a cell of another color");
    check(validate_solution(board, solution), name + ": validator accepts the solution");
}

int main() {
    LyneSolver solver;

    // Two colors sharing a numbered cell
    {
        LyneBoard board = LyneBoard::parse(".B.\nR2R\n.B.");
        SolveResult result = solver.solve(board);
        check(result.status == SolveStatus::Solved, "plus board is solved");
        Solution expected = {
            {'b', {{0, 1}, {1, 1}, {2, 1}}},
            {'r', {{1, 0}, {1, 1}, {1, 2}}},
        };
        check(same_solution(result.solution, expected), "plus board: blue routed first, both pass the numbered cell");
        check_invariants(board, result.solution, "plus board");
    }

    // Single color covering a 3x3 board, needs backtracking
    {
        LyneBoard board = LyneBoard::parse("Rrr\nrrr\nrrR");
        SolveResult result = solver.solve(board);
        check(result.status == SolveStatus::Solved, "3x3 snake is solved");
        Solution expected = {
            {'r', {{0, 0}, {0, 1}, {0, 2}, {1, 2}, {1, 1}, {1, 0}, {2, 0}, {2, 1}, {2, 2}}},
        };
        check(same_solution(result.solution, expected), "3x3 snake: first path in Right/Down/Left/Up order");
        check(result.nodes >= 8, "3x3 snake: one search frame per step at least");
        check_invariants(board, result.solution, "3x3 snake");
    }

    // The far endpoint is adjacent to the start but nodes are still outstanding
    {
        LyneBoard board = LyneBoard::parse("RR\nrr");
        SolveResult result = solver.solve(board);
        Solution expected = {{'r', {{0, 0}, {1, 0}, {1, 1}, {0, 1}}}};
        check(result.status == SolveStatus::Solved && same_solution(result.solution, expected),
              "path does not close early on its far endpoint");
    }

    // 4x3 example with diagonal moves
    {
        LyneBoard board = LyneBoard::parse("R2B\n2Gr\ngbR\n.GB", Adjacency::Diagonal);
        auto start = std::chrono::high_resolution_clock::now();
        SolveResult result = solver.solve(board);
        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::micro> elapsed = end - start;
        std::cout << "example board: " << status_name(result.status) << " in " << elapsed.count()
                  << " microseconds, " << result.nodes << " nodes\n";

        check(result.status == SolveStatus::Solved, "example board is solved with diagonal moves");
        check(result.solution.size() == 3 && result.solution[0].color == 'r' && result.solution[1].color == 'b' &&
                  result.solution[2].color == 'g',
              "example board: one path per color in board order");
        check_invariants(board, result.solution, "example board");

        SolveResult again = LyneSolver().solve(board);
        check(again.status == result.status && again.nodes == result.nodes &&
                  same_solution(again.solution, result.solution),
              "solving the same board twice gives the same solution");
    }

    // Same example, orthogonal only: the G endpoint at (3,1) is walled in by '.', 'b' and 'B'
    {
        LyneBoard board = LyneBoard::parse("R2B\n2Gr\ngbR\n.GB");
        SolveResult result = solver.solve(board);
        check(result.status == SolveStatus::Unsolvable, "example board is unsolvable with orthogonal moves");
        check(result.solution.empty(), "unsolvable result carries no solution");
        check(solver.solve(board).status == SolveStatus::Unsolvable, "unsolvable verdict is repeatable");
    }

    // Boards with no colors
    {
        SolveResult blank = solver.solve(LyneBoard::parse("...\n..."));
        check(blank.status == SolveStatus::Solved && blank.solution.empty(),
              "all-blank board is solved by the empty solution");

        SolveResult numbered = solver.solve(LyneBoard::parse("2.\n.."));
        check(numbered.status == SolveStatus::Unsolvable, "numbered cell with no color to route is unsolvable");
    }

    // Endpoint walled in by another color
    {
        LyneBoard board = LyneBoard::parse("GgG\ngRg\n.g.\n..R");
        check(solver.solve(board).status == SolveStatus::Unsolvable, "red endpoint ringed by green is unsolvable");
    }

    // More visits than edges available
    {
        LyneBoard board = LyneBoard::parse("2R\n2R");
        check(solver.solve(board).status == SolveStatus::Unsolvable, "edges cannot be walked twice");
    }

    // Crossing diagonals
    {
        LyneBoard board = LyneBoard::parse("RB\nBR", Adjacency::Diagonal);
        check(solver.solve(board).status == SolveStatus::Unsolvable, "two diagonals of one block cannot both be used");
    }

    // Malformed input never reaches the search
    {
        bool raised = false;
        try {
            LyneSolver().solve(LyneBoard::parse("R.R\n.R."));
        } catch (const MalformedBoard&) {
            raised = true;
        }
        check(raised, "three R endpoints raise MalformedBoard");
    }

    // Effort bounds: these boards only finish inside the budget when dead ends are cut early
    {
        LyneBoard board = LyneBoard::parse("Rrrrrr\nrrrrrr\nrrrrrr\nrrrrrr\nrrrrrr\nrrrrrR");
        SolverOptions options;
        options.max_nodes = 200000;
        SolveResult result = LyneSolver(options).solve(board);
        check(result.status == SolveStatus::Unsolvable, "6x6 single color is refuted within 200000 nodes");
        check(result.nodes < options.max_nodes, "6x6 single color: refutation stays under the budget");
    }
    {
        LyneBoard board = LyneBoard::parse("Rrrrr\nrrrrr\nrrrrr\nrrrrr\nrrrrr\nrrrrr\nrrrrR");
        SolverOptions options;
        options.max_nodes = 500000;
        SolveResult result = LyneSolver(options).solve(board);
        check(result.status == SolveStatus::Solved, "7x5 snake is solved within 500000 nodes");
        check(validate_solution(board, result.solution), "7x5 snake: solution covers every cell");
    }

    // Search budget
    {
        LyneBoard board = LyneBoard::parse("Rrr\nrrr\nrrR");
        SolverOptions tight;
        tight.max_nodes = 1;
        SolveResult stopped = LyneSolver(tight).solve(board);
        check(stopped.status == SolveStatus::BudgetExhausted, "tiny node budget stops the search");
        check(stopped.nodes == 1 && stopped.solution.empty(), "budgeted search reports nodes and no solution");

        SolverOptions roomy;
        roomy.max_nodes = 1000000;
        check(LyneSolver(roomy).solve(board).status == SolveStatus::Solved, "large budget does not get in the way");
    }

    check(std::string(status_name(SolveStatus::BudgetExhausted)) == "BudgetExhausted", "status names");

    std::cout << "\n" << (failures == 0 ? "All solver checks passed" : "Solver checks FAILED") << "\n";
    return failures == 0 ? 0 : 1;
}
