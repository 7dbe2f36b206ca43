#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "lyne_board.hpp"
#include "move_generator.hpp"
#include "visit_ledger.hpp"

enum class SolveStatus {
    Solved,
    Unsolvable,
    BudgetExhausted, // max_nodes reached before the search finished
};

const char* status_name(SolveStatus status);

struct SolverOptions {
    uint64_t max_nodes = 0; // 0 = unlimited
};

struct SolveResult {
    SolveStatus status = SolveStatus::Unsolvable;
    Solution solution;
    uint64_t nodes = 0; // search frames explored
};

class LyneSolver {
public:
    explicit LyneSolver(SolverOptions options = {}) : options(options) {}

    SolveResult solve(const LyneBoard& board);

private:
    SolverOptions options;

    // State of the running search, reset by solve()
    const LyneBoard* board = nullptr;
    std::optional<MoveGenerator> generator;
    VisitLedger ledger;
    std::vector<std::vector<int>> paths; // cell indices per color
    std::vector<int> outstanding;        // color nodes not yet visited per color
    uint64_t nodes = 0;
    bool aborted = false;

    void place(size_t k, const Move& move);
    void remove(size_t k, const Move& move);
    bool solve_color(size_t k);
    bool solve_recursive(size_t k, int head);
    bool pruned(size_t k, int from, int dest, bool closing) const;
    Solution collect_solution() const;
};
