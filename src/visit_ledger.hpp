#pragma once

#include <cstdint>
#include <vector>

class LyneBoard;

// Live per-cell remaining-visit counters and per-edge usage for one search.
// Every mutation has an exact inverse used when backtracking.
class VisitLedger {
public:
    VisitLedger() = default;
    explicit VisitLedger(const LyneBoard& board) { reset(board); }

    void reset(const LyneBoard& board);

    int remaining(int cell) const { return remaining_visits[cell]; }
    int remaining_total() const { return total; }
    bool exhausted() const { return total == 0; }

    bool edge_used(int edge) const { return edge >= 0 && used_edges[edge] != 0; }
    int unused_edges() const { return free_edges; }

    void enter(int cell);
    void undo_enter(int cell);
    void use_edge(int edge);
    void release_edge(int edge);

private:
    std::vector<int> remaining_visits;
    std::vector<uint8_t> used_edges;
    int total = 0;
    int free_edges = 0;
};
