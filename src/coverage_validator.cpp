#include "coverage_validator.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace {

bool ends_match(const LyneBoard& board, const Path& path) {
    const EndpointPair* pair = board.find_color(path.color);
    if (pair == nullptr || path.cells.size() < 2) return false;

    const Position& front = path.cells.front();
    const Position& back = path.cells.back();
    return (front == pair->first && back == pair->second) ||
           (front == pair->second && back == pair->first);
}

const Link* find_link(const LyneBoard& board, int from, int to) {
    for (const Link& link : board.links(from)) {
        if (link.to == to) return &link;
    }
    return nullptr;
}

} // namespace

bool validate_coverage(const LyneBoard& board, const Solution& solution, const VisitLedger& ledger) {
    if (!ledger.exhausted()) return false;
    for (int i = 0; i < board.cell_count(); ++i) {
        if (ledger.remaining(i) != 0) return false;
    }

    if (solution.size() != board.colors().size()) return false;
    for (const Path& path : solution) {
        if (!ends_match(board, path)) return false;
    }
    return true;
}

bool validate_solution(const LyneBoard& board, const Solution& solution) {
    if (solution.size() != board.colors().size()) return false;

    std::vector<int> visits(board.cell_count(), 0);
    std::vector<uint8_t> walked(board.edge_count(), 0);
    std::array<bool, 26> routed{};

    for (const Path& path : solution) {
        if (!ends_match(board, path)) return false;
        bool& seen = routed[path.color - 'a'];
        if (seen) return false;
        seen = true;

        for (size_t i = 0; i < path.cells.size(); ++i) {
            const Position p = path.cells[i];
            if (!board.in_bounds(p)) return false;

            const Cell& c = board.cell(p);
            const bool at_end = i == 0 || i + 1 == path.cells.size();
            switch (c.kind) {
            case CellKind::Blank:
                return false;
            case CellKind::Endpoint:
                if (!at_end || c.color != path.color) return false;
                break;
            case CellKind::ColorNode:
                if (at_end || c.color != path.color) return false;
                break;
            case CellKind::Numbered:
                if (at_end) return false;
                break;
            }
            ++visits[board.index(p)];

            if (i == 0) continue;
            const Link* link = find_link(board, board.index(path.cells[i - 1]), board.index(p));
            if (link == nullptr) return false;
            if (walked[link->edge] != 0) return false;
            if (link->crossing >= 0 && walked[link->crossing] != 0) return false;
            walked[link->edge] = 1;
        }
    }

    for (int i = 0; i < board.cell_count(); ++i) {
        if (visits[i] != board.cell(i).capacity) return false;
    }
    return true;
}
