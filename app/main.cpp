#include <chrono>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>

#include "lyne_board.hpp"
#include "lyne_solver.hpp"
#include "solution_reporter.hpp"
#include "solution_render.hpp"

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [board.txt|-] [--diagonal] [--max-nodes N] [--render out.png]" << std::endl;
}

void printBoard(const LyneBoard& board) {
    for (int r = 0; r < board.rows(); ++r) {
        for (int c = 0; c < board.cols(); ++c) {
            const Cell& cell = board.cell(Position{r, c});
            switch (cell.kind) {
            case CellKind::Blank:
                std::cout << '.';
                break;
            case CellKind::Endpoint:
                std::cout << static_cast<char>(cell.color - 'a' + 'A');
                break;
            case CellKind::ColorNode:
                std::cout << cell.color;
                break;
            case CellKind::Numbered:
                std::cout << cell.capacity;
                break;
            }
        }
        std::cout << std::endl;
    }
}

// Whole argument must be a non-negative decimal count
std::optional<uint64_t> parseNodeBudget(const std::string& text) {
    if (text.empty() || text[0] < '0' || text[0] > '9') return std::nullopt;
    try {
        size_t pos = 0;
        unsigned long long value = std::stoull(text, &pos);
        if (pos != text.size()) return std::nullopt;
        return static_cast<uint64_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string boardPath = "-";
    std::string renderPath;
    Adjacency adjacency = Adjacency::Orthogonal;
    SolverOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--diagonal") {
            adjacency = Adjacency::Diagonal;
        } else if (arg == "--max-nodes" && i + 1 < argc) {
            std::optional<uint64_t> budget = parseNodeBudget(argv[++i]);
            if (!budget) {
                std::cerr << "Error: invalid node budget \"" << argv[i] << "\"" << std::endl;
                return 1;
            }
            options.max_nodes = *budget;
        } else if (arg == "--render" && i + 1 < argc) {
            renderPath = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            printUsage(argv[0]);
            return 1;
        } else {
            boardPath = arg;
        }
    }

    // --- 1. Board Parsing ---
    auto t1_start = std::chrono::high_resolution_clock::now();
    std::optional<LyneBoard> board;
    try {
        if (boardPath == "-") {
            std::string text((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
            board = LyneBoard::parse(text, adjacency);
        } else {
            board = LyneBoard::load(boardPath, adjacency);
        }
    } catch (const MalformedBoard& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    auto t1_end = std::chrono::high_resolution_clock::now();
    auto t1_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1_end - t1_start).count();
    std::cout << "Step 1 (Board Parsing) took: " << t1_ms << " ms" << std::endl;

    std::cout << "Loaded board (" << board->rows() << "x" << board->cols() << ", "
              << board->colors().size() << " colors):" << std::endl;
    printBoard(*board);

    // --- 2. Path Search ---
    LyneSolver solver(options);
    auto t2_start = std::chrono::high_resolution_clock::now();
    SolveResult result = solver.solve(*board);
    auto t2_end = std::chrono::high_resolution_clock::now();
    auto t2_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t2_end - t2_start).count();
    std::cout << "Step 2 (Path Search) took: " << t2_ms << " ms, " << result.nodes << " nodes" << std::endl;

    std::cout << "\nStatus: " << status_name(result.status) << "\n";
    if (result.status != SolveStatus::Solved) {
        if (result.status == SolveStatus::BudgetExhausted) {
            std::cout << "Search stopped after " << options.max_nodes << " nodes without a solution." << std::endl;
        } else {
            std::cout << "no solution" << std::endl;
        }
        return 1;
    }

    print_solution(std::cout, report_solution(result.solution));

    // --- 3. Rendering ---
    if (!renderPath.empty()) {
        auto t3_start = std::chrono::high_resolution_clock::now();
        cv::Mat overlay = render_solution(*board, result.solution);
        bool saved = save_render(overlay, renderPath);
        auto t3_end = std::chrono::high_resolution_clock::now();
        auto t3_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t3_end - t3_start).count();
        std::cout << "Step 3 (Rendering) took: " << t3_ms << " ms" << std::endl;

        if (!saved) {
            std::cerr << "WARNING: Could not save overlay to " << renderPath << std::endl;
        } else {
            std::cout << "Saved: " << renderPath << std::endl;
        }
    }

    return 0;
}
