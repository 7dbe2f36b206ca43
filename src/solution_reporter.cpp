#include "solution_reporter.hpp"

#include <sstream>
#include <utility>

#include "lyne_board.hpp"

std::vector<ColorTrace> report_solution(const Solution& solution) {
    std::vector<ColorTrace> traces;
    traces.reserve(solution.size());
    for (const Path& path : solution) {
        ColorTrace trace;
        trace.color = path.color;
        trace.cells = path.cells;
        for (size_t i = 1; i < path.cells.size(); ++i) {
            trace.steps.push_back({path.cells[i - 1], path.cells[i], direction_between(path.cells[i - 1], path.cells[i])});
        }
        traces.push_back(std::move(trace));
    }
    return traces;
}

std::string color_name(Color color) {
    switch (color) {
    case 'r':
        return "Red";
    case 'g':
        return "Green";
    case 'b':
        return "Blue";
    default:
        return std::string("Color ") + color;
    }
}

std::string format_solution(const std::vector<ColorTrace>& traces) {
    std::ostringstream out;
    print_solution(out, traces);
    return out.str();
}

void print_solution(std::ostream& out, const std::vector<ColorTrace>& traces) {
    for (const ColorTrace& trace : traces) {
        out << color_name(trace.color) << ":\n";
        for (const Step& s : trace.steps) {
            out << direction_name(s.direction) << " " << s.from.row << " " << s.from.col
                << " -> " << s.to.row << " " << s.to.col << "\n";
        }
    }
}
