#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "lyne_types.hpp"

struct Step {
    Position from;
    Position to;
    Direction direction = Direction::Right;
};

// Renderable form of one color's path
struct ColorTrace {
    Color color = 0;
    std::vector<Position> cells;
    std::vector<Step> steps;
};

std::vector<ColorTrace> report_solution(const Solution& solution);

// "Red", "Green", "Blue", otherwise "Color x"
std::string color_name(Color color);

// One "<Name>:" header per color followed by one "<Direction> r c -> r c" line per step
std::string format_solution(const std::vector<ColorTrace>& traces);
void print_solution(std::ostream& out, const std::vector<ColorTrace>& traces);
