#pragma once

#include <cstdint>
#include <vector>

// Lowercase letter naming a color ('r', 'g', 'b', ...)
using Color = char;

struct Position {
    int row = 0;
    int col = 0;

    bool operator==(const Position&) const = default;
};

enum class CellKind : uint8_t {
    Blank,
    Endpoint,
    ColorNode,
    Numbered,
};

// One board cell. `color` is set for Endpoint and ColorNode only,
// `capacity` is the number of times the cell must be entered.
struct Cell {
    CellKind kind = CellKind::Blank;
    Color color = 0;
    int capacity = 0;

    bool is_colored() const { return kind == CellKind::Endpoint || kind == CellKind::ColorNode; }
};

enum class Adjacency : uint8_t {
    Orthogonal, // 4 neighbors
    Diagonal,   // 8 neighbors, diagonals of a 2x2 block may not cross
};

enum class Direction : uint8_t {
    Right,
    DownRight,
    Down,
    DownLeft,
    Left,
    UpLeft,
    Up,
    UpRight,
};

struct Path {
    Color color = 0;
    std::vector<Position> cells;
};

// One path per color, in color order
using Solution = std::vector<Path>;
