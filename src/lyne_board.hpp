#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "lyne_types.hpp"

// Structural defect in a board description. Search never starts on one.
class MalformedBoard : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Connection from a cell to one of its neighbors
struct Link {
    int to = -1;
    int edge = -1;
    int crossing = -1; // diagonal edge crossing this one, -1 if none
    Direction direction = Direction::Right;
};

struct EndpointPair {
    Color color = 0;
    Position first;  // start of the path (first in row-major order)
    Position second; // where the path must end
    int node_count = 0;
};

class LyneBoard {
public:
    static LyneBoard parse(std::string_view text, Adjacency adjacency = Adjacency::Orthogonal);
    static LyneBoard load(const std::string& path, Adjacency adjacency = Adjacency::Orthogonal);

    int rows() const { return n_rows; }
    int cols() const { return n_cols; }
    int cell_count() const { return n_rows * n_cols; }
    Adjacency adjacency() const { return mode; }

    bool in_bounds(Position p) const { return p.row >= 0 && p.row < n_rows && p.col >= 0 && p.col < n_cols; }
    int index(Position p) const { return p.row * n_cols + p.col; }
    Position position(int idx) const { return {idx / n_cols, idx % n_cols}; }

    const Cell& cell(int idx) const { return cells[idx]; }
    const Cell& cell(Position p) const { return cells[index(p)]; }

    const std::vector<Link>& links(int idx) const { return cell_links[idx]; }
    std::vector<Position> neighbors(Position p) const;

    // Edge id joining two cells, -1 when they are not adjacent
    int edge_between(int a, int b) const;
    int edge_count() const { return n_edges; }

    const std::vector<EndpointPair>& colors() const { return color_pairs; }
    const EndpointPair* find_color(Color c) const;
    int total_capacity() const { return capacity_sum; }

private:
    LyneBoard(int rows, int cols, std::vector<Cell> cells, Adjacency adjacency);

    void build_links();
    void collect_colors();

    int n_rows = 0;
    int n_cols = 0;
    Adjacency mode = Adjacency::Orthogonal;
    std::vector<Cell> cells;
    std::vector<std::vector<Link>> cell_links;
    std::vector<EndpointPair> color_pairs;
    int n_edges = 0;
    int capacity_sum = 0;
};

Position step(Position p, Direction d);
Direction direction_between(Position from, Position to);
const char* direction_name(Direction d);
bool is_diagonal(Direction d);
