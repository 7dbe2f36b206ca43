#include "lyne_board.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>
#include <utility>

namespace {

constexpr int DIRECTION_COUNT = 8;

// Row/column offsets in Direction order (clockwise from Right)
constexpr std::array<Position, DIRECTION_COUNT> OFFSETS = {{
    {0, 1}, {1, 1}, {1, 0}, {1, -1}, {0, -1}, {-1, -1}, {-1, 0}, {-1, 1},
}};

constexpr std::array<const char*, DIRECTION_COUNT> DIRECTION_NAMES = {
    "Right", "DownRight", "Down", "DownLeft", "Left", "UpLeft", "Up", "UpRight",
};

Direction opposite(Direction d) {
    return static_cast<Direction>((static_cast<int>(d) + 4) % DIRECTION_COUNT);
}

std::string describe_symbol(char ch) {
    std::ostringstream out;
    if (ch >= 0x21 && ch <= 0x7e) out << '\'' << ch << '\'';
    else out << "0x" << std::hex << static_cast<int>(static_cast<unsigned char>(ch));
    return out.str();
}

Cell parse_symbol(char ch, int row, int col) {
    if (ch >= 'a' && ch <= 'z') return {CellKind::ColorNode, ch, 1};
    if (ch >= 'A' && ch <= 'Z') return {CellKind::Endpoint, static_cast<Color>(ch - 'A' + 'a'), 1};
    if (ch >= '1' && ch <= '9') return {CellKind::Numbered, 0, ch - '0'};
    if (ch == '.') return {};

    std::ostringstream msg;
    msg << "unrecognized cell symbol " << describe_symbol(ch) << " at row " << row << ", column " << col;
    throw MalformedBoard(msg.str());
}

} // namespace

Position step(Position p, Direction d) {
    const Position& off = OFFSETS[static_cast<int>(d)];
    return {p.row + off.row, p.col + off.col};
}

Direction direction_between(Position from, Position to) {
    for (int d = 0; d < DIRECTION_COUNT; ++d) {
        if (step(from, static_cast<Direction>(d)) == to) return static_cast<Direction>(d);
    }
    throw std::invalid_argument("positions are not adjacent");
}

const char* direction_name(Direction d) {
    return DIRECTION_NAMES[static_cast<int>(d)];
}

bool is_diagonal(Direction d) {
    return static_cast<int>(d) % 2 == 1;
}

LyneBoard::LyneBoard(int rows, int cols, std::vector<Cell> cells, Adjacency adjacency)
    : n_rows(rows), n_cols(cols), mode(adjacency), cells(std::move(cells)) {
    for (const Cell& c : this->cells) capacity_sum += c.capacity;
    collect_colors();
    build_links();
}

LyneBoard LyneBoard::parse(std::string_view text, Adjacency adjacency) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        start = end + 1;
    }
    while (!lines.empty() && lines.back().empty()) lines.pop_back();

    if (lines.empty()) throw MalformedBoard("empty board");

    const size_t width = lines.front().size();
    if (width == 0) throw MalformedBoard("row 0 is empty");

    std::vector<Cell> cells;
    cells.reserve(lines.size() * width);
    for (size_t r = 0; r < lines.size(); ++r) {
        if (lines[r].size() != width) {
            std::ostringstream msg;
            msg << "board is not rectangular: row " << r << " has length " << lines[r].size()
                << ", expected " << width;
            throw MalformedBoard(msg.str());
        }
        for (size_t c = 0; c < width; ++c) {
            cells.push_back(parse_symbol(lines[r][c], static_cast<int>(r), static_cast<int>(c)));
        }
    }

    return LyneBoard(static_cast<int>(lines.size()), static_cast<int>(width), std::move(cells), adjacency);
}

LyneBoard LyneBoard::load(const std::string& path, Adjacency adjacency) {
    std::ifstream f(path);
    if (!f.good()) throw MalformedBoard("unable to open file \"" + path + "\"");

    std::ostringstream contents;
    contents << f.rdbuf();
    return parse(contents.str(), adjacency);
}

void LyneBoard::collect_colors() {
    struct Tally {
        std::vector<Position> endpoints;
        int nodes = 0;
        bool seen = false;
    };
    std::array<Tally, 26> tallies;
    std::vector<Color> seen_order;

    for (int i = 0; i < cell_count(); ++i) {
        const Cell& c = cells[i];
        if (!c.is_colored()) continue;
        Tally& t = tallies[c.color - 'a'];
        if (!t.seen) {
            t.seen = true;
            seen_order.push_back(c.color);
        }
        if (c.kind == CellKind::Endpoint) t.endpoints.push_back(position(i));
        else ++t.nodes;
    }

    for (Color color : seen_order) {
        const Tally& t = tallies[color - 'a'];
        if (t.endpoints.size() != 2) {
            std::ostringstream msg;
            msg << "There are " << t.endpoints.size() << " " << static_cast<char>(color - 'a' + 'A')
                << " endpoints, but there should be 2";
            throw MalformedBoard(msg.str());
        }
        color_pairs.push_back({color, t.endpoints[0], t.endpoints[1], t.nodes});
    }

    // Route colors in the order their first endpoint appears
    std::stable_sort(color_pairs.begin(), color_pairs.end(), [this](const EndpointPair& a, const EndpointPair& b) {
        return index(a.first) < index(b.first);
    });
}

void LyneBoard::build_links() {
    // edge ids per cell and direction, -1 where no edge exists
    std::vector<std::array<int, DIRECTION_COUNT>> edge_ids(cell_count());
    for (auto& ids : edge_ids) ids.fill(-1);

    auto allowed = [this](Direction d) { return mode == Adjacency::Diagonal || !is_diagonal(d); };

    // Number each edge once, from the cell where it points forward
    for (int i = 0; i < cell_count(); ++i) {
        for (int d = 0; d < 4; ++d) {
            Direction dir = static_cast<Direction>(d);
            if (!allowed(dir)) continue;
            Position q = step(position(i), dir);
            if (!in_bounds(q)) continue;
            edge_ids[i][d] = n_edges;
            edge_ids[index(q)][static_cast<int>(opposite(dir))] = n_edges;
            ++n_edges;
        }
    }

    cell_links.assign(cell_count(), {});
    for (int i = 0; i < cell_count(); ++i) {
        Position p = position(i);
        for (int d = 0; d < DIRECTION_COUNT; ++d) {
            if (edge_ids[i][d] < 0) continue;
            Direction dir = static_cast<Direction>(d);
            Position q = step(p, dir);

            Link link;
            link.to = index(q);
            link.edge = edge_ids[i][d];
            link.direction = dir;
            if (is_diagonal(dir)) {
                // the other diagonal of the same 2x2 block
                const Position& off = OFFSETS[d];
                int a = index({p.row, p.col + off.col});
                int b = index({p.row + off.row, p.col});
                link.crossing = edge_ids[a][static_cast<int>(direction_between(position(a), position(b)))];
            }
            cell_links[i].push_back(link);
        }
    }
}

std::vector<Position> LyneBoard::neighbors(Position p) const {
    std::vector<Position> out;
    for (const Link& link : links(index(p))) out.push_back(position(link.to));
    return out;
}

int LyneBoard::edge_between(int a, int b) const {
    for (const Link& link : links(a)) {
        if (link.to == b) return link.edge;
    }
    return -1;
}

const EndpointPair* LyneBoard::find_color(Color c) const {
    for (const EndpointPair& pair : color_pairs) {
        if (pair.color == c) return &pair;
    }
    return nullptr;
}
