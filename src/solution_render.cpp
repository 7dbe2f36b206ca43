#include "solution_render.hpp"

#include <algorithm>
#include <array>
#include <iostream>
#include <string>
#include <opencv2/opencv.hpp>

namespace {

const cv::Scalar BACKGROUND(60, 60, 60);
const cv::Scalar BLANK_FILL(25, 25, 25);
const cv::Scalar GRID_LINE(90, 90, 90);
const cv::Scalar NUMBER_INK(235, 235, 235);

// Colors other than r/g/b, indexed by letter
const std::array<cv::Scalar, 8> PALETTE = {
    cv::Scalar(0, 200, 255),   // yellow
    cv::Scalar(200, 0, 200),   // magenta
    cv::Scalar(200, 200, 0),   // cyan
    cv::Scalar(0, 128, 255),   // orange
    cv::Scalar(180, 105, 255), // pink
    cv::Scalar(255, 255, 255), // white
    cv::Scalar(0, 100, 100),   // olive
    cv::Scalar(140, 70, 20),   // navy
};

cv::Point cell_center(Position p, int cell_size) {
    return cv::Point(p.col * cell_size + cell_size / 2, p.row * cell_size + cell_size / 2);
}

cv::Rect cell_rect(Position p, int cell_size) {
    return cv::Rect(p.col * cell_size, p.row * cell_size, cell_size, cell_size);
}

// Inset square centered on a cell
cv::Rect inset_rect(Position p, int cell_size, int margin) {
    cv::Rect r = cell_rect(p, cell_size);
    return cv::Rect(r.x + margin, r.y + margin, r.width - 2 * margin, r.height - 2 * margin);
}

void draw_cells(cv::Mat& image, const LyneBoard& board, int cell_size) {
    for (int i = 0; i < board.cell_count(); ++i) {
        const Position p = board.position(i);
        const cv::Scalar fill = board.cell(i).kind == CellKind::Blank ? BLANK_FILL : BACKGROUND;
        cv::rectangle(image, cell_rect(p, cell_size), fill, cv::FILLED);
        cv::rectangle(image, cell_rect(p, cell_size), GRID_LINE, 1);
    }
}

/**
 * Draws the symbol of every non-blank cell, kept inside the cell so path
 * segments crossing the cell border stay visible.
 * * Endpoint: filled square in the color.
 * * Color node: square outline in the color.
 * * Numbered: circle outline with its capacity written inside.
 */
void draw_glyphs(cv::Mat& image, const LyneBoard& board, int cell_size) {
    const int margin = std::max(2, cell_size / 5);
    const int thickness = std::max(1, cell_size / 16);

    for (int i = 0; i < board.cell_count(); ++i) {
        const Position p = board.position(i);
        const Cell& c = board.cell(i);
        switch (c.kind) {
        case CellKind::Blank:
            break;
        case CellKind::Endpoint:
            cv::rectangle(image, inset_rect(p, cell_size, margin), color_bgr(c.color), cv::FILLED);
            break;
        case CellKind::ColorNode:
            cv::rectangle(image, inset_rect(p, cell_size, margin), color_bgr(c.color), thickness);
            break;
        case CellKind::Numbered: {
            const int radius = cell_size / 2 - margin;
            cv::circle(image, cell_center(p, cell_size), radius, NUMBER_INK, thickness);

            const std::string label = std::to_string(c.capacity);
            const double scale = cell_size / 64.0;
            int baseline = 0;
            cv::Size text = cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, scale, thickness, &baseline);
            cv::Point origin = cell_center(p, cell_size) + cv::Point(-text.width / 2, text.height / 2);
            cv::putText(image, label, origin, cv::FONT_HERSHEY_SIMPLEX, scale, NUMBER_INK, thickness);
            break;
        }
        }
    }
}

} // namespace

cv::Scalar color_bgr(Color color) {
    switch (color) {
    case 'r':
        return cv::Scalar(0, 0, 220);
    case 'g':
        return cv::Scalar(0, 180, 0);
    case 'b':
        return cv::Scalar(220, 80, 0);
    default:
        return PALETTE[(color - 'a') % PALETTE.size()];
    }
}

cv::Mat render_board(const LyneBoard& board, int cell_size) {
    cv::Mat image(board.rows() * cell_size, board.cols() * cell_size, CV_8UC3, BACKGROUND);
    draw_cells(image, board, cell_size);
    draw_glyphs(image, board, cell_size);
    return image;
}

cv::Mat render_solution(const LyneBoard& board, const Solution& solution, int cell_size) {
    cv::Mat image(board.rows() * cell_size, board.cols() * cell_size, CV_8UC3, BACKGROUND);
    draw_cells(image, board, cell_size);

    // Paths go between grid and glyphs: segments join cell centers
    const int thickness = std::max(2, cell_size / 6);
    for (const Path& path : solution) {
        for (size_t i = 1; i < path.cells.size(); ++i) {
            cv::line(image, cell_center(path.cells[i - 1], cell_size), cell_center(path.cells[i], cell_size),
                     color_bgr(path.color), thickness);
        }
    }

    draw_glyphs(image, board, cell_size);
    return image;
}

bool save_render(const cv::Mat& image, const std::string& path) {
    if (image.empty()) return false;
    try {
        return cv::imwrite(path, image);
    } catch (const cv::Exception& e) {
        std::cerr << "ERROR: Could not write " << path << ": " << e.what() << std::endl;
        return false;
    }
}
