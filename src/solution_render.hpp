#pragma once

#include <string>
#include <opencv2/core.hpp>

#include "lyne_board.hpp"

// BGR value used to draw a color
cv::Scalar color_bgr(Color color);

cv::Mat render_board(const LyneBoard& board, int cell_size = 64);
cv::Mat render_solution(const LyneBoard& board, const Solution& solution, int cell_size = 64);

// Write a rendered image; false if OpenCV could not encode or write it
bool save_render(const cv::Mat& image, const std::string& path);
