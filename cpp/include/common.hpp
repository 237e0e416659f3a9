#pragma once
#include <array>
#include <cstdint>

namespace ttt {

constexpr int kBoardDim = 3;
constexpr int kNumCells = kBoardDim * kBoardDim;
constexpr int kNumLines = 8;

// Cell contents. The numeric values are the cell's score contribution.
enum class Cell : int8_t {
    Empty = 0,
    Maximizer = 1,  // computer, rendered as 'O'
    Minimizer = -1  // human, rendered as 'X'
};

// Board representation (flat array, row-major)
using Board = std::array<Cell, kNumCells>;

struct Coord {
    int row;
    int col;

    bool operator==(const Coord& other) const { return row == other.row && col == other.col; }
};

enum class Outcome {
    MaximizerWin,
    MinimizerWin,
    Draw,
    InProgress
};

} // namespace ttt
