#pragma once
#include "../include/common.hpp"
#include <ostream>
#include <stdexcept>
#include <string>

namespace ttt::test {

// Builds a board from 9 characters, row-major: 'O' Maximizer, 'X' Minimizer,
// '.' empty. Whitespace is skipped so rows can be separated.
inline Board make_board(const std::string& cells) {
    Board board;
    int i = 0;
    for (char c : cells) {
        if (c == ' ' || c == '\n') {
            continue;
        }
        if (i >= kNumCells) {
            throw std::invalid_argument("Too many cells: " + cells);
        }
        switch (c) {
            case 'O': board[i] = Cell::Maximizer; break;
            case 'X': board[i] = Cell::Minimizer; break;
            case '.': board[i] = Cell::Empty; break;
            default: throw std::invalid_argument("Bad cell character: " + cells);
        }
        i++;
    }
    if (i != kNumCells) {
        throw std::invalid_argument("Too few cells: " + cells);
    }
    return board;
}

} // namespace ttt::test

namespace ttt {

// gtest printers, found by argument-dependent lookup
inline void PrintTo(Cell cell, std::ostream* os) {
    *os << (cell == Cell::Maximizer ? 'O' : cell == Cell::Minimizer ? 'X' : '.');
}

inline void PrintTo(const Coord& coord, std::ostream* os) {
    *os << '(' << coord.row << ", " << coord.col << ')';
}

} // namespace ttt
