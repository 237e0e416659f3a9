#pragma once
#include "../common.hpp"
#include <optional>
#include <vector>

namespace ttt::game {

// Live game board owned by the turn loop. Search never touches it directly.
class TicTacToe {
public:
    TicTacToe();

    void reset();
    bool is_valid_move(const Coord& coord) const;

    // Throws std::invalid_argument on an out-of-range or occupied cell.
    void make_move(const Coord& coord, Cell player);

    // Applies the single cell in which candidate differs from the live board,
    // e.g. a board returned by AlphaBetaSearch::select_best_move.
    Coord apply_board(const Board& candidate, Cell player);

    Outcome outcome() const;
    bool is_terminal() const;

    const Board& board() const { return board_; }
    void set_board(const Board& board);
    int move_count() const { return move_count_; }

private:
    Board board_;
    int move_count_;
};

// Board queries. All are pure functions of their arguments.

Board empty_board();
bool winner(const Board& board, Cell player);
bool is_terminal(const Board& board);

// +1 if Maximizer has won, -1 if Minimizer has won, 0 otherwise.
// Only meaningful on terminal boards.
int evaluate(const Board& board);

// Row-major order.
std::vector<Coord> empty_cells(const Board& board);

// One independent child per empty cell, in empty_cells() order.
std::vector<Board> legal_moves(const Board& board, Cell player);

Outcome outcome(const Board& board);

// First cell (row-major) that differs between the two boards.
std::optional<Coord> find_move(const Board& before, const Board& after);

Cell opponent(Cell player);
int to_index(const Coord& coord);
Coord to_coord(int index);
bool in_bounds(const Coord& coord);

const char* to_string(Outcome outcome);

} // namespace ttt::game
