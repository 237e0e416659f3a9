#include "../../include/game/tictactoe.hpp"
#include <algorithm>
#include <stdexcept>

namespace ttt::game {

namespace {

// Winning lines as flat indices
constexpr int kLines[kNumLines][kBoardDim] = {
    {0, 1, 2}, {3, 4, 5}, {6, 7, 8},  // rows
    {0, 3, 6}, {1, 4, 7}, {2, 5, 8},  // cols
    {0, 4, 8}, {2, 4, 6}              // diagonals
};

} // namespace

TicTacToe::TicTacToe() {
    reset();
}

void TicTacToe::reset() {
    board_ = empty_board();
    move_count_ = 0;
}

bool TicTacToe::is_valid_move(const Coord& coord) const {
    return in_bounds(coord) && board_[to_index(coord)] == Cell::Empty;
}

void TicTacToe::make_move(const Coord& coord, Cell player) {
    if (player == Cell::Empty) {
        throw std::invalid_argument("Move must be made by a player");
    }
    if (!is_valid_move(coord)) {
        throw std::invalid_argument("Invalid move");
    }
    board_[to_index(coord)] = player;
    move_count_++;
}

Coord TicTacToe::apply_board(const Board& candidate, Cell player) {
    auto coord = find_move(board_, candidate);
    if (!coord.has_value()) {
        throw std::invalid_argument("Candidate board does not differ from the live board");
    }

    // Everything past the first difference must match
    for (int i = to_index(*coord) + 1; i < kNumCells; i++) {
        if (board_[i] != candidate[i]) {
            throw std::invalid_argument("Candidate board differs in more than one cell");
        }
    }
    if (candidate[to_index(*coord)] != player) {
        throw std::invalid_argument("Candidate board holds another player's mark");
    }

    make_move(*coord, player);
    return *coord;
}

Outcome TicTacToe::outcome() const {
    return ttt::game::outcome(board_);
}

bool TicTacToe::is_terminal() const {
    return ttt::game::is_terminal(board_);
}

void TicTacToe::set_board(const Board& board) {
    board_ = board;
    move_count_ = static_cast<int>(kNumCells - empty_cells(board_).size());
}

// Board queries

Board empty_board() {
    Board board;
    board.fill(Cell::Empty);
    return board;
}

bool winner(const Board& board, Cell player) {
    if (player == Cell::Empty) {
        return false;
    }
    for (const auto& line : kLines) {
        if (board[line[0]] == player && board[line[1]] == player && board[line[2]] == player) {
            return true;
        }
    }
    return false;
}

bool is_terminal(const Board& board) {
    // A board on which both sides hold a line is unreachable in legal play
    // and is reported as terminal without further distinction.
    return winner(board, Cell::Maximizer) || winner(board, Cell::Minimizer) ||
           std::none_of(board.begin(), board.end(), [](Cell c) { return c == Cell::Empty; });
}

int evaluate(const Board& board) {
    if (winner(board, Cell::Maximizer)) {
        return 1;
    }
    if (winner(board, Cell::Minimizer)) {
        return -1;
    }
    return 0;
}

std::vector<Coord> empty_cells(const Board& board) {
    std::vector<Coord> cells;
    for (int i = 0; i < kNumCells; i++) {
        if (board[i] == Cell::Empty) {
            cells.push_back(to_coord(i));
        }
    }
    return cells;
}

std::vector<Board> legal_moves(const Board& board, Cell player) {
    std::vector<Board> children;
    for (const Coord& coord : empty_cells(board)) {
        Board child = board;  // copy-on-branch
        child[to_index(coord)] = player;
        children.push_back(child);
    }
    return children;
}

Outcome outcome(const Board& board) {
    if (winner(board, Cell::Maximizer)) {
        return Outcome::MaximizerWin;
    }
    if (winner(board, Cell::Minimizer)) {
        return Outcome::MinimizerWin;
    }
    if (empty_cells(board).empty()) {
        return Outcome::Draw;
    }
    return Outcome::InProgress;
}

std::optional<Coord> find_move(const Board& before, const Board& after) {
    for (int i = 0; i < kNumCells; i++) {
        if (before[i] != after[i]) {
            return to_coord(i);
        }
    }
    return std::nullopt;
}

Cell opponent(Cell player) {
    switch (player) {
        case Cell::Maximizer: return Cell::Minimizer;
        case Cell::Minimizer: return Cell::Maximizer;
        default: return Cell::Empty;
    }
}

int to_index(const Coord& coord) {
    return coord.row * kBoardDim + coord.col;
}

Coord to_coord(int index) {
    return Coord{index / kBoardDim, index % kBoardDim};
}

bool in_bounds(const Coord& coord) {
    return coord.row >= 0 && coord.row < kBoardDim && coord.col >= 0 && coord.col < kBoardDim;
}

const char* to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::MaximizerWin: return "MaximizerWin";
        case Outcome::MinimizerWin: return "MinimizerWin";
        case Outcome::Draw: return "Draw";
        case Outcome::InProgress: return "InProgress";
    }
    return "Unknown";
}

} // namespace ttt::game
