#include "../include/game/tictactoe.hpp"
#include "../include/search/alphabeta.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <optional>
#include <set>

using namespace ttt;
using namespace ttt::game;
using ttt::test::make_board;

namespace {

// Plain minimax over the same tree, no pruning.
int full_minimax(const Board& board, int depth, bool maximizing, int64_t* nodes) {
    ++*nodes;
    if (depth == 0 || is_terminal(board)) {
        return evaluate(board);
    }
    int best = maximizing ? kNegInfinity : kInfinity;
    for (const Board& child : legal_moves(board, maximizing ? Cell::Maximizer : Cell::Minimizer)) {
        int value = full_minimax(child, depth - 1, !maximizing, nodes);
        best = maximizing ? std::max(best, value) : std::min(best, value);
    }
    return best;
}

int depth_of(const Board& board) {
    return static_cast<int>(empty_cells(board).size());
}

// Every position reachable from the empty board with first_player to move,
// paired with the side to move.
void collect_positions(const Board& board, Cell to_move, std::set<std::pair<Board, Cell>>* out) {
    if (!out->insert({board, to_move}).second || is_terminal(board)) {
        return;
    }
    for (const Board& child : legal_moves(board, to_move)) {
        collect_positions(child, opponent(to_move), out);
    }
}

Coord chosen_cell(const Board& before, const std::optional<Board>& after) {
    EXPECT_TRUE(after.has_value());
    auto move = find_move(before, *after);
    EXPECT_TRUE(move.has_value());
    return *move;
}

// Plays every Minimizer reply against the search and checks that no line of
// play ends with a Minimizer win. Returns the number of finished games.
int check_no_loss(AlphaBetaSearch& search, const Board& board, bool maximizer_to_move) {
    if (is_terminal(board)) {
        EXPECT_NE(outcome(board), Outcome::MinimizerWin);
        return 1;
    }
    if (maximizer_to_move) {
        auto next = search.select_best_move(board);
        EXPECT_TRUE(next.has_value());
        if (!next.has_value()) {
            return 0;
        }
        return check_no_loss(search, *next, false);
    }
    int games = 0;
    for (const Board& child : legal_moves(board, Cell::Minimizer)) {
        games += check_no_loss(search, child, true);
    }
    return games;
}

}  // namespace

TEST(Minimax, terminal_board_returns_evaluation) {
    AlphaBetaSearch search;
    EXPECT_EQ(search.minimax(make_board("OOO XX. ..."), 4, kNegInfinity, kInfinity, false), 1);
    EXPECT_EQ(search.minimax(make_board("XXX OO. O.."), 3, kNegInfinity, kInfinity, true), -1);
    EXPECT_EQ(search.minimax(make_board("OXO OXX XOO"), 0, kNegInfinity, kInfinity, true), 0);
    EXPECT_EQ(search.stats().nodes_visited, 3);
}

TEST(Minimax, depth_zero_evaluates_without_expanding) {
    AlphaBetaSearch search;
    EXPECT_EQ(search.minimax(make_board("OO. XX. ..."), 0, kNegInfinity, kInfinity, true), 0);
    EXPECT_EQ(search.stats().nodes_visited, 1);
}

TEST(Minimax, either_side_finds_its_win) {
    AlphaBetaSearch search;
    Board board = make_board("OO. XX. ...");
    EXPECT_EQ(search.minimax(board, depth_of(board), kNegInfinity, kInfinity, true), 1);
    EXPECT_EQ(search.minimax(board, depth_of(board), kNegInfinity, kInfinity, false), -1);
}

TEST(Minimax, empty_board_is_a_draw) {
    AlphaBetaSearch search;
    EXPECT_EQ(search.minimax(empty_board(), kNumCells, kNegInfinity, kInfinity, true), 0);
    EXPECT_EQ(search.minimax(empty_board(), kNumCells, kNegInfinity, kInfinity, false), 0);
}

TEST(Minimax, pruning_matches_full_search_on_every_reachable_position) {
    std::set<std::pair<Board, Cell>> positions;
    collect_positions(empty_board(), Cell::Minimizer, &positions);
    collect_positions(empty_board(), Cell::Maximizer, &positions);
    ASSERT_GT(positions.size(), 5000u);

    AlphaBetaSearch search;
    for (const auto& [board, to_move] : positions) {
        bool maximizing = to_move == Cell::Maximizer;
        int64_t nodes = 0;
        int expected = full_minimax(board, depth_of(board), maximizing, &nodes);
        int actual = search.minimax(board, depth_of(board), kNegInfinity, kInfinity, maximizing);
        ASSERT_EQ(actual, expected);
    }
}

TEST(Minimax, pruning_skips_nodes) {
    int64_t full_nodes = 0;
    int expected = full_minimax(empty_board(), kNumCells, true, &full_nodes);

    AlphaBetaSearch search;
    int actual = search.minimax(empty_board(), kNumCells, kNegInfinity, kInfinity, true);
    EXPECT_EQ(actual, expected);
    EXPECT_GT(search.stats().cutoffs, 0);
    EXPECT_LT(search.stats().nodes_visited, full_nodes);
}

TEST(SelectBestMove, empty_board_places_one_mark) {
    AlphaBetaSearch search;
    Board board = empty_board();
    auto next = search.select_best_move(board);
    ASSERT_TRUE(next.has_value());

    EXPECT_EQ(std::count(next->begin(), next->end(), Cell::Maximizer), 1);
    EXPECT_EQ(empty_cells(*next).size(), 8u);
    // Every opening draws, so the first cell wins the tie
    EXPECT_EQ(chosen_cell(board, next), (Coord{0, 0}));
    EXPECT_GT(search.stats().nodes_visited, 0);
}

TEST(SelectBestMove, completes_winning_row) {
    AlphaBetaSearch search;
    Board board = make_board("OO. XX. ...");
    EXPECT_EQ(chosen_cell(board, search.select_best_move(board)), (Coord{0, 2}));
}

TEST(SelectBestMove, equal_scores_take_earliest_cell) {
    // Blocking at (0,2) still wins later, so it ties with the immediate win
    // at (2,0) and comes first in row-major order
    AlphaBetaSearch search;
    Board board = make_board("XX. ... .OO");
    Board block = board;
    block[to_index(Coord{0, 2})] = Cell::Maximizer;
    EXPECT_EQ(search.minimax(block, depth_of(board), kNegInfinity, kInfinity, false), 1);

    EXPECT_EQ(chosen_cell(board, search.select_best_move(board)), (Coord{0, 2}));
}

TEST(SelectBestMove, blocks_diagonal_threat) {
    AlphaBetaSearch search;
    Board board = make_board("X.. .X. O..");
    EXPECT_EQ(chosen_cell(board, search.select_best_move(board)), (Coord{2, 2}));
}

TEST(SelectBestMove, forced_loss_takes_first_cell) {
    // Blocking at (2,2) still loses to a fork, so every move scores -1
    AlphaBetaSearch search;
    Board board = make_board("X.. .X. ...");
    for (const Board& child : legal_moves(board, Cell::Maximizer)) {
        EXPECT_EQ(search.minimax(child, depth_of(board), kNegInfinity, kInfinity, false), -1);
    }
    EXPECT_EQ(chosen_cell(board, search.select_best_move(board)), (Coord{0, 1}));
}

TEST(SelectBestMove, full_board_has_no_move) {
    AlphaBetaSearch search;
    Board board = make_board("OXO OXX XOO");
    EXPECT_TRUE(is_terminal(board));
    EXPECT_EQ(evaluate(board), 0);
    EXPECT_FALSE(search.select_best_move(board).has_value());
}

TEST(SelectBestMove, does_not_modify_input) {
    AlphaBetaSearch search;
    const Board board = make_board("X.. .O. ..X");
    Board copy = board;
    auto next = search.select_best_move(board);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(board, copy);
    EXPECT_NE(*next, board);
}

TEST(SelectBestMove, never_loses_when_moving_second) {
    AlphaBetaSearch search;
    int games = check_no_loss(search, empty_board(), false);
    EXPECT_GT(games, 0);
}

TEST(SelectBestMove, never_loses_when_moving_first) {
    AlphaBetaSearch search;
    int games = check_no_loss(search, empty_board(), true);
    EXPECT_GT(games, 0);
}
