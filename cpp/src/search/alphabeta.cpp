#include "../../include/search/alphabeta.hpp"
#include "../../include/game/tictactoe.hpp"
#include "../../include/util/logging.hpp"
#include <algorithm>
#include <vector>

namespace ttt {

int AlphaBetaSearch::minimax(const Board& board, int depth, int alpha, int beta, bool maximizing) {
    stats_.nodes_visited++;

    if (depth == 0 || game::is_terminal(board)) {
        return game::evaluate(board);
    }

    if (maximizing) {
        int max_eval = kNegInfinity;
        for (const Board& child : game::legal_moves(board, Cell::Maximizer)) {
            int eval = minimax(child, depth - 1, alpha, beta, false);
            max_eval = std::max(max_eval, eval);
            alpha = std::max(alpha, max_eval);
            if (beta <= alpha) {
                stats_.cutoffs++;
                break;
            }
        }
        return max_eval;
    }

    int min_eval = kInfinity;
    for (const Board& child : game::legal_moves(board, Cell::Minimizer)) {
        int eval = minimax(child, depth - 1, alpha, beta, true);
        min_eval = std::min(min_eval, eval);
        beta = std::min(beta, min_eval);
        if (beta <= alpha) {
            stats_.cutoffs++;
            break;
        }
    }
    return min_eval;
}

std::optional<Board> AlphaBetaSearch::select_best_move(const Board& board) {
    reset_stats();

    // The Maximizer's mark is already placed in each candidate, so the
    // search below continues with the Minimizer to move.
    const int depth = static_cast<int>(game::empty_cells(board).size());
    std::vector<Board> candidates = game::legal_moves(board, Cell::Maximizer);

    std::optional<Board> best_move;
    int best_value = kNegInfinity;
    for (const Board& candidate : candidates) {
        int value = minimax(candidate, depth, kNegInfinity, kInfinity, false);
        if (value > best_value) {
            best_value = value;
            best_move = candidate;
        }
    }

    if (!best_move.has_value()) {
        TTT_LOG_WARN("select_best_move called on a full board");
        return std::nullopt;
    }

    Coord coord = *game::find_move(board, *best_move);
    TTT_LOG_DEBUG("Best move ({}, {}) score={} candidates={} nodes={} cutoffs={}",
                  coord.row, coord.col, best_value, candidates.size(),
                  stats_.nodes_visited, stats_.cutoffs);
    return best_move;
}

} // namespace ttt
