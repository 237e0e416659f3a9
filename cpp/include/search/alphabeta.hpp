#pragma once
#include "../common.hpp"
#include <cstdint>
#include <limits>
#include <optional>

namespace ttt {

// Bounds for the initial alpha-beta window. Scores themselves are in {-1, 0, 1}.
constexpr int kInfinity = std::numeric_limits<int>::max();
constexpr int kNegInfinity = -kInfinity;

/**
 * Exhaustive minimax search with alpha-beta pruning.
 *
 * The Maximizer is the side the search plays for. Every branch works on its
 * own copy of the board, so a search never mutates the board it is given and
 * keeps no reference to it after returning. Only the statistics below are
 * stateful; an instance must not be shared across threads.
 */
class AlphaBetaSearch {
public:
    struct Stats {
        int64_t nodes_visited = 0;
        int64_t cutoffs = 0;
    };

    AlphaBetaSearch() = default;

    /**
     * Game-theoretic value of board under optimal play.
     *
     * @param board Position to evaluate
     * @param depth Remaining plies; 0 evaluates the board as is
     * @param alpha Score the Maximizer is already guaranteed on this path
     * @param beta Score the Minimizer is already guaranteed on this path
     * @param maximizing Whether the Maximizer is to move
     * @return +1, 0 or -1 from the Maximizer's perspective
     */
    int minimax(const Board& board, int depth, int alpha, int beta, bool maximizing);

    /**
     * Best move for the Maximizer.
     *
     * Ties go to the earliest empty cell in row-major order.
     *
     * @return The board after the chosen move, or nullopt if no cell is empty
     */
    std::optional<Board> select_best_move(const Board& board);

    const Stats& stats() const { return stats_; }
    void reset_stats() { stats_ = Stats{}; }

private:
    Stats stats_;
};

} // namespace ttt
