#pragma once
#include "../common.hpp"
#include "../game/tictactoe.hpp"
#include "../search/alphabeta.hpp"
#include <iosfwd>
#include <optional>
#include <string>

namespace ttt::play {

/**
 * Human vs computer game on a text console.
 *
 * The human plays X (Minimizer) and enters moves as 1-9, row-major. The
 * computer plays O (Maximizer) using AlphaBetaSearch.
 */
class ConsoleGame {
public:
    struct Config {
        bool computer_first = false;
    };

    ConsoleGame(std::istream& in, std::ostream& out, Config config);
    ConsoleGame(std::istream& in, std::ostream& out) : ConsoleGame(in, out, Config{}) {}

    /**
     * Play one game to the end.
     *
     * @return Final outcome, or Outcome::InProgress if input ran out first
     */
    Outcome run();

    const game::TicTacToe& game() const { return game_; }

private:
    // Returns false if input ended before a valid move was read
    bool human_turn();
    void computer_turn();
    void report_result(Outcome outcome);

    std::istream& in_;
    std::ostream& out_;
    Config config_;
    game::TicTacToe game_;
    AlphaBetaSearch search_;
};

void render_board(std::ostream& out, const Board& board);

// Maps "1".."9" to (row, col); anything else yields nullopt.
std::optional<Coord> parse_move(const std::string& text);

} // namespace ttt::play
