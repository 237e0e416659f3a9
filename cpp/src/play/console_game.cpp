#include "../../include/play/console_game.hpp"
#include "../../include/util/logging.hpp"
#include <cctype>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace ttt::play {

namespace {

char to_char(Cell cell) {
    switch (cell) {
        case Cell::Maximizer: return 'O';
        case Cell::Minimizer: return 'X';
        default: return ' ';
    }
}

} // namespace

ConsoleGame::ConsoleGame(std::istream& in, std::ostream& out, Config config)
    : in_(in), out_(out), config_(config) {}

Outcome ConsoleGame::run() {
    game_.reset();
    out_ << "Welcome to Tic Tac Toe!\n";
    render_board(out_, game_.board());

    bool human_to_move = !config_.computer_first;
    while (!game_.is_terminal()) {
        if (human_to_move) {
            if (!human_turn()) {
                TTT_LOG_WARN("Input ended after {} moves, abandoning game", game_.move_count());
                return Outcome::InProgress;
            }
        } else {
            computer_turn();
        }
        render_board(out_, game_.board());
        human_to_move = !human_to_move;
    }

    Outcome outcome = game_.outcome();
    report_result(outcome);
    return outcome;
}

bool ConsoleGame::human_turn() {
    std::string line;
    while (true) {
        out_ << "Choose your move (1-9): " << std::flush;
        if (!std::getline(in_, line)) {
            out_ << '\n';
            return false;
        }

        auto coord = parse_move(line);
        if (!coord.has_value()) {
            out_ << "Invalid move. Try again.\n";
            continue;
        }
        if (!game_.is_valid_move(*coord)) {
            out_ << "Cell is already occupied. Try again.\n";
            continue;
        }

        game_.make_move(*coord, Cell::Minimizer);
        TTT_LOG_INFO("Human plays ({}, {})", coord->row, coord->col);
        return true;
    }
}

void ConsoleGame::computer_turn() {
    auto best = search_.select_best_move(game_.board());
    if (!best.has_value()) {
        // run() only gets here on a non-terminal board, which has an empty cell
        TTT_LOG_ERROR("Search found no move on a non-terminal board");
        throw std::logic_error("No move available for the computer");
    }

    Coord coord = game_.apply_board(*best, Cell::Maximizer);
    TTT_LOG_INFO("Computer plays ({}, {}) after {} nodes", coord.row, coord.col,
                 search_.stats().nodes_visited);
}

void ConsoleGame::report_result(Outcome outcome) {
    switch (outcome) {
        case Outcome::MinimizerWin:
            out_ << "Congratulations, you win!\n";
            break;
        case Outcome::MaximizerWin:
            out_ << "AI wins. Better luck next time!\n";
            break;
        default:
            out_ << "It's a draw!\n";
            break;
    }
    TTT_LOG_INFO("Game over: {}", game::to_string(outcome));
}

void render_board(std::ostream& out, const Board& board) {
    out << "\n  1 2 3\n";
    for (int row = 0; row < kBoardDim; row++) {
        out << row + 1;
        for (int col = 0; col < kBoardDim; col++) {
            out << ' ' << to_char(board[game::to_index(Coord{row, col})]);
        }
        out << '\n';
    }
}

std::optional<Coord> parse_move(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;

    // Optional sign and leading zeros, as in "+5" or "005"
    if (begin < end && text[begin] == '+') begin++;
    if (begin == end) {
        return std::nullopt;
    }
    for (size_t i = begin; i < end; i++) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return std::nullopt;
        }
    }
    while (begin < end && text[begin] == '0') begin++;

    // Exactly one nonzero digit must remain
    if (end - begin != 1) {
        return std::nullopt;
    }
    int n = text[begin] - '0';
    return game::to_coord(n - 1);
}

} // namespace ttt::play
