#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "../include/common.hpp"
#include "../include/game/tictactoe.hpp"
#include "../include/search/alphabeta.hpp"
#include <string>

namespace py = pybind11;

PYBIND11_MODULE(ttt_cpp, m) {
    m.doc() = "C++ alpha-beta search engine for Tic-Tac-Toe";

    py::enum_<ttt::Cell>(m, "Cell")
        .value("Empty", ttt::Cell::Empty)
        .value("Maximizer", ttt::Cell::Maximizer)
        .value("Minimizer", ttt::Cell::Minimizer);

    py::enum_<ttt::Outcome>(m, "Outcome")
        .value("MaximizerWin", ttt::Outcome::MaximizerWin)
        .value("MinimizerWin", ttt::Outcome::MinimizerWin)
        .value("Draw", ttt::Outcome::Draw)
        .value("InProgress", ttt::Outcome::InProgress);

    py::class_<ttt::Coord>(m, "Coord")
        .def(py::init<int, int>(), py::arg("row"), py::arg("col"))
        .def_readwrite("row", &ttt::Coord::row)
        .def_readwrite("col", &ttt::Coord::col)
        .def("__eq__", &ttt::Coord::operator==)
        .def("__repr__", [](const ttt::Coord& c) {
            return "Coord(" + std::to_string(c.row) + ", " + std::to_string(c.col) + ")";
        });

    // Board queries. Boards cross the boundary as lists of 9 Cells.
    m.def("empty_board", &ttt::game::empty_board, "Board with every cell empty");
    m.def("winner", &ttt::game::winner, py::arg("board"), py::arg("player"),
          "Check whether player holds a complete line");
    m.def("is_terminal", &ttt::game::is_terminal, py::arg("board"), "Check if the game is over");
    m.def("evaluate", &ttt::game::evaluate, py::arg("board"), "+1, -1 or 0 from the Maximizer's view");
    m.def("empty_cells", &ttt::game::empty_cells, py::arg("board"), "Empty cells in row-major order");
    m.def("legal_moves", &ttt::game::legal_moves, py::arg("board"), py::arg("player"),
          "One child board per empty cell");
    m.def("outcome", &ttt::game::outcome, py::arg("board"), "Game outcome");
    m.def("find_move", &ttt::game::find_move, py::arg("before"), py::arg("after"),
          "First cell that differs between two boards");

    // TicTacToe live game
    py::class_<ttt::game::TicTacToe>(m, "TicTacToe")
        .def(py::init<>())
        .def("reset", &ttt::game::TicTacToe::reset, "Reset the game")
        .def("is_valid_move", &ttt::game::TicTacToe::is_valid_move, "Check if a move is valid")
        .def("make_move", &ttt::game::TicTacToe::make_move, "Make a move")
        .def("apply_board", &ttt::game::TicTacToe::apply_board,
             py::arg("candidate"), py::arg("player"),
             "Apply the single cell in which candidate differs")
        .def("outcome", &ttt::game::TicTacToe::outcome, "Game outcome")
        .def("is_terminal", &ttt::game::TicTacToe::is_terminal, "Check if game is over")
        .def("get_board", &ttt::game::TicTacToe::board, "Get current board state")
        .def("set_board", &ttt::game::TicTacToe::set_board, "Replace the board state")
        .def("move_count", &ttt::game::TicTacToe::move_count, "Number of marks on the board");

    py::class_<ttt::AlphaBetaSearch::Stats>(m, "SearchStats")
        .def_readonly("nodes_visited", &ttt::AlphaBetaSearch::Stats::nodes_visited)
        .def_readonly("cutoffs", &ttt::AlphaBetaSearch::Stats::cutoffs);

    py::class_<ttt::AlphaBetaSearch>(m, "AlphaBetaSearch")
        .def(py::init<>(), "Create alpha-beta search")
        .def("minimax", &ttt::AlphaBetaSearch::minimax,
             py::arg("board"),
             py::arg("depth"),
             py::arg("alpha") = ttt::kNegInfinity,
             py::arg("beta") = ttt::kInfinity,
             py::arg("maximizing") = true,
             "Value of board under optimal play")
        .def("select_best_move", &ttt::AlphaBetaSearch::select_best_move, py::arg("board"),
             "Board after the Maximizer's best move, or None if the board is full")
        .def("stats", &ttt::AlphaBetaSearch::stats, py::return_value_policy::copy,
             "Statistics of the most recent search")
        .def("reset_stats", &ttt::AlphaBetaSearch::reset_stats);

    m.attr("__version__") = "1.0.0";
}
