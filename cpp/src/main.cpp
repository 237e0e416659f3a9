#include "../include/play/console_game.hpp"
#include "../include/util/logging.hpp"

#include <boost/program_options.hpp>

#include <exception>
#include <iostream>

namespace po = boost::program_options;

int main(int argc, char** argv) {
    ttt::util::Logging::Params log_params;
    ttt::play::ConsoleGame::Config game_config;

    po::options_description desc("Tic Tac Toe against an alpha-beta search opponent");
    desc.add_options()
        ("help,h", "print this help message")
        ("computer-first", po::bool_switch(&game_config.computer_first),
         "let the computer (O) make the first move")
        ("log-filename", po::value<std::string>(&log_params.log_filename),
         "also write log output to this file")
        ("log-append", po::bool_switch(&log_params.append_mode),
         "append to --log-filename instead of truncating it")
        ("log-level", po::value<std::string>(&log_params.level)->default_value(log_params.level),
         "trace, debug, info, warn, error or off")
        ("omit-timestamps", po::bool_switch(&log_params.omit_timestamps),
         "omit timestamps from log lines");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << desc << '\n';
        return 1;
    }

    if (vm.count("help")) {
        std::cout << desc << '\n';
        return 0;
    }

    try {
        ttt::util::Logging::init(log_params);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    ttt::play::ConsoleGame game(std::cin, std::cout, game_config);
    ttt::Outcome outcome = game.run();
    return outcome == ttt::Outcome::InProgress ? 1 : 0;
}
