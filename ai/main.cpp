#include "loa/board.hpp"
#include "loa/move_list.hpp"
#include "alphabeta.hpp"
#include "random_policy.hpp"
#include "arena_args.hpp"

#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace loa;
using namespace loa_ai;

void print_board(const Board& board) {
    std::cout << "\n";
    for (int row = BOARD_SIZE - 1; row >= 0; --row) {
        std::cout << "  " << (row + 1) << " ";
        for (int col = 0; col < BOARD_SIZE; ++col) {
            std::cout << piece_abbrev(board.get(col, row)) << ' ';
        }
        std::cout << "\n";
    }
    std::cout << "    a b c d e f g h\n";
    std::cout << "Next move: " << piece_name(board.turn()) << "\n";
}

struct PolicyBinding {
    std::string name;
    std::function<Move(const Board&)> pick;
};

struct MatchConfig {
    int num_games = 10;
    int depth = AlphaBeta::kDefaultDepth;
    int move_limit = DEFAULT_MOVE_LIMIT;
    unsigned seed = 0;
    bool seeded = false;
    bool verbose = false;
};

// Returns the winner, Piece::Empty for a tie.
Piece play_game(const PolicyBinding& black_policy, const PolicyBinding& white_policy,
                const MatchConfig& config, int& moves, bool verbose) {
    Board board;
    board.set_move_limit(config.move_limit);
    moves = 0;

    if (verbose) {
        std::cout << "\n========== Game Start =========="
                  << "\nBlack policy: " << black_policy.name
                  << "\nWhite policy: " << white_policy.name << "\n";
        print_board(board);
    }

    while (!board.game_over()) {
        const Piece mover = board.turn();
        Move move = (mover == Piece::Black) ? black_policy.pick(board)
                                            : white_policy.pick(board);
        if (!move.valid()) {
            // a side that cannot move loses
            const Piece winner = opposite(mover);
            if (verbose) {
                std::cout << "\n*** No legal moves for " << piece_name(mover)
                          << " - " << piece_name(winner) << " WINS! ***\n";
            }
            return winner;
        }

        board.make_move(move);
        ++moves;

        if (verbose) {
            std::cout << "\nMove " << moves << " - " << piece_name(mover) << ": "
                      << to_string(board.history().back())
                      << (board.history().back().capture ? " (capture)" : "") << "\n";
            print_board(board);
        }
    }

    const Piece winner = *board.winner();
    if (verbose) {
        if (winner == Piece::Empty) {
            std::cout << "\n*** TIE (move limit reached) ***\n";
        } else {
            std::cout << "\n*** " << piece_name(winner) << " WINS! ***\n";
        }
    }
    return winner;
}

void run_match_series(const PolicyBinding& black_policy, const PolicyBinding& white_policy,
                      const MatchConfig& config) {
    int black_wins = 0;
    int white_wins = 0;
    int ties = 0;
    int total_moves = 0;

    std::cout << "\n======================================\n";
    std::cout << "Testing " << black_policy.name << " (Black) vs " << white_policy.name << " (White)\n";
    std::cout << "Number of games: " << config.num_games << "\n";
    std::cout << "======================================\n";

    for (int i = 0; i < config.num_games; ++i) {
        int game_moves = 0;
        Piece winner = play_game(black_policy, white_policy, config, game_moves,
                                 config.verbose && i == 0);
        if (winner == Piece::Black) {
            ++black_wins;
        } else if (winner == Piece::White) {
            ++white_wins;
        } else {
            ++ties;
        }
        total_moves += game_moves;
    }

    std::cout << "\n======================================\n";
    std::cout << "Results after " << config.num_games << " games:\n";
    std::cout << "  Black wins: " << black_wins << " (" << (100.0 * black_wins / config.num_games) << "%)\n";
    std::cout << "  White wins: " << white_wins << " (" << (100.0 * white_wins / config.num_games) << "%)\n";
    std::cout << "  Ties: " << ties << " (" << (100.0 * ties / config.num_games) << "%)\n";
    std::cout << "  Average moves: " << static_cast<double>(total_moves) / config.num_games << "\n";
    std::cout << "======================================\n";
}

int main(int argc, char** argv) {
    MatchConfig config;
    PolicyChoice black_choice = PolicyChoice::AlphaBeta;
    PolicyChoice white_choice = PolicyChoice::Random;

    try {
        // LOA_SEARCH_DEPTH applies unless --depth is given
        if (const char* env = std::getenv("LOA_SEARCH_DEPTH")) {
            config.depth = parse_positive(env, "LOA_SEARCH_DEPTH");
        }

        int arg_index = 1;
        if (arg_index < argc && is_number_string(argv[arg_index])) {
            config.num_games = parse_positive(argv[arg_index], "num_games");
            ++arg_index;
        }

        for (; arg_index < argc; ++arg_index) {
            std::string_view arg = argv[arg_index];
            if (arg.rfind("--black=", 0) == 0) {
                black_choice = parse_policy_choice(arg.substr(8));
            } else if (arg.rfind("--white=", 0) == 0) {
                white_choice = parse_policy_choice(arg.substr(8));
            } else if (arg.rfind("--depth=", 0) == 0) {
                config.depth = parse_positive(arg.substr(8), "--depth");
            } else if (arg.rfind("--move-limit=", 0) == 0) {
                config.move_limit = parse_positive(arg.substr(13), "--move-limit");
            } else if (arg.rfind("--seed=", 0) == 0) {
                config.seed = static_cast<unsigned>(parse_positive(arg.substr(7), "--seed"));
                config.seeded = true;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else {
                throw std::invalid_argument("Unknown argument: " + std::string(arg));
            }
        }
        // rejects limits the board cannot hold
        Board limit_check;
        limit_check.set_move_limit(config.move_limit);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n"
                  << "usage: loa_arena [num_games] [--black=ab|random] [--white=ab|random]"
                  << " [--depth=N] [--move-limit=N] [--seed=N] [--verbose]\n";
        return 1;
    }

    auto make_binding = [&config](PolicyChoice choice, std::unique_ptr<AlphaBeta>& ab,
                                  std::unique_ptr<RandomPolicy>& random, unsigned seed_offset) {
        PolicyBinding binding;
        if (choice == PolicyChoice::AlphaBeta) {
            ab = std::make_unique<AlphaBeta>();
            ab->set_depth(config.depth);
            ab->set_verbose(config.verbose);
            binding.name = "AlphaBeta(depth=" + std::to_string(config.depth) + ")";
            binding.pick = [m = ab.get()](const Board& board) { return m->choose_move(board); };
        } else {
            random = config.seeded ? std::make_unique<RandomPolicy>(config.seed + seed_offset)
                                   : std::make_unique<RandomPolicy>();
            binding.name = "RandomPolicy";
            binding.pick = [r = random.get()](const Board& board) { return r->pick(board); };
        }
        return binding;
    };

    // kept alive for the closures
    std::unique_ptr<AlphaBeta> black_ab;
    std::unique_ptr<AlphaBeta> white_ab;
    std::unique_ptr<RandomPolicy> black_random;
    std::unique_ptr<RandomPolicy> white_random;

    PolicyBinding black_binding = make_binding(black_choice, black_ab, black_random, 0);
    PolicyBinding white_binding = make_binding(white_choice, white_ab, white_random, 1);

    run_match_series(black_binding, white_binding, config);
    return 0;
}
