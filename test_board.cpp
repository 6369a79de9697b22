#include <iostream>
#include <limits>
#include "loa/board.hpp"
#include "loa/errors.hpp"
#include "loa/move_list.hpp"
#include "random_policy.hpp"
#include "test_support.hpp"

using namespace loa;
using test_support::at;
using test_support::board_from_rows;

namespace {

void test_opening(test_support::Checker& t) {
    std::cout << "=== Standard opening ===" << std::endl;
    Board board;
    t.check(board.turn() == Piece::Black, "Black moves first");
    t.check(board.get(at("a1")) == Piece::Empty && board.get(at("h8")) == Piece::Empty,
            "corners are empty");
    t.check(board.num_pieces(Piece::Black) == 12 && board.num_pieces(Piece::White) == 12,
            "twelve pieces a side");

    MoveList moves;
    board.legal_moves(moves);
    t.check(moves.size == 36, "36 legal moves for Black");
    t.check(moves[0] == mv(at("b1"), at("b3")), "first move in scan order is b1-b3");
    t.check(moves[1] == mv(at("b1"), at("d3")), "then b1-d3");
    t.check(moves[2] == mv(at("b1"), at("h1")), "then b1-h1");
    t.check(moves.contains(at("c1"), at("a3")), "c1-a3 captures on the opening board");
    t.check(!moves.contains(at("c1"), at("c2")), "c1-c2 is too short");
    t.check(moves.count_from(at("b1")) == 3 && moves.count_from(at("g8")) == 3,
            "three moves from each corner-side piece");
    t.check(moves.count_from(at("a2")) == 0, "no Black moves from a White square");

    Board white_first(INITIAL_PIECES, Piece::White);
    white_first.legal_moves(moves);
    t.check(moves.size == 36, "36 legal moves for White");
    t.check(moves[0] == mv(at("a2"), at("a8")), "White's first move is a2-a8");
}

void test_legality(test_support::Checker& t) {
    std::cout << "\n=== Move legality ===" << std::endl;

    // a1-d1 passes the white piece on b1
    Board blocked = board_from_rows({
        "--------",
        "--------",
        "--------",
        "--------",
        "--------",
        "--------",
        "--------",
        "bw-----b",
    }, Piece::Black);
    t.check(blocked.count_line(at("a1"), E) == 3, "row count includes both colours");
    t.check(!blocked.is_legal(at("a1"), at("d1")), "blocked by an opposing piece");
    t.check(blocked.is_legal(at("a1"), at("a2")), "lone piece on its column moves one");
    t.check(blocked.is_legal(at("a1"), at("b2")), "lone piece on its diagonal moves one");
    t.check(!blocked.is_legal(at("a1"), at("a3")), "distance above line count");

    Board counted = board_from_rows({
        "--------",
        "--------",
        "--------",
        "--------",
        "b-------",
        "--------",
        "--------",
        "b----w--",
    }, Piece::Black);
    t.check(counted.count_line(at("a1"), N) == 2, "column count is 2");
    t.check(counted.is_legal(at("a1"), at("a3")), "exact count is legal");
    t.check(!counted.is_legal(at("a1"), at("a2")), "under count is illegal");
    t.check(!counted.is_legal(at("a1"), at("a4")), "over count is illegal");
    t.check(!counted.is_legal(at("a1"), at("b3")), "not on a line");
    t.check(!counted.is_legal(at("a1"), at("a1")), "no null move");
    t.check(!counted.is_legal(at("f1"), at("e1")), "cannot move the opponent's piece");
    t.check(!counted.is_legal(at("c1"), at("c2")), "cannot move from an empty square");
    t.check(!counted.is_legal(at("a1"), Square{0, 8}), "destination off the board");

    Board jump = board_from_rows({
        "--------",
        "--------",
        "--------",
        "--------",
        "--------",
        "--------",
        "b-------",
        "b------w",
    }, Piece::Black);
    t.check(jump.is_legal(at("a1"), at("a3")), "may pass over a friendly piece");
    t.check(!jump.is_legal(at("a2"), at("a1")), "may not land on a friendly piece");

    Board capture = board_from_rows({
        "--------",
        "--------",
        "--------",
        "--------",
        "--------",
        "w-------",
        "--------",
        "b------w",
    }, Piece::Black);
    t.check(capture.is_legal(at("a1"), at("a3")), "capture of a lone enemy at exact distance");
    capture.make_move(mv(at("a1"), at("a3")));
    t.check(capture.history().back().capture, "capture flag set by make_move");
    t.check(capture.history().back() == mv(at("a1"), at("a3")).capture_move(),
            "stored move is the capture variant");
    t.check(capture.get(at("a3")) == Piece::Black, "captured square holds the mover");
    t.check(capture.num_pieces(Piece::White) == 1, "one white piece left");
    capture.retract();
    t.check(capture.get(at("a3")) == Piece::White && capture.get(at("a1")) == Piece::Black,
            "retract restores the captured piece");
    t.check(capture.turn() == Piece::Black, "retract restores the turn");
}

void test_errors(test_support::Checker& t) {
    std::cout << "\n=== Errors ===" << std::endl;
    Board board;
    const uint64_t before = board.compute_hash();

    bool thrown = false;
    try {
        board.make_move(mv(at("b1"), at("b2")));
    } catch (const PreconditionError&) {
        thrown = true;
    }
    t.check(thrown, "illegal make_move throws PreconditionError");
    t.check(board.compute_hash() == before && board.moves_made() == 0, "board unchanged after illegal move");

    thrown = false;
    try {
        board.retract();
    } catch (const PreconditionError&) {
        thrown = true;
    }
    t.check(thrown, "retract with empty history throws");

    thrown = false;
    try {
        board.set(Square{8, 0}, Piece::Black);
    } catch (const PreconditionError&) {
        thrown = true;
    }
    t.check(thrown, "set off the board throws");

    thrown = false;
    try {
        opposite(Piece::Empty);
    } catch (const PreconditionError&) {
        thrown = true;
    }
    t.check(thrown, "opposite(Empty) throws");

    board.make_move(mv(at("b1"), at("b3")));
    board.make_move(mv(at("a2"), at("c2")));
    thrown = false;
    try {
        board.set_move_limit(1);
    } catch (const ConfigError&) {
        thrown = true;
    }
    t.check(thrown, "move limit already reached is rejected");
    t.check(board.move_limit() == 2 * DEFAULT_MOVE_LIMIT, "rejected limit leaves the old one");
    board.set_move_limit(2);
    t.check(board.move_limit() == 4, "limit is counted for both sides");

    thrown = false;
    try {
        board.set_move_limit(std::numeric_limits<int>::max());
    } catch (const ConfigError&) {
        thrown = true;
    }
    t.check(thrown, "limit whose total does not fit in an int is rejected");
    t.check(board.move_limit() == 4, "oversized limit leaves the old one");
    board.set_move_limit(std::numeric_limits<int>::max() / 2);
    t.check(board.move_limit() == std::numeric_limits<int>::max() / 2 * 2, "largest limit is accepted");

    thrown = false;
    try {
        board.set_move_limit(std::numeric_limits<int>::min());
    } catch (const ConfigError&) {
        thrown = true;
    }
    t.check(thrown, "negative limit is rejected");

    Board cleared;
    cleared.make_move(mv(at("b1"), at("b3")));
    cleared.set(at("b3"), Piece::Empty);
    thrown = false;
    try {
        cleared.retract();
    } catch (const PreconditionError&) {
        thrown = true;
    }
    t.check(thrown, "retract onto an emptied destination throws");
    t.check(cleared.turn() == Piece::White && cleared.moves_made() == 1
            && cleared.get(at("b1")) == Piece::Empty,
            "failed retract leaves turn, history and cells alone");

    Board capture = board_from_rows({
        "--------",
        "--------",
        "--------",
        "--------",
        "--------",
        "w-------",
        "--------",
        "b------w",
    }, Piece::Black);
    capture.make_move(mv(at("a1"), at("a3")));
    capture.set(at("a3"), Piece::Empty);
    thrown = false;
    try {
        capture.retract();
    } catch (const PreconditionError&) {
        thrown = true;
    }
    t.check(thrown, "retract of a capture onto an emptied square throws");
    t.check(capture.get(at("a1")) == Piece::Empty && capture.moves_made() == 1,
            "failed capture retract restores nothing");
}

void test_round_trip(test_support::Checker& t) {
    std::cout << "\n=== make_move / retract round trip ===" << std::endl;
    Board board;
    loa_ai::RandomPolicy policy(42);
    bool restored = true;
    bool turn_follows_parity = true;
    int played = 0;

    while (!board.game_over() && played < 40) {
        Move m = policy.pick(board);
        if (!m.valid()) break;

        const Board snapshot(board);
        const uint64_t hash = snapshot.compute_hash();
        board.make_move(m);
        board.retract();
        restored = restored && board == snapshot && board.compute_hash() == hash
                   && board.moves_made() == snapshot.moves_made();

        board.make_move(m);
        ++played;
        const Piece expected = (played % 2 == 0) ? Piece::Black : Piece::White;
        turn_follows_parity = turn_follows_parity && board.turn() == expected;
    }
    t.check(played > 0, "random playout made moves");
    t.check(restored, "every make_move/retract pair restores the board");
    t.check(turn_follows_parity, "turn follows move-count parity");
    t.check(board.moves_made() == played, "history counts moves made");

    while (board.moves_made() > 0) board.retract();
    t.check(board == Board(), "retracting everything returns to the opening");
}

void test_misc(test_support::Checker& t) {
    std::cout << "\n=== Copies, undo, text ===" << std::endl;
    Board board;
    Board copy(board);
    copy.make_move(mv(at("b1"), at("b3")));
    t.check(board.moves_made() == 0 && board.get(at("b1")) == Piece::Black,
            "copy is independent of its source");
    t.check(copy != board, "boards differ after a move");

    copy.make_move(mv(at("a2"), at("c2")));
    copy.undo();
    t.check(copy.moves_made() == 0 && copy == board, "undo takes back both sides' moves");

    {
        ScopedMove guard(copy, mv(at("c1"), at("c3")));
        t.check(copy.moves_made() == 1 && copy.turn() == Piece::White, "scoped move applied");
    }
    t.check(copy.moves_made() == 0 && copy == board, "scoped move retracted on exit");

    t.check(to_string(mv(at("c4"), at("f4"))) == "c4-f4", "move text form");
    t.check(to_string(Square{}) == "--", "invalid square text");
    t.check(at("c4").direction(at("f4")) == E && at("c4").distance(at("f4")) == 3,
            "direction and distance");
    t.check(at("a1").adjacent().size() == 3 && at("d4").adjacent().size() == 8,
            "adjacency clipped at the edge");
    t.check(!at("h8").move_dest(NE, 1).has_value(), "move_dest off the board is empty");

    board.set(at("d4"), Piece::White, Piece::White);
    t.check(board.get(at("d4")) == Piece::White && board.turn() == Piece::White,
            "set writes the cell and the next side");
}

} // namespace

int main() {
    test_support::Checker t;
    test_opening(t);
    test_legality(t);
    test_errors(t);
    test_round_trip(t);
    test_misc(t);
    return t.finish("board");
}
