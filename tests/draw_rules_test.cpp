#include <gtest/gtest.h>

#include "referee/board.hpp"
#include "referee/draw_rules.hpp"
#include "referee/position_history.hpp"

#include <initializer_list>
#include <string_view>
#include <utility>

using referee::board;
using referee::board_position;
using referee::game_over_reason;
using referee::piece;
using referee::piece_type;
using referee::player;

namespace {

// Both kings in their corners plus the given pieces
board kings_and(std::initializer_list<std::pair<std::string_view, piece>> pieces) {
    auto result = board::empty_board();

    result.set(board_position::parse("a1"), piece{piece_type::king, player::white});
    result.set(board_position::parse("h8"), piece{piece_type::king, player::black});

    for(auto& [square, p] : pieces) {
        result.set(board_position::parse(square), p);
    }

    return result;
}

} // namespace

TEST(DrawRules, MoveRuleThresholds) {
    ASSERT_FALSE(referee::can_claim_fifty_move_rule(99));
    ASSERT_TRUE(referee::can_claim_fifty_move_rule(100));
    ASSERT_FALSE(referee::is_seventy_five_move_rule(149));
    ASSERT_TRUE(referee::is_seventy_five_move_rule(150));
}

TEST(DrawRules, RepetitionThresholds) {
    ASSERT_FALSE(referee::can_claim_threefold_repetition(2));
    ASSERT_TRUE(referee::can_claim_threefold_repetition(3));
    ASSERT_FALSE(referee::is_fivefold_repetition(4));
    ASSERT_TRUE(referee::is_fivefold_repetition(5));
}

TEST(DrawRules, InsufficientMaterial) {
    ASSERT_TRUE(referee::is_insufficient_material(kings_and({})));
    ASSERT_TRUE(referee::is_insufficient_material(kings_and({{"c3", {piece_type::knight, player::white}}})));
    ASSERT_TRUE(referee::is_insufficient_material(kings_and({{"c3", {piece_type::bishop, player::black}}})));

    // c1 and f4 are both dark squares
    ASSERT_TRUE(referee::is_insufficient_material(kings_and({
        {"c1", {piece_type::bishop, player::white}},
        {"f4", {piece_type::bishop, player::black}}
    })));
}

TEST(DrawRules, SufficientMaterial) {
    ASSERT_FALSE(referee::is_insufficient_material(board::initial_board()));
    ASSERT_FALSE(referee::is_insufficient_material(kings_and({{"e4", {piece_type::pawn, player::white}}})));
    ASSERT_FALSE(referee::is_insufficient_material(kings_and({{"e4", {piece_type::rook, player::black}}})));
    ASSERT_FALSE(referee::is_insufficient_material(kings_and({{"e4", {piece_type::queen, player::white}}})));

    // Bishops on opposite colours
    ASSERT_FALSE(referee::is_insufficient_material(kings_and({
        {"c1", {piece_type::bishop, player::white}},
        {"f1", {piece_type::bishop, player::black}}
    })));

    ASSERT_FALSE(referee::is_insufficient_material(kings_and({
        {"c3", {piece_type::knight, player::white}},
        {"d3", {piece_type::knight, player::white}}
    })));

    ASSERT_FALSE(referee::is_insufficient_material(kings_and({
        {"c3", {piece_type::knight, player::white}},
        {"f8", {piece_type::bishop, player::black}}
    })));
}

TEST(DrawRules, AutomaticDrawOrder) {
    auto bare_kings = kings_and({});
    auto with_rook = kings_and({{"e4", {piece_type::rook, player::white}}});

    ASSERT_EQ(referee::automatic_draw_reason(bare_kings, 150, 5), game_over_reason::dead_position);
    ASSERT_EQ(referee::automatic_draw_reason(with_rook, 150, 5), game_over_reason::fivefold_repetition_rule);
    ASSERT_EQ(referee::automatic_draw_reason(with_rook, 150, 4), game_over_reason::seventy_five_move_rule);
    ASSERT_FALSE(referee::automatic_draw_reason(with_rook, 149, 4));
}

TEST(PositionHistory, CountsOccurrences) {
    referee::position_history history;

    auto start = referee::position_fingerprint::of(board::initial_board(), player::white);
    auto black_to_move = referee::position_fingerprint::of(board::initial_board(), player::black);

    ASSERT_EQ(history.add_position(start), 1);
    ASSERT_EQ(history.add_position(black_to_move), 1);
    ASSERT_EQ(history.add_position(start), 2);

    ASSERT_EQ(history.count(start), 2);
    ASSERT_EQ(history.positions().size(), 3);

    history.clear_on_irreversible_move();

    ASSERT_EQ(history.count(start), 0);
    ASSERT_TRUE(history.positions().empty());
}

// Positions that differ only in castling rights or en passant target are distinct
TEST(PositionHistory, FingerprintIncludesRights) {
    auto b = board::initial_board();
    auto without_right = b;
    without_right.get_castling_rights().revoke(player::white, referee::castle_side::kingside);

    referee::position_fingerprint_hasher hasher;

    auto original = referee::position_fingerprint::of(b, player::white);
    auto revoked = referee::position_fingerprint::of(without_right, player::white);

    ASSERT_NE(original, revoked);

    auto with_target = b;
    with_target.set_en_passant_target(board_position::parse("e3"));

    ASSERT_NE(original, referee::position_fingerprint::of(with_target, player::white));

    // Equal fingerprints hash equally
    ASSERT_EQ(hasher(original), hasher(referee::position_fingerprint::of(board::initial_board(), player::white)));
}
