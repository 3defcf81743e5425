#include <gtest/gtest.h>

#include "referee/c_api.hpp"
#include "referee/types.hpp"

#include <algorithm>
#include <cstddef>

namespace {

// Owns a handle for the duration of a test
class CApi : public ::testing::Test {
protected:
    void SetUp() override {
        handle = referee_create();
        ASSERT_NE(handle, nullptr);
    }

    void TearDown() override {
        referee_destroy(handle);
    }

    void* handle = nullptr;
};

} // namespace

TEST_F(CApi, StartingPosition) {
    referee_square squares[64];

    ASSERT_EQ(referee_get_board(handle, squares), REFEREE_OK);

    // e1 holds the white king, e4 is empty, d8 holds the black queen
    ASSERT_EQ(squares[4].occupied, 1);
    ASSERT_EQ(squares[4].piece_type, static_cast<int>(referee::piece_type::king));
    ASSERT_EQ(squares[4].colour, static_cast<int>(referee::player::white));
    ASSERT_EQ(squares[28].occupied, 0);
    ASSERT_EQ(squares[59].piece_type, static_cast<int>(referee::piece_type::queen));
    ASSERT_EQ(squares[59].colour, static_cast<int>(referee::player::black));

    int player = -1;
    int state = -1;
    int reason = 0;

    ASSERT_EQ(referee_get_active_player(handle, &player), REFEREE_OK);
    ASSERT_EQ(referee_get_game_state(handle, &state), REFEREE_OK);
    ASSERT_EQ(referee_get_game_over_reason(handle, &reason), REFEREE_OK);

    ASSERT_EQ(player, static_cast<int>(referee::player::white));
    ASSERT_EQ(state, static_cast<int>(referee::game_state::in_progress));
    ASSERT_EQ(reason, -1);
}

TEST_F(CApi, PossibleMoves) {
    int indices[8];
    std::size_t count = 0;

    ASSERT_EQ(referee_get_possible_moves(handle, "g1", indices, 8, &count), REFEREE_OK);
    ASSERT_EQ(count, 2);

    std::sort(indices, indices + count);

    // f3 and h3
    ASSERT_EQ(indices[0], 21);
    ASSERT_EQ(indices[1], 23);

    // The count is reported even when the buffer is too small
    ASSERT_EQ(referee_get_possible_moves(handle, "e2", indices, 1, &count), REFEREE_ERR_BUFFER_TOO_SMALL);
    ASSERT_EQ(count, 2);

    ASSERT_EQ(referee_get_possible_moves(handle, "e2", nullptr, 0, &count), REFEREE_ERR_BUFFER_TOO_SMALL);
    ASSERT_EQ(count, 2);

    ASSERT_EQ(referee_get_possible_moves(handle, "e4", nullptr, 0, &count), REFEREE_OK);
    ASSERT_EQ(count, 0);

    ASSERT_EQ(referee_get_possible_moves(handle, "k9", indices, 8, &count), REFEREE_ERR_INVALID_POSITION);
}

TEST_F(CApi, MovesAndErrors) {
    int state = -1;

    ASSERT_EQ(referee_make_move(handle, "e2", "e4", &state), REFEREE_OK);
    ASSERT_EQ(state, static_cast<int>(referee::game_state::in_progress));

    ASSERT_EQ(referee_make_move(handle, "e4", "e5", &state), REFEREE_ERR_WRONG_TURN);
    ASSERT_EQ(referee_make_move(handle, "e7", "e3", &state), REFEREE_ERR_INVALID_MOVE);
    ASSERT_EQ(referee_make_move(handle, "e7", "e0", &state), REFEREE_ERR_INVALID_POSITION);
    ASSERT_EQ(referee_make_move(handle, "e7", "e5", nullptr), REFEREE_OK);

    int player = -1;
    ASSERT_EQ(referee_get_active_player(handle, &player), REFEREE_OK);
    ASSERT_EQ(player, static_cast<int>(referee::player::white));

    ASSERT_EQ(referee_set_promotion(handle, "queen", &state), REFEREE_ERR_INVALID_PROMOTION_CHOICE);
}

TEST_F(CApi, Checkmate) {
    int state = -1;

    ASSERT_EQ(referee_make_move(handle, "f2", "f3", &state), REFEREE_OK);
    ASSERT_EQ(referee_make_move(handle, "e7", "e5", &state), REFEREE_OK);
    ASSERT_EQ(referee_make_move(handle, "g2", "g4", &state), REFEREE_OK);
    ASSERT_EQ(referee_make_move(handle, "d8", "h4", &state), REFEREE_OK);

    ASSERT_EQ(state, static_cast<int>(referee::game_state::game_over));

    int reason = -1;
    ASSERT_EQ(referee_get_game_over_reason(handle, &reason), REFEREE_OK);
    ASSERT_EQ(reason, static_cast<int>(referee::game_over_reason::checkmate));

    ASSERT_EQ(referee_make_move(handle, "a2", "a3", &state), REFEREE_ERR_GAME_ALREADY_OVER);
    ASSERT_EQ(referee_submit_draw(handle), REFEREE_ERR_GAME_ALREADY_OVER);

    // Reset starts a fresh game on the same handle
    ASSERT_EQ(referee_reset(handle), REFEREE_OK);
    ASSERT_EQ(referee_get_game_state(handle, &state), REFEREE_OK);
    ASSERT_EQ(state, static_cast<int>(referee::game_state::in_progress));
    ASSERT_EQ(referee_get_game_over_reason(handle, &reason), REFEREE_OK);
    ASSERT_EQ(reason, -1);
}

TEST_F(CApi, Promotion) {
    const char* moves[][2] = {
        {"h2", "h4"}, {"g7", "g5"},
        {"h4", "g5"}, {"g8", "f6"},
        {"g5", "g6"}, {"a7", "a6"},
        {"g6", "g7"}, {"a6", "a5"}
    };

    for(auto& move : moves) {
        ASSERT_EQ(referee_make_move(handle, move[0], move[1], nullptr), REFEREE_OK);
    }

    int state = -1;

    // Capture onto h8 and promote
    ASSERT_EQ(referee_make_move(handle, "g7", "h8", &state), REFEREE_OK);
    ASSERT_EQ(state, static_cast<int>(referee::game_state::waiting_on_promotion_choice));

    ASSERT_EQ(referee_make_move(handle, "a5", "a4", &state), REFEREE_ERR_PROMOTION_PENDING);
    ASSERT_EQ(referee_set_promotion(handle, "king", &state), REFEREE_ERR_INVALID_PROMOTION_CHOICE);
    ASSERT_EQ(referee_set_promotion(handle, "dragon", &state), REFEREE_ERR_INVALID_PROMOTION_CHOICE);
    ASSERT_EQ(referee_set_promotion(handle, "N", &state), REFEREE_OK);
    ASSERT_EQ(state, static_cast<int>(referee::game_state::in_progress));

    referee_square squares[64];
    ASSERT_EQ(referee_get_board(handle, squares), REFEREE_OK);
    ASSERT_EQ(squares[63].piece_type, static_cast<int>(referee::piece_type::knight));
    ASSERT_EQ(squares[63].colour, static_cast<int>(referee::player::white));
}

TEST_F(CApi, Draws) {
    int claimable = -1;

    ASSERT_EQ(referee_can_enact_50_move_rule(handle, &claimable), REFEREE_OK);
    ASSERT_EQ(claimable, 0);

    const char* shuffle[][2] = {{"b1", "c3"}, {"b8", "c6"}, {"c3", "b1"}, {"c6", "b8"}};

    for(int cycle = 0; cycle < 2; cycle++) {
        for(auto& move : shuffle) {
            ASSERT_EQ(referee_make_move(handle, move[0], move[1], nullptr), REFEREE_OK);
        }
    }

    ASSERT_EQ(referee_can_enact_threefold_repetition_rule(handle, &claimable), REFEREE_OK);
    ASSERT_EQ(claimable, 1);

    ASSERT_EQ(referee_submit_draw(handle), REFEREE_OK);

    int reason = -1;
    ASSERT_EQ(referee_get_game_over_reason(handle, &reason), REFEREE_OK);
    ASSERT_EQ(reason, static_cast<int>(referee::game_over_reason::mutual_draw));
}

TEST(CApiArguments, NullArguments) {
    int value = 0;
    std::size_t count = 0;

    ASSERT_EQ(referee_get_active_player(nullptr, &value), REFEREE_ERR_NULL_ARGUMENT);
    ASSERT_EQ(referee_make_move(nullptr, "e2", "e4", &value), REFEREE_ERR_NULL_ARGUMENT);
    ASSERT_EQ(referee_reset(nullptr), REFEREE_ERR_NULL_ARGUMENT);
    ASSERT_EQ(referee_get_possible_moves(nullptr, "e2", nullptr, 0, &count), REFEREE_ERR_NULL_ARGUMENT);

    void* handle = referee_create();
    ASSERT_NE(handle, nullptr);

    EXPECT_EQ(referee_get_active_player(handle, nullptr), REFEREE_ERR_NULL_ARGUMENT);
    EXPECT_EQ(referee_make_move(handle, nullptr, "e4", &value), REFEREE_ERR_NULL_ARGUMENT);
    EXPECT_EQ(referee_get_board(handle, nullptr), REFEREE_ERR_NULL_ARGUMENT);

    referee_destroy(handle);

    // Destroying nothing is harmless
    referee_destroy(nullptr);
}
