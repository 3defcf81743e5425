#ifndef REFEREE_TYPES_HPP
#define REFEREE_TYPES_HPP

#include <cstdint>
#include <string_view>

namespace referee {

enum class piece_type : std::int8_t {
    pawn,
    knight,
    bishop,
    rook,
    queen,
    king
};

enum class player : std::int8_t {
    white,
    black
};

enum class game_state : std::int8_t {
    in_progress,
    check,
    // A pawn reached its last rank and the mover still has to pick what it becomes
    waiting_on_promotion_choice,
    game_over
};

// Only meaningful once the game_state is game_over
enum class game_over_reason : std::int8_t {
    checkmate,
    stalemate,
    dead_position,
    fivefold_repetition_rule,
    seventy_five_move_rule,
    mutual_draw
};

struct piece {
    piece_type type;

    player piece_player;

    bool operator==(const piece& other) const = default;
};

constexpr player opponent(player p) noexcept {
    return p == player::white ? player::black : player::white;
}

// Direction a pawn of this player advances in, in ranks
constexpr int pawn_direction(player p) noexcept {
    return p == player::white ? 1 : -1;
}

// Uppercase letter of the piece type (K, Q, R, B, N, P)
char to_char(piece_type type) noexcept;

// Uppercase for white pieces, lowercase for black pieces
char to_char(piece p) noexcept;

/**
 * @brief Parses a piece type from a single letter or an English word.
 * Accepts "Q", "q", "queen", " Queen " and so on.
 * @throws invalid_promotion_choice_error if text does not name a piece type.
 */
piece_type parse_piece_type(std::string_view text);

} // namespace referee

#endif // REFEREE_TYPES_HPP
