#ifndef REFEREE_DRAW_RULES_HPP
#define REFEREE_DRAW_RULES_HPP

#include "referee/board.hpp"
#include "referee/types.hpp"

#include <optional>

namespace referee {

// Plies without a pawn move or capture after which a draw may be claimed (50 moves)
inline constexpr int fifty_move_rule_limit = 100;

// Plies without a pawn move or capture after which the game is drawn automatically (75 moves)
inline constexpr int seventy_five_move_rule_limit = 150;

// Occurrences of a position after which a draw may be claimed
inline constexpr int threefold_repetition_limit = 3;

// Occurrences of a position after which the game is drawn automatically
inline constexpr int fivefold_repetition_limit = 5;

bool can_claim_fifty_move_rule(int halfmove_clock) noexcept;

bool is_seventy_five_move_rule(int halfmove_clock) noexcept;

bool can_claim_threefold_repetition(int occurrences) noexcept;

bool is_fivefold_repetition(int occurrences) noexcept;

/**
 * @brief Whether neither side has the material to ever deliver checkmate.
 * True for king against king, king and a single knight or bishop against king,
 * and positions where every remaining piece besides the kings is a bishop and all
 * of those bishops stand on squares of one colour (e.g. king and bishop against king and bishop).
 */
bool is_insufficient_material(const board& board);

/**
 * @brief The draw that ends the game without anyone claiming it, if any.
 * Checked in order: dead position, fivefold repetition, 75-move rule.
 * Checkmate and stalemate take precedence and are decided by the caller first.
 */
std::optional<game_over_reason> automatic_draw_reason(const board& board, int halfmove_clock, int occurrences);

} // namespace referee

#endif // REFEREE_DRAW_RULES_HPP
