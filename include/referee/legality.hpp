#ifndef REFEREE_LEGALITY_HPP
#define REFEREE_LEGALITY_HPP

#include "referee/board.hpp"
#include "referee/move_generator.hpp"
#include "referee/types.hpp"

#include <vector>

namespace referee {

/**
 * @brief Applies a move to a copy of board and returns the result.
 * Handles the captured piece, the pawn taken en passant, the rook relocated by castling,
 * castling rights lost by king and rook moves or rook captures, and the en passant target.
 * A pawn reaching its last rank stays a pawn; promotion is decided by the caller.
 * Assumes the move came from get_pseudo_legal_moves for this board.
 */
board apply_move(board board, const chess_move& move);

bool is_square_attacked(const board& board, board_position square, player attacker);

/**
 * @throws invalid_board_state_error if the player has no king.
 */
bool is_player_in_check(const board& board, player player_in_check);

/**
 * @brief The pseudo-legal moves of the piece at position that do not leave its own king attacked.
 * Each candidate is tried on a scratch copy of the board.
 */
std::vector<chess_move> get_legal_moves(const board& board, board_position position);

// Legal moves of every piece belonging to mover
std::vector<chess_move> get_all_legal_moves(const board& board, player mover);

// Stops at the first legal move found
bool has_any_legal_move(const board& board, player mover);

} // namespace referee

#endif // REFEREE_LEGALITY_HPP
