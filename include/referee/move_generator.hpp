#ifndef REFEREE_MOVE_GENERATOR_HPP
#define REFEREE_MOVE_GENERATOR_HPP

#include "referee/board.hpp"
#include "referee/board_position.hpp"
#include "referee/types.hpp"

#include <bitset>
#include <cstdint>
#include <vector>

namespace referee {

enum class move_type : std::int8_t {
    normal_move,
    capture,
    // target_position is the square the capturing pawn moves to
    // The captured pawn has the same file, on the capturing pawn's starting rank
    en_passant,
    // A king move of two squares; the rook is relocated when the move is applied
    castle
};

struct chess_move {
    move_type type;

    board_position start_position;

    board_position target_position;

    bool operator==(const chess_move& other) const = default;
};

/**
 * @brief Moves the piece at position could make, judged only by how it moves and what occupies the board.
 * Moves that leave the mover's own king attacked are still included; see get_legal_moves.
 * Castling is generated here, gated on castling rights, empty squares between king and rook,
 * and the king's start, transit and destination squares not being attacked.
 * @return Empty if there is no piece at position.
 */
std::vector<chess_move> get_pseudo_legal_moves(const board& board, board_position position);

/**
 * @brief Every square attacked by a piece of attacker, indexed by board_position::index().
 * Pawns attack their two forward diagonals whether or not anything stands there.
 * Castling and en passant destinations are not attacks and are never included.
 */
std::bitset<64> get_attack_coverage(const board& board, player attacker);

} // namespace referee

#endif // REFEREE_MOVE_GENERATOR_HPP
