#include "referee/legality.hpp"
#include "referee/errors.hpp"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <iterator>

namespace referee {

namespace {

// A move from or onto a rook's home square ends castling on that side for good:
// either the rook is leaving, or it is being captured
void revoke_castling_through_square(castling_rights& rights, board_position square) {
    switch(square.index()) {
    case 0: // a1
        rights.revoke(player::white, castle_side::queenside);
        break;
    case 7: // h1
        rights.revoke(player::white, castle_side::kingside);
        break;
    case 56: // a8
        rights.revoke(player::black, castle_side::queenside);
        break;
    case 63: // h8
        rights.revoke(player::black, castle_side::kingside);
        break;
    default:
        break;
    }
}

// Whether a particular move would leave the player making it in check
bool puts_player_in_check(const board& board, const chess_move& move) {
    auto mover = board.at(move.start_position)->piece_player;

    return is_player_in_check(apply_move(board, move), mover);
}

} // namespace

board apply_move(board board, const chess_move& move) {
    auto& start_square = board.at(move.start_position);

    if(!start_square) throw invalid_move_error{"There is no piece on " + move.start_position.to_string()};

    auto moved_piece = *start_square;

    board.set(move.start_position, std::nullopt);
    board.set(move.target_position, moved_piece);

    switch(move.type) {
    case move_type::en_passant: {
        // The captured pawn sits beside the capturing pawn's starting square
        board.set({move.start_position.rank(), move.target_position.file()}, std::nullopt);
        break;
    }
    case move_type::castle: {
        int rank = move.start_position.rank();
        bool kingside = move.target_position.file() > move.start_position.file();

        board_position rook_start = {rank, kingside ? 7 : 0};
        board_position rook_target = {rank, kingside ? 5 : 3};

        board.set(rook_target, board.at(rook_start));
        board.set(rook_start, std::nullopt);
        break;
    }
    case move_type::normal_move:
    case move_type::capture:
        break;
    }

    auto& rights = board.get_castling_rights();

    if(moved_piece.type == piece_type::king) {
        rights.revoke_all(moved_piece.piece_player);
    }

    revoke_castling_through_square(rights, move.start_position);
    revoke_castling_through_square(rights, move.target_position);

    int rank_distance = std::abs(move.target_position.rank() - move.start_position.rank());

    if(moved_piece.type == piece_type::pawn && rank_distance == 2) {
        // Valid only for the very next ply
        board.set_en_passant_target(board_position{(move.start_position.rank() + move.target_position.rank()) / 2, move.start_position.file()});
    } else {
        board.set_en_passant_target(std::nullopt);
    }

    return board;
}

bool is_square_attacked(const board& board, board_position square, player attacker) {
    return get_attack_coverage(board, attacker)[square.index()];
}

bool is_player_in_check(const board& board, player player_in_check) {
    auto king_position = board.find_king(player_in_check);

    if(!king_position) throw invalid_board_state_error{"Invalid board state: no king"};

    return is_square_attacked(board, *king_position, opponent(player_in_check));
}

std::vector<chess_move> get_legal_moves(const board& board, board_position position) {
    auto moves = get_pseudo_legal_moves(board, position);

    std::erase_if(moves, std::bind_front(puts_player_in_check, std::cref(board)));

    return moves;
}

std::vector<chess_move> get_all_legal_moves(const board& board, player mover) {
    std::vector<chess_move> legal_moves;

    for(int index = 0; index < 64; index++) {
        auto& square = board.squares()[index];

        if(!square || square->piece_player != mover) continue;

        auto moves = get_legal_moves(board, board_position::from_index(index));

        std::ranges::copy(moves, std::back_inserter(legal_moves));
    }

    return legal_moves;
}

bool has_any_legal_move(const board& board, player mover) {
    for(int index = 0; index < 64; index++) {
        auto& square = board.squares()[index];

        if(!square || square->piece_player != mover) continue;

        auto moves = get_pseudo_legal_moves(board, board_position::from_index(index));

        bool found = std::ranges::any_of(moves, [&board](const chess_move& move) {
            return !puts_player_in_check(board, move);
        });

        if(found) return true;
    }

    return false;
}

} // namespace referee
