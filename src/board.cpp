#include "referee/board.hpp"

namespace referee {

board board::initial_board() noexcept {
    board result = {};

    using enum piece_type;
    using enum player;

    piece_type rank1and8[8] = {rook, knight, bishop, queen, king, bishop, knight, rook};

    for(int file = 0; file < 8; file++) {
        result.squares_[file] = piece{rank1and8[file], white};
        result.squares_[8 + file] = piece{pawn, white};
        result.squares_[48 + file] = piece{pawn, black};
        result.squares_[56 + file] = piece{rank1and8[file], black};
    }

    return result;
}

board board::empty_board() noexcept {
    board result = {};

    result.castling_.can_castle = {false, false, false, false};

    return result;
}

std::optional<board_position> board::find_king(player p) const {
    for(int index = 0; index < 64; index++) {
        auto& square = squares_[index];

        if(square && square->type == piece_type::king && square->piece_player == p) {
            return board_position::from_index(index);
        }
    }

    return {};
}

} // namespace referee
