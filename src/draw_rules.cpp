#include "referee/draw_rules.hpp"

namespace referee {

bool can_claim_fifty_move_rule(int halfmove_clock) noexcept {
    return halfmove_clock >= fifty_move_rule_limit;
}

bool is_seventy_five_move_rule(int halfmove_clock) noexcept {
    return halfmove_clock >= seventy_five_move_rule_limit;
}

bool can_claim_threefold_repetition(int occurrences) noexcept {
    return occurrences >= threefold_repetition_limit;
}

bool is_fivefold_repetition(int occurrences) noexcept {
    return occurrences >= fivefold_repetition_limit;
}

bool is_insufficient_material(const board& board) {
    int minor_pieces = 0;
    int bishops = 0;
    // Bishops on light squares (rank + file odd) and dark squares (rank + file even)
    int light_bishops = 0;
    int dark_bishops = 0;

    for(int index = 0; index < 64; index++) {
        auto& square = board.squares()[index];

        if(!square) continue;

        switch(square->type) {
        case piece_type::king:
            break;
        case piece_type::knight:
            minor_pieces++;
            break;
        case piece_type::bishop: {
            minor_pieces++;
            bishops++;

            int rank = index / 8;
            int file = index % 8;

            if((rank + file) % 2 == 0) {
                dark_bishops++;
            } else {
                light_bishops++;
            }
            break;
        }
        default:
            // Any pawn, rook or queen can still force mate
            return false;
        }
    }

    // Bare kings, or a single minor piece
    if(minor_pieces <= 1) return true;

    // Only bishops left, all on one colour of square
    return minor_pieces == bishops && (light_bishops == 0 || dark_bishops == 0);
}

std::optional<game_over_reason> automatic_draw_reason(const board& board, int halfmove_clock, int occurrences) {
    if(is_insufficient_material(board)) return game_over_reason::dead_position;

    if(is_fivefold_repetition(occurrences)) return game_over_reason::fivefold_repetition_rule;

    if(is_seventy_five_move_rule(halfmove_clock)) return game_over_reason::seventy_five_move_rule;

    return {};
}

} // namespace referee
