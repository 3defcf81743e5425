#include "referee/position_history.hpp"

namespace referee {

position_fingerprint position_fingerprint::of(const board& board, player active_player) {
    return {
        .squares = board.squares(),
        .active_player = active_player,
        .castling = board.get_castling_rights(),
        .en_passant_target = board.en_passant_target()
    };
}

std::size_t position_fingerprint_hasher::operator()(const position_fingerprint& fingerprint) const {
    std::size_t seed = 0;

    // Empty squares hash as -1, occupied squares as type * 2 + colour
    for(const auto& square : fingerprint.squares) {
        int code = square ? static_cast<int>(square->type) * 2 + static_cast<int>(square->piece_player) : -1;

        hash_combine(seed, code);
    }

    hash_combine(seed, static_cast<int>(fingerprint.active_player));

    for(bool allowed : fingerprint.castling.can_castle) {
        hash_combine(seed, allowed);
    }

    hash_combine(seed, fingerprint.en_passant_target ? static_cast<int>(fingerprint.en_passant_target->index()) : -1);

    return seed;
}

int position_history::add_position(const position_fingerprint& fingerprint) {
    positions_.push_back(fingerprint);

    int& count = position_counts_[fingerprint];
    count++;

    return count;
}

int position_history::count(const position_fingerprint& fingerprint) const {
    auto it = position_counts_.find(fingerprint);

    return it == position_counts_.end() ? 0 : it->second;
}

void position_history::clear_on_irreversible_move() {
    positions_.clear();
    position_counts_.clear();
}

} // namespace referee
