#ifndef REFEREE_POSITION_HISTORY_HPP
#define REFEREE_POSITION_HISTORY_HPP

#include "referee/board.hpp"
#include "referee/types.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

namespace referee {

// Helper function for combining hashes (boost::hash_combine pattern)
template <class T>
inline void hash_combine(std::size_t& seed, const T& v) {
    std::hash<T> hasher;
    seed ^= hasher(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

/**
 * @brief What makes two positions "the same" for the repetition rules:
 * piece placement, player to move, castling rights and en passant target.
 * Two positions that differ only in a castling right or en passant target nobody can
 * actually use still count as different positions.
 */
struct position_fingerprint {
    board::square_array squares;
    player active_player;
    castling_rights castling;
    std::optional<board_position> en_passant_target;

    static position_fingerprint of(const board& board, player active_player);

    bool operator==(const position_fingerprint& other) const = default;
};

struct position_fingerprint_hasher {
    std::size_t operator()(const position_fingerprint& fingerprint) const;
};

// Tracks the positions reached since the last irreversible move, for the repetition rules
class position_history {
public:
    /**
     * @brief Records a position.
     * @return How many times the position has now occurred, this time included.
     */
    int add_position(const position_fingerprint& fingerprint);

    int count(const position_fingerprint& fingerprint) const;

    /**
     * @brief Forgets every recorded position.
     * Called after a pawn move or capture: no position from before such a move can occur again.
     * The position reached by the move is recorded separately with add_position.
     */
    void clear_on_irreversible_move();

    // In the order they occurred
    const std::vector<position_fingerprint>& positions() const noexcept { return positions_; }

private:
    std::vector<position_fingerprint> positions_;
    std::unordered_map<position_fingerprint, int, position_fingerprint_hasher> position_counts_;
};

} // namespace referee

#endif // REFEREE_POSITION_HISTORY_HPP
