#ifndef REFEREE_BOARD_HPP
#define REFEREE_BOARD_HPP

#include "referee/board_position.hpp"
#include "referee/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace referee {

enum class castle_side : std::int8_t {
    kingside,
    queenside
};

// Whether each player may still castle on each side
// A right is lost for good once the king or that rook leaves its home square, or the rook is captured there
struct castling_rights {
    // Kingside white castling is at index 0, queenside white castling at index 1
    // Kingside black castling is at index 2, queenside black castling at index 3
    std::array<bool, 4> can_castle{true, true, true, true};

    static constexpr std::size_t index(player p, castle_side side) noexcept {
        return (p == player::white ? 0 : 2) + (side == castle_side::kingside ? 0 : 1);
    }

    bool allowed(player p, castle_side side) const noexcept { return can_castle[index(p, side)]; }

    void revoke(player p, castle_side side) noexcept { can_castle[index(p, side)] = false; }

    void revoke_all(player p) noexcept {
        revoke(p, castle_side::kingside);
        revoke(p, castle_side::queenside);
    }

    bool operator==(const castling_rights& other) const = default;
};

/**
 * @brief 64 squares indexed by board_position::index(), plus castling rights and the en passant target.
 * A board is a plain value: copying it is how moves are tried out without touching the real game.
 */
class board {
public:
    using square_array = std::array<std::optional<piece>, 64>;

    // White on ranks 1-2, black on ranks 7-8, every castling right available, no en passant target
    static board initial_board() noexcept;

    // No pieces and no castling rights, used to set up custom positions
    static board empty_board() noexcept;

    const std::optional<piece>& at(board_position position) const noexcept { return squares_[position.index()]; }

    void set(board_position position, std::optional<piece> p) noexcept { squares_[position.index()] = p; }

    const square_array& squares() const noexcept { return squares_; }

    const castling_rights& get_castling_rights() const noexcept { return castling_; }
    castling_rights& get_castling_rights() noexcept { return castling_; }

    // The square a pawn skipped over on the previous ply, if the previous ply was a double pawn push
    const std::optional<board_position>& en_passant_target() const noexcept { return en_passant_target_; }

    void set_en_passant_target(std::optional<board_position> target) noexcept { en_passant_target_ = target; }

    std::optional<board_position> find_king(player p) const;

    bool operator==(const board& other) const = default;

private:
    square_array squares_{};
    castling_rights castling_{};
    std::optional<board_position> en_passant_target_{};
};

} // namespace referee

#endif // REFEREE_BOARD_HPP
