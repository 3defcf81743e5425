#ifndef REFEREE_BOARD_POSITION_HPP
#define REFEREE_BOARD_POSITION_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace referee {

struct board_offset {
    int rank_offset;
    int file_offset;
};

bool in_bounds(int rank, int file) noexcept;

/**
 * @brief A square on the board.
 * rank 0 is rank 1 (White's back rank) and file 0 is file A.
 * The flat index is rank * 8 + file, so index 0 is a1 and index 63 is h8.
 * Every constructor validates its input, so a board_position always names a real square.
 */
class board_position {
public:
    /**
     * @throws invalid_position_error if rank or file is outside [0, 7].
     */
    board_position(int rank, int file);

    /**
     * @throws invalid_position_error if index is outside [0, 63].
     */
    static board_position from_index(int index);

    /**
     * @brief Parses algebraic notation such as "e4".
     * Surrounding whitespace is ignored and the file letter may be uppercase.
     * @throws invalid_position_error unless the text is one letter a-h followed by one digit 1-8.
     */
    static board_position parse(std::string_view notation);

    std::uint8_t rank() const noexcept { return rank_; }
    std::uint8_t file() const noexcept { return file_; }
    std::uint8_t index() const noexcept { return static_cast<std::uint8_t>(rank_ * 8 + file_); }

    /**
     * @brief Moves this position by the given offset.
     * @throws invalid_position_error if the result is off the board; the position is left unchanged.
     */
    void offset_self(int rank_offset, int file_offset);

    // Algebraic notation, e.g. "e4"
    std::string to_string() const;

    bool operator==(const board_position& other) const = default;
    bool operator<(const board_position& other) const noexcept;

private:
    std::uint8_t rank_;
    std::uint8_t file_;
};

// position + offset, or nothing if that leaves the board
std::optional<board_position> apply_offset(board_position position, board_offset offset);

} // namespace referee

#endif // REFEREE_BOARD_POSITION_HPP
