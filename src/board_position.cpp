#include "referee/board_position.hpp"
#include "referee/errors.hpp"

#include <cctype>
#include <sstream>

namespace referee {

bool in_bounds(int rank, int file) noexcept {
    return !(rank < 0 || rank >= 8 || file < 0 || file >= 8);
}

board_position::board_position(int rank, int file) {
    if(!in_bounds(rank, file)) {
        std::ostringstream message;
        message << "Invalid rank " << rank << " or file " << file << "; both must be between 0 and 7";
        throw invalid_position_error{message.str()};
    }

    rank_ = static_cast<std::uint8_t>(rank);
    file_ = static_cast<std::uint8_t>(file);
}

board_position board_position::from_index(int index) {
    if(index < 0 || index > 63) {
        std::ostringstream message;
        message << "Invalid index " << index << "; must be between 0 and 63";
        throw invalid_position_error{message.str()};
    }

    return {index / 8, index % 8};
}

board_position board_position::parse(std::string_view notation) {
    auto first = notation.find_first_not_of(" \t\r\n");
    auto last = notation.find_last_not_of(" \t\r\n");

    std::string_view trimmed = first == std::string_view::npos ? std::string_view{} : notation.substr(first, last - first + 1);

    if(trimmed.size() != 2) {
        throw invalid_position_error{"Square '" + std::string{notation} + "' must be a file a-h followed by a rank 1-8"};
    }

    char file_char = static_cast<char>(std::tolower(static_cast<unsigned char>(trimmed[0])));
    char rank_char = trimmed[1];

    if(file_char < 'a' || file_char > 'h') {
        throw invalid_position_error{"File '" + std::string(1, trimmed[0]) + "' must be a letter between a and h"};
    }

    if(rank_char < '1' || rank_char > '8') {
        throw invalid_position_error{"Rank '" + std::string(1, rank_char) + "' must be a digit between 1 and 8"};
    }

    return {rank_char - '1', file_char - 'a'};
}

void board_position::offset_self(int rank_offset, int file_offset) {
    int rank = rank_ + rank_offset;
    int file = file_ + file_offset;

    if(!in_bounds(rank, file)) {
        std::ostringstream message;
        message << "Offset (" << rank_offset << ", " << file_offset << ") moves " << to_string() << " off the board";
        throw invalid_position_error{message.str()};
    }

    rank_ = static_cast<std::uint8_t>(rank);
    file_ = static_cast<std::uint8_t>(file);
}

std::string board_position::to_string() const {
    return {static_cast<char>('a' + file_), static_cast<char>('1' + rank_)};
}

bool board_position::operator<(const board_position& other) const noexcept {
    return index() < other.index();
}

std::optional<board_position> apply_offset(board_position position, board_offset offset) {
    int rank = position.rank() + offset.rank_offset;
    int file = position.file() + offset.file_offset;

    if(in_bounds(rank, file)) {
        return board_position{rank, file};
    }

    return {};
}

} // namespace referee
