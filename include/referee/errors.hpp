#ifndef REFEREE_ERRORS_HPP
#define REFEREE_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace referee {

enum class error_kind : std::int8_t {
    invalid_position,
    wrong_turn,
    invalid_move,
    promotion_pending,
    invalid_promotion_choice,
    game_already_over,
    invalid_board_state
};

constexpr const char* to_string(error_kind kind) noexcept {
    switch(kind) {
    case error_kind::invalid_position:
        return "invalid position";
    case error_kind::wrong_turn:
        return "wrong turn";
    case error_kind::invalid_move:
        return "invalid move";
    case error_kind::promotion_pending:
        return "promotion pending";
    case error_kind::invalid_promotion_choice:
        return "invalid promotion choice";
    case error_kind::game_already_over:
        return "game already over";
    case error_kind::invalid_board_state:
        return "invalid board state";
    }

    return "unknown error";
}

// Base of every error the rules engine reports
// A thrown chess_error never leaves a game partially modified
class chess_error : public std::logic_error {
public:
    chess_error(error_kind kind, const std::string& message) : std::logic_error{message}, kind_{kind} {}

    error_kind kind() const noexcept { return kind_; }

private:
    error_kind kind_;
};

// Malformed coordinates: out of range indices or unparsable notation
class invalid_position_error : public chess_error {
public:
    explicit invalid_position_error(const std::string& message) : chess_error{error_kind::invalid_position, message} {}
};

// The source square is empty or holds a piece of the player who is not to move
class wrong_turn_error : public chess_error {
public:
    explicit wrong_turn_error(const std::string& message) : chess_error{error_kind::wrong_turn, message} {}
};

class invalid_move_error : public chess_error {
public:
    explicit invalid_move_error(const std::string& message) : chess_error{error_kind::invalid_move, message} {}
};

class promotion_pending_error : public chess_error {
public:
    explicit promotion_pending_error(const std::string& message) : chess_error{error_kind::promotion_pending, message} {}
};

class invalid_promotion_choice_error : public chess_error {
public:
    explicit invalid_promotion_choice_error(const std::string& message)
        : chess_error{error_kind::invalid_promotion_choice, message} {}
};

class game_already_over_error : public chess_error {
public:
    explicit game_already_over_error(const std::string& message) : chess_error{error_kind::game_already_over, message} {}
};

// A caller supplied starting board breaks the board invariants
class invalid_board_state_error : public chess_error {
public:
    explicit invalid_board_state_error(const std::string& message) : chess_error{error_kind::invalid_board_state, message} {}
};

} // namespace referee

#endif // REFEREE_ERRORS_HPP
