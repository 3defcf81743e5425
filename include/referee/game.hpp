#ifndef REFEREE_GAME_HPP
#define REFEREE_GAME_HPP

#include "referee/board.hpp"
#include "referee/board_position.hpp"
#include "referee/position_history.hpp"
#include "referee/types.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace referee {

// One completed move, as recorded in the game's move history
struct move_record {
    board_position from;
    board_position to;
    piece moved_piece;
    // Includes a pawn taken en passant
    std::optional<piece> captured_piece;
    // Set once the promotion choice has been made
    std::optional<piece_type> promotion;
    bool castling = false;
    bool en_passant = false;
};

/**
 * @brief A game of chess played under the full rules.
 *
 * The game owns the board and is the only thing that changes it. Every mutating operation
 * either completes or throws a chess_error and leaves the game exactly as it was.
 *
 * Draws by the 50-move rule and threefold repetition are only reported as claimable;
 * the caller decides whether to end the game with submit_draw(). Checkmate, stalemate,
 * dead positions, fivefold repetition and the 75-move rule end the game automatically.
 *
 * A game is not safe to use from several threads at once.
 */
class game {
public:
    // The standard starting position with White to move
    game();

    /**
     * @brief Starts from a caller-built position.
     * Castling rights whose king or rook is not on its home square are dropped.
     * The game state is classified immediately, so a stalemated or dead start is already over.
     * @throws invalid_board_state_error unless each side has exactly one king, no pawn stands on
     * the first or last rank, the player not to move is not in check, and any en passant target
     * lies behind a pawn that just made a double step.
     */
    game(const board& start, player active_player);

    const board& get_board() const noexcept { return board_; }

    player get_active_player() const noexcept { return active_player_; }

    game_state get_game_state() const noexcept { return state_; }

    // Empty unless the game is over
    std::optional<game_over_reason> get_game_over_reason() const noexcept { return game_over_reason_; }

    /**
     * @brief Squares the piece at position can legally move to.
     * Empty if the square is empty, holds a piece of the player not to move, or the game is over.
     * @throws promotion_pending_error while a promotion choice is outstanding.
     */
    std::vector<board_position> get_possible_moves(board_position position) const;
    std::vector<board_position> get_possible_moves(std::string_view position) const;

    // The subset of get_possible_moves that captures a piece, en passant included
    std::vector<board_position> get_possible_capture_moves(board_position position) const;

    std::vector<board_position> get_possible_non_capture_moves(board_position position) const;

    /**
     * @brief Moves a piece, given both squares in algebraic notation.
     * @return The game state after the move.
     * @throws invalid_position_error, game_already_over_error, promotion_pending_error,
     * wrong_turn_error or invalid_move_error.
     */
    game_state make_move(std::string_view from, std::string_view to);
    game_state make_move(board_position from, board_position to);

    /**
     * @brief Completes a promotion by choosing what the pawn becomes.
     * @return The game state after the promotion.
     * @throws invalid_promotion_choice_error for a pawn or king, or if no promotion is pending.
     * @throws game_already_over_error once the game is over.
     */
    game_state set_promotion(piece_type type);

    bool can_enact_50_move_rule() const noexcept;

    bool can_enact_threefold_repetition_rule() const;

    /**
     * @brief Ends the game as a draw agreed between the players.
     * @throws game_already_over_error once the game is over.
     */
    void submit_draw();

    // Plies since the last pawn move or capture
    int get_halfmove_clock() const noexcept { return halfmove_clock_; }

    // Starts at 1 and increments after each move by Black
    int get_fullmove_number() const noexcept { return fullmove_number_; }

    const castling_rights& get_castling_rights() const noexcept { return board_.get_castling_rights(); }

    const std::optional<board_position>& get_en_passant_target() const noexcept { return board_.en_passant_target(); }

    const std::vector<move_record>& get_move_history() const noexcept { return move_history_; }

    bool is_check() const noexcept { return state_ == game_state::check; }

    bool is_checkmate() const noexcept { return game_over_reason_ == game_over_reason::checkmate; }

    bool is_game_over() const noexcept { return state_ == game_state::game_over; }

private:
    void finish_move(bool irreversible);
    void update_game_state();
    void end_game(game_over_reason reason) noexcept;

    board board_;
    player active_player_ = player::white;
    game_state state_ = game_state::in_progress;
    std::optional<game_over_reason> game_over_reason_;
    int halfmove_clock_ = 0;
    int fullmove_number_ = 1;
    position_history history_;
    std::vector<move_record> move_history_;
    // Square of the pawn waiting to be promoted
    std::optional<board_position> pending_promotion_;
};

} // namespace referee

#endif // REFEREE_GAME_HPP
