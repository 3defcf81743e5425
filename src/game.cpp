#include "referee/game.hpp"
#include "referee/draw_rules.hpp"
#include "referee/errors.hpp"
#include "referee/legality.hpp"
#include "referee/move_generator.hpp"

#include <algorithm>
#include <iterator>

namespace referee {

namespace {

int home_rank(player p) {
    return p == player::white ? 0 : 7;
}

int last_rank(player p) {
    return p == player::white ? 7 : 0;
}

void validate_start(const board& board, player active_player) {
    int kings[2] = {0, 0};

    for(int index = 0; index < 64; index++) {
        auto& square = board.squares()[index];

        if(!square) continue;

        if(square->type == piece_type::king) {
            kings[static_cast<int>(square->piece_player)]++;
        }

        int rank = index / 8;

        if(square->type == piece_type::pawn && (rank == 0 || rank == 7)) {
            throw invalid_board_state_error{"Invalid board state: pawn on " + board_position::from_index(index).to_string()};
        }
    }

    if(kings[0] != 1 || kings[1] != 1) {
        throw invalid_board_state_error{"Invalid board state: each player needs exactly one king"};
    }

    if(is_player_in_check(board, opponent(active_player))) {
        throw invalid_board_state_error{"Invalid board state: the player not to move is in check"};
    }

    if(auto target = board.en_passant_target()) {
        // The pawn that just double stepped stands one rank past the target, seen from its owner
        auto pushed_pawn = apply_offset(*target, {pawn_direction(opponent(active_player)), 0});

        bool valid = target->rank() == (active_player == player::white ? 5 : 2) &&
                     !board.at(*target) &&
                     pushed_pawn &&
                     board.at(*pushed_pawn) == piece{piece_type::pawn, opponent(active_player)};

        if(!valid) {
            throw invalid_board_state_error{"Invalid board state: no pawn can just have skipped " + target->to_string()};
        }
    }
}

// Castling rights only survive while both the king and that rook are on their home squares
void drop_unusable_castling_rights(board& board) {
    for(auto p : {player::white, player::black}) {
        int rank = home_rank(p);

        if(board.at({rank, 4}) != piece{piece_type::king, p}) {
            board.get_castling_rights().revoke_all(p);
        }

        if(board.at({rank, 7}) != piece{piece_type::rook, p}) {
            board.get_castling_rights().revoke(p, castle_side::kingside);
        }

        if(board.at({rank, 0}) != piece{piece_type::rook, p}) {
            board.get_castling_rights().revoke(p, castle_side::queenside);
        }
    }
}

} // namespace

game::game() : game{board::initial_board(), player::white} {}

game::game(const board& start, player active_player) : board_{start}, active_player_{active_player} {
    validate_start(board_, active_player_);
    drop_unusable_castling_rights(board_);

    history_.add_position(position_fingerprint::of(board_, active_player_));

    update_game_state();
}

std::vector<board_position> game::get_possible_moves(board_position position) const {
    if(state_ == game_state::waiting_on_promotion_choice) {
        throw promotion_pending_error{"Choose a promotion for the pawn on " + pending_promotion_->to_string() + " first"};
    }

    if(state_ == game_state::game_over) return {};

    auto& square = board_.at(position);

    if(!square || square->piece_player != active_player_) return {};

    std::vector<board_position> destinations;

    std::ranges::transform(get_legal_moves(board_, position), std::back_inserter(destinations), &chess_move::target_position);

    return destinations;
}

std::vector<board_position> game::get_possible_moves(std::string_view position) const {
    return get_possible_moves(board_position::parse(position));
}

std::vector<board_position> game::get_possible_capture_moves(board_position position) const {
    auto destinations = get_possible_moves(position);

    // Only reached when position holds one of the active player's pieces
    bool is_pawn = !destinations.empty() && board_.at(position)->type == piece_type::pawn;

    std::erase_if(destinations, [this, is_pawn](board_position destination) {
        return !board_.at(destination) && !(is_pawn && board_.en_passant_target() == destination);
    });

    return destinations;
}

std::vector<board_position> game::get_possible_non_capture_moves(board_position position) const {
    auto destinations = get_possible_moves(position);
    auto captures = get_possible_capture_moves(position);

    std::erase_if(destinations, [&captures](board_position destination) {
        return std::ranges::find(captures, destination) != captures.end();
    });

    return destinations;
}

game_state game::make_move(std::string_view from, std::string_view to) {
    return make_move(board_position::parse(from), board_position::parse(to));
}

game_state game::make_move(board_position from, board_position to) {
    if(state_ == game_state::game_over) {
        throw game_already_over_error{"The game is over; no more moves can be made"};
    }

    if(state_ == game_state::waiting_on_promotion_choice) {
        throw promotion_pending_error{"Choose a promotion for the pawn on " + pending_promotion_->to_string() + " before moving"};
    }

    auto& square = board_.at(from);

    if(!square) {
        throw wrong_turn_error{"There is no piece on " + from.to_string()};
    }

    if(square->piece_player != active_player_) {
        throw wrong_turn_error{"The piece on " + from.to_string() + " does not belong to the player to move"};
    }

    auto legal_moves = get_legal_moves(board_, from);

    auto it = std::ranges::find(legal_moves, to, &chess_move::target_position);

    if(it == legal_moves.end()) {
        throw invalid_move_error{"Illegal move " + from.to_string() + " to " + to.to_string() +
                                 ": the piece cannot move there, or the move leaves its king in check"};
    }

    auto move = *it;
    auto moved_piece = *square;

    std::optional<piece> captured_piece = move.type == move_type::en_passant ? board_.at({from.rank(), to.file()}) : board_.at(to);

    auto next_board = apply_move(board_, move);

    move_history_.push_back({
        .from = from,
        .to = to,
        .moved_piece = moved_piece,
        .captured_piece = captured_piece,
        .castling = move.type == move_type::castle,
        .en_passant = move.type == move_type::en_passant
    });

    board_ = next_board;

    bool irreversible = moved_piece.type == piece_type::pawn || captured_piece.has_value();

    halfmove_clock_ = irreversible ? 0 : halfmove_clock_ + 1;

    if(moved_piece.type == piece_type::pawn && to.rank() == last_rank(active_player_)) {
        // The same player stays active until the promotion choice is made
        pending_promotion_ = to;
        state_ = game_state::waiting_on_promotion_choice;

        return state_;
    }

    finish_move(irreversible);

    return state_;
}

game_state game::set_promotion(piece_type type) {
    if(state_ == game_state::game_over) {
        throw game_already_over_error{"The game is over; no promotion can be made"};
    }

    if(state_ != game_state::waiting_on_promotion_choice) {
        throw invalid_promotion_choice_error{"No pawn is waiting to be promoted"};
    }

    if(type == piece_type::pawn || type == piece_type::king) {
        throw invalid_promotion_choice_error{std::string{"A pawn cannot be promoted to a "} + (type == piece_type::pawn ? "pawn" : "king")};
    }

    board_.set(*pending_promotion_, piece{type, active_player_});
    move_history_.back().promotion = type;
    pending_promotion_.reset();

    // Promotions only follow pawn moves
    finish_move(true);

    return state_;
}

bool game::can_enact_50_move_rule() const noexcept {
    return can_claim_fifty_move_rule(halfmove_clock_);
}

bool game::can_enact_threefold_repetition_rule() const {
    return can_claim_threefold_repetition(history_.count(position_fingerprint::of(board_, active_player_)));
}

void game::submit_draw() {
    if(state_ == game_state::game_over) {
        throw game_already_over_error{"The game is already over"};
    }

    pending_promotion_.reset();

    end_game(game_over_reason::mutual_draw);
}

void game::finish_move(bool irreversible) {
    // A full move is finished when black makes their move
    if(active_player_ == player::black) {
        fullmove_number_++;
    }

    active_player_ = opponent(active_player_);

    if(irreversible) {
        history_.clear_on_irreversible_move();
    }

    history_.add_position(position_fingerprint::of(board_, active_player_));

    update_game_state();
}

void game::update_game_state() {
    bool in_check = is_player_in_check(board_, active_player_);

    if(!has_any_legal_move(board_, active_player_)) {
        end_game(in_check ? game_over_reason::checkmate : game_over_reason::stalemate);
        return;
    }

    int occurrences = history_.count(position_fingerprint::of(board_, active_player_));

    if(auto reason = automatic_draw_reason(board_, halfmove_clock_, occurrences)) {
        end_game(*reason);
        return;
    }

    state_ = in_check ? game_state::check : game_state::in_progress;
}

void game::end_game(game_over_reason reason) noexcept {
    state_ = game_state::game_over;
    game_over_reason_ = reason;
}

} // namespace referee
