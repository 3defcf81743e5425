#include "referee/move_generator.hpp"

#include <iterator>
#include <span>

namespace referee {

namespace {

using move_inserter = std::back_insert_iterator<std::vector<chess_move>>;

constexpr board_offset rook_offsets[] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};
constexpr board_offset bishop_offsets[] = {{1, 1}, {-1, 1}, {1, -1}, {-1, -1}};
constexpr board_offset knight_offsets[] = {
    {1, 2},
    {1, -2},
    {-1, 2},
    {-1, -2},
    {2, 1},
    {2, -1},
    {-2, 1},
    {-2, -1}
};

// Checks if the position determined by position + offset is in bounds and not held by one of our own pieces
// If so, writes the move to the iterator it
// Returns true if the target position is empty, so a sliding piece can keep going
bool check_position(const board& board, player mover, board_position position, board_offset offset, move_inserter it) {
    auto target_position = apply_offset(position, offset);

    if(!target_position) return false;

    auto& target_piece = board.at(*target_position);

    auto type = move_type::normal_move;
    bool can_continue = true;

    if(target_piece) {
        // Encountered one of our own pieces, cannot move further
        if(target_piece->piece_player == mover) return false;

        // Encountered an enemy piece
        // We can capture it, but cannot move past it
        type = move_type::capture;

        can_continue = false;
    }

    *it = chess_move{
        .type = type,
        .start_position = position,
        .target_position = *target_position
    };

    return can_continue;
}

void get_sliding_moves(const board& board, board_position position, std::span<const board_offset> offsets, int limit, move_inserter it) {
    auto mover = board.at(position)->piece_player;

    for(auto offset : offsets) {
        for(int i = 1; i <= limit; i++) {
            bool can_continue = check_position(board, mover, position, {offset.rank_offset * i, offset.file_offset * i}, it);

            if(!can_continue) break;
        }
    }
}

void get_castle_moves(const board& board, board_position position, move_inserter it) {
    auto mover = board.at(position)->piece_player;
    int home_rank = mover == player::white ? 0 : 7;

    // Can only castle with the king on its starting square
    if(position.rank() != home_rank || position.file() != 4) return;

    auto& rights = board.get_castling_rights();

    if(!rights.allowed(mover, castle_side::kingside) && !rights.allowed(mover, castle_side::queenside)) return;

    auto attacked = get_attack_coverage(board, opponent(mover));

    // Castling out of check is not allowed
    if(attacked[position.index()]) return;

    struct castle_path {
        castle_side side;
        int rook_file;
        // Squares between king and rook, inclusive
        int first_empty_file;
        int last_empty_file;
        int king_step;
    };

    castle_path paths[] = {
        {castle_side::kingside, 7, 5, 6, 1},
        {castle_side::queenside, 0, 1, 3, -1}
    };

    for(auto path : paths) {
        if(!rights.allowed(mover, path.side)) continue;

        auto& rook = board.at({home_rank, path.rook_file});

        if(!rook || *rook != piece{piece_type::rook, mover}) continue;

        bool path_clear = true;

        for(int file = path.first_empty_file; file <= path.last_empty_file; file++) {
            if(board.at({home_rank, file})) {
                path_clear = false;
                break;
            }
        }

        if(!path_clear) continue;

        board_position transit = {home_rank, 4 + path.king_step};
        board_position destination = {home_rank, 4 + 2 * path.king_step};

        // The king may not pass through or land on an attacked square
        if(attacked[transit.index()] || attacked[destination.index()]) continue;

        *it = chess_move{
            .type = move_type::castle,
            .start_position = position,
            .target_position = destination
        };
    }
}

void get_pawn_moves(const board& board, board_position position, move_inserter it) {
    auto mover = board.at(position)->piece_player;

    int direction = pawn_direction(mover);

    // Moving 2 spaces is only allowed if the pawn is at its starting position
    bool double_move_allowed = position.rank() == (mover == player::white ? 1 : 6);

    for(int i = 1; i <= 2; i++) {
        auto target_position = apply_offset(position, {i * direction, 0});

        // Pawns cannot capture while moving forward
        if(!target_position || board.at(*target_position)) break;

        *it = chess_move{
            .type = move_type::normal_move,
            .start_position = position,
            .target_position = *target_position
        };

        if(!double_move_allowed) break;
    }

    // The rank a pawn of this colour lands on when capturing en passant
    int en_passant_rank = mover == player::white ? 5 : 2;

    for(int file_offset : {-1, 1}) {
        auto target_position = apply_offset(position, {direction, file_offset});

        if(!target_position) continue;

        auto& target_piece = board.at(*target_position);

        if(target_piece && target_piece->piece_player != mover) {
            *it = chess_move{
                .type = move_type::capture,
                .start_position = position,
                .target_position = *target_position
            };
        } else if(!target_piece && board.en_passant_target() == target_position && target_position->rank() == en_passant_rank) {
            *it = chess_move{
                .type = move_type::en_passant,
                .start_position = position,
                .target_position = *target_position
            };
        }
    }
}

void get_knight_moves(const board& board, board_position position, move_inserter it) {
    get_sliding_moves(board, position, knight_offsets, 1, it);
}

void get_bishop_moves(const board& board, board_position position, move_inserter it) {
    get_sliding_moves(board, position, bishop_offsets, 7, it);
}

void get_rook_moves(const board& board, board_position position, move_inserter it) {
    get_sliding_moves(board, position, rook_offsets, 7, it);
}

void get_queen_moves(const board& board, board_position position, move_inserter it) {
    get_sliding_moves(board, position, rook_offsets, 7, it);
    get_sliding_moves(board, position, bishop_offsets, 7, it);
}

void get_king_moves(const board& board, board_position position, move_inserter it) {
    get_sliding_moves(board, position, rook_offsets, 1, it);
    get_sliding_moves(board, position, bishop_offsets, 1, it);

    get_castle_moves(board, position, it);
}

using piece_move_generator = void (*)(const board&, board_position, move_inserter);

// Indexed by piece_type
constexpr piece_move_generator move_generators[] = {
    get_pawn_moves,
    get_knight_moves,
    get_bishop_moves,
    get_rook_moves,
    get_queen_moves,
    get_king_moves
};

static_assert(std::size(move_generators) == static_cast<std::size_t>(piece_type::king) + 1);

void add_attacks(const board& board, board_position position, std::span<const board_offset> offsets, int limit, std::bitset<64>& coverage) {
    for(auto offset : offsets) {
        for(int i = 1; i <= limit; i++) {
            auto target_position = apply_offset(position, {offset.rank_offset * i, offset.file_offset * i});

            if(!target_position) break;

            coverage.set(target_position->index());

            // Sliding pieces stop at the first occupied square, whoever owns it
            if(board.at(*target_position)) break;
        }
    }
}

} // namespace

std::vector<chess_move> get_pseudo_legal_moves(const board& board, board_position position) {
    std::vector<chess_move> moves;

    auto& square = board.at(position);

    if(!square) return moves;

    move_generators[static_cast<std::size_t>(square->type)](board, position, std::back_inserter(moves));

    return moves;
}

std::bitset<64> get_attack_coverage(const board& board, player attacker) {
    std::bitset<64> coverage;

    for(int index = 0; index < 64; index++) {
        auto& square = board.squares()[index];

        if(!square || square->piece_player != attacker) continue;

        auto position = board_position::from_index(index);

        switch(square->type) {
        case piece_type::pawn:
            for(int file_offset : {-1, 1}) {
                auto target_position = apply_offset(position, {pawn_direction(attacker), file_offset});

                if(target_position) coverage.set(target_position->index());
            }
            break;
        case piece_type::knight:
            add_attacks(board, position, knight_offsets, 1, coverage);
            break;
        case piece_type::bishop:
            add_attacks(board, position, bishop_offsets, 7, coverage);
            break;
        case piece_type::rook:
            add_attacks(board, position, rook_offsets, 7, coverage);
            break;
        case piece_type::queen:
            add_attacks(board, position, rook_offsets, 7, coverage);
            add_attacks(board, position, bishop_offsets, 7, coverage);
            break;
        case piece_type::king:
            add_attacks(board, position, rook_offsets, 1, coverage);
            add_attacks(board, position, bishop_offsets, 1, coverage);
            break;
        }
    }

    return coverage;
}

} // namespace referee
