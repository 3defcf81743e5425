// include/referee/c_api.hpp
#ifndef REFEREE_C_API_HPP
#define REFEREE_C_API_HPP

#include <cstddef> // For std::size_t
#include <cstdint> // For std::int8_t

// Define REFEREE_EXPORT based on platform (simplified)
#ifdef _WIN32
    #define REFEREE_EXPORT __declspec(dllexport)
#else
    #define REFEREE_EXPORT __attribute__((visibility("default")))
#endif

// Result codes returned by every function below
// Negative codes mirror referee::error_kind, in declaration order
#define REFEREE_OK 0
#define REFEREE_ERR_INVALID_POSITION (-1)
#define REFEREE_ERR_WRONG_TURN (-2)
#define REFEREE_ERR_INVALID_MOVE (-3)
#define REFEREE_ERR_PROMOTION_PENDING (-4)
#define REFEREE_ERR_INVALID_PROMOTION_CHOICE (-5)
#define REFEREE_ERR_GAME_ALREADY_OVER (-6)
#define REFEREE_ERR_INVALID_BOARD_STATE (-7)
#define REFEREE_ERR_NULL_ARGUMENT (-8)
#define REFEREE_ERR_BUFFER_TOO_SMALL (-9)
#define REFEREE_ERR_INTERNAL (-10)

// Use extern "C" to prevent C++ name mangling for C API functions
extern "C" {

    // One square of a board snapshot
    // piece_type and colour use the numeric values of referee::piece_type and referee::player
    struct referee_square {
        std::int8_t occupied;
        std::int8_t piece_type;
        std::int8_t colour;
    };

    // --- Game Handle Management ---
    /**
     * @brief Creates a game in the standard starting position.
     * @return Opaque pointer to the game handle on success, nullptr on failure.
     */
    REFEREE_EXPORT void* referee_create() noexcept;

    /**
     * @brief Destroys the game handle and releases its resources. Accepts nullptr.
     */
    REFEREE_EXPORT void referee_destroy(void* game_handle_opaque) noexcept;

    /**
     * @brief Puts the game back in the standard starting position.
     */
    REFEREE_EXPORT int referee_reset(void* game_handle_opaque) noexcept;

    // --- State Access ---
    /**
     * @brief Copies the 64 squares, a1 first and h8 last, into out_squares.
     * @param out_squares Array of at least 64 referee_square.
     */
    REFEREE_EXPORT int referee_get_board(void* game_handle_opaque, referee_square* out_squares) noexcept;

    // Writes the numeric value of referee::player
    REFEREE_EXPORT int referee_get_active_player(void* game_handle_opaque, int* out_player) noexcept;

    // Writes the numeric value of referee::game_state
    REFEREE_EXPORT int referee_get_game_state(void* game_handle_opaque, int* out_state) noexcept;

    // Writes the numeric value of referee::game_over_reason, or -1 while the game is not over
    REFEREE_EXPORT int referee_get_game_over_reason(void* game_handle_opaque, int* out_reason) noexcept;

    /**
     * @brief Legal destinations of the piece on square, as board indices (0 = a1, 63 = h8).
     * @param square Algebraic notation such as "e2".
     * @param out_indices Buffer for the destinations; may be nullptr when capacity is 0.
     * @param out_count Receives the number of destinations, even if the buffer is too small.
     * @return REFEREE_ERR_BUFFER_TOO_SMALL if not every destination fit.
     */
    REFEREE_EXPORT int referee_get_possible_moves(void* game_handle_opaque,
                                                  const char* square,
                                                  int* out_indices,
                                                  std::size_t capacity,
                                                  std::size_t* out_count) noexcept;

    // --- Moves ---
    /**
     * @brief Moves the piece on from to to, both in algebraic notation.
     * @param out_state Receives the game state after the move; may be nullptr.
     */
    REFEREE_EXPORT int referee_make_move(void* game_handle_opaque, const char* from, const char* to, int* out_state) noexcept;

    /**
     * @brief Completes a pending promotion.
     * @param choice A piece letter or word, e.g. "Q" or "queen".
     * @param out_state Receives the game state after the promotion; may be nullptr.
     */
    REFEREE_EXPORT int referee_set_promotion(void* game_handle_opaque, const char* choice, int* out_state) noexcept;

    // --- Draws ---
    REFEREE_EXPORT int referee_can_enact_50_move_rule(void* game_handle_opaque, int* out_claimable) noexcept;

    REFEREE_EXPORT int referee_can_enact_threefold_repetition_rule(void* game_handle_opaque, int* out_claimable) noexcept;

    /**
     * @brief Ends the game as a draw agreed by both players.
     */
    REFEREE_EXPORT int referee_submit_draw(void* game_handle_opaque) noexcept;

} // extern "C"

#endif // REFEREE_C_API_HPP
