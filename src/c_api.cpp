// src/c_api.cpp
#include "referee/c_api.hpp"
#include "referee/errors.hpp"
#include "referee/game.hpp"
#include "referee/types.hpp"

#include <algorithm>
#include <iostream>
#include <new>
#include <string_view>
#include <vector>

// Define GameHandle struct
struct GameHandle {
    referee::game current_game;
};

namespace {

int to_result_code(referee::error_kind kind) noexcept {
    // error_kind values start at 0, result codes at -1
    return -1 - static_cast<int>(kind);
}

// Runs body against the handle and turns anything it throws into a result code
template<typename Body>
int guarded(const char* function_name, void* game_handle_opaque, Body&& body) noexcept {
    if (!game_handle_opaque) {
        std::cerr << "[referee C API ERROR] " << function_name << " called with null handle." << std::endl;
        return REFEREE_ERR_NULL_ARGUMENT;
    }

    GameHandle* handle = static_cast<GameHandle*>(game_handle_opaque);

    try {
        return body(handle->current_game);
    } catch (const referee::chess_error& e) {
#ifdef REFEREE_VERBOSE_API
        std::cerr << "[referee C API] " << function_name << " rejected (" << referee::to_string(e.kind()) << "): " << e.what() << std::endl;
#endif
        return to_result_code(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "[referee C API ERROR] Exception during " << function_name << ": " << e.what() << std::endl;
        return REFEREE_ERR_INTERNAL;
    } catch (...) {
        std::cerr << "[referee C API ERROR] Unknown exception during " << function_name << "." << std::endl;
        return REFEREE_ERR_INTERNAL;
    }
}

} // namespace

// Define functions within extern "C" block
extern "C" {

    // --- Game Handle Management ---
    REFEREE_EXPORT void* referee_create() noexcept {
        try {
            GameHandle* handle = new(std::nothrow) GameHandle{};
            if (!handle) {
                std::cerr << "[referee C API ERROR] referee_create could not allocate a game." << std::endl;
                return nullptr;
            }
#ifdef REFEREE_VERBOSE_API
            std::cout << "[referee C API] referee_create successful." << std::endl;
#endif
            return handle;
        } catch (const std::exception& e) {
            std::cerr << "[referee C API ERROR] Exception during referee_create: " << e.what() << std::endl;
            return nullptr;
        } catch (...) {
            std::cerr << "[referee C API ERROR] Unknown exception during referee_create." << std::endl;
            return nullptr;
        }
    }

    REFEREE_EXPORT void referee_destroy(void* game_handle_opaque) noexcept {
        if (game_handle_opaque) {
#ifdef REFEREE_VERBOSE_API
            std::cout << "[referee C API] referee_destroy called." << std::endl;
#endif
            delete static_cast<GameHandle*>(game_handle_opaque);
        } else {
            std::cerr << "[referee C API WARNING] referee_destroy called with null handle." << std::endl;
        }
    }

    REFEREE_EXPORT int referee_reset(void* game_handle_opaque) noexcept {
        return guarded("referee_reset", game_handle_opaque, [](referee::game& current_game) {
            current_game = referee::game{};
#ifdef REFEREE_VERBOSE_API
            std::cout << "[referee C API] referee_reset: game reset to the starting position." << std::endl;
#endif
            return REFEREE_OK;
        });
    }

    // --- State Access ---
    REFEREE_EXPORT int referee_get_board(void* game_handle_opaque, referee_square* out_squares) noexcept {
        if (!out_squares) return REFEREE_ERR_NULL_ARGUMENT;

        return guarded("referee_get_board", game_handle_opaque, [out_squares](referee::game& current_game) {
            auto& squares = current_game.get_board().squares();

            for (std::size_t index = 0; index < squares.size(); index++) {
                auto& square = squares[index];
                out_squares[index] = referee_square{
                    static_cast<std::int8_t>(square.has_value()),
                    static_cast<std::int8_t>(square ? static_cast<int>(square->type) : -1),
                    static_cast<std::int8_t>(square ? static_cast<int>(square->piece_player) : -1)
                };
            }

            return REFEREE_OK;
        });
    }

    REFEREE_EXPORT int referee_get_active_player(void* game_handle_opaque, int* out_player) noexcept {
        if (!out_player) return REFEREE_ERR_NULL_ARGUMENT;

        return guarded("referee_get_active_player", game_handle_opaque, [out_player](referee::game& current_game) {
            *out_player = static_cast<int>(current_game.get_active_player());
            return REFEREE_OK;
        });
    }

    REFEREE_EXPORT int referee_get_game_state(void* game_handle_opaque, int* out_state) noexcept {
        if (!out_state) return REFEREE_ERR_NULL_ARGUMENT;

        return guarded("referee_get_game_state", game_handle_opaque, [out_state](referee::game& current_game) {
            *out_state = static_cast<int>(current_game.get_game_state());
            return REFEREE_OK;
        });
    }

    REFEREE_EXPORT int referee_get_game_over_reason(void* game_handle_opaque, int* out_reason) noexcept {
        if (!out_reason) return REFEREE_ERR_NULL_ARGUMENT;

        return guarded("referee_get_game_over_reason", game_handle_opaque, [out_reason](referee::game& current_game) {
            auto reason = current_game.get_game_over_reason();
            *out_reason = reason ? static_cast<int>(*reason) : -1;
            return REFEREE_OK;
        });
    }

    REFEREE_EXPORT int referee_get_possible_moves(void* game_handle_opaque,
                                                  const char* square,
                                                  int* out_indices,
                                                  std::size_t capacity,
                                                  std::size_t* out_count) noexcept
    {
        if (!square || !out_count || (!out_indices && capacity > 0)) return REFEREE_ERR_NULL_ARGUMENT;

        return guarded("referee_get_possible_moves", game_handle_opaque, [=](referee::game& current_game) {
            std::vector<referee::board_position> destinations = current_game.get_possible_moves(std::string_view{square});

            *out_count = destinations.size();

            std::size_t num_to_copy = std::min(destinations.size(), capacity);
            std::transform(destinations.begin(), destinations.begin() + num_to_copy, out_indices,
                           [](referee::board_position destination) { return destination.index(); });

            if (num_to_copy < destinations.size()) {
                std::cerr << "[referee C API WARNING] referee_get_possible_moves buffer holds " << capacity
                          << " of " << destinations.size() << " destinations." << std::endl;
                return REFEREE_ERR_BUFFER_TOO_SMALL;
            }

            return REFEREE_OK;
        });
    }

    // --- Moves ---
    REFEREE_EXPORT int referee_make_move(void* game_handle_opaque, const char* from, const char* to, int* out_state) noexcept {
        if (!from || !to) return REFEREE_ERR_NULL_ARGUMENT;

        return guarded("referee_make_move", game_handle_opaque, [=](referee::game& current_game) {
            referee::game_state state = current_game.make_move(std::string_view{from}, std::string_view{to});
#ifdef REFEREE_VERBOSE_API
            std::cout << "[referee C API] referee_make_move " << from << " to " << to
                      << ", state=" << static_cast<int>(state) << std::endl;
#endif
            if (out_state) *out_state = static_cast<int>(state);
            return REFEREE_OK;
        });
    }

    REFEREE_EXPORT int referee_set_promotion(void* game_handle_opaque, const char* choice, int* out_state) noexcept {
        if (!choice) return REFEREE_ERR_NULL_ARGUMENT;

        return guarded("referee_set_promotion", game_handle_opaque, [=](referee::game& current_game) {
            referee::game_state state = current_game.set_promotion(referee::parse_piece_type(choice));
            if (out_state) *out_state = static_cast<int>(state);
            return REFEREE_OK;
        });
    }

    // --- Draws ---
    REFEREE_EXPORT int referee_can_enact_50_move_rule(void* game_handle_opaque, int* out_claimable) noexcept {
        if (!out_claimable) return REFEREE_ERR_NULL_ARGUMENT;

        return guarded("referee_can_enact_50_move_rule", game_handle_opaque, [out_claimable](referee::game& current_game) {
            *out_claimable = current_game.can_enact_50_move_rule() ? 1 : 0;
            return REFEREE_OK;
        });
    }

    REFEREE_EXPORT int referee_can_enact_threefold_repetition_rule(void* game_handle_opaque, int* out_claimable) noexcept {
        if (!out_claimable) return REFEREE_ERR_NULL_ARGUMENT;

        return guarded("referee_can_enact_threefold_repetition_rule", game_handle_opaque, [out_claimable](referee::game& current_game) {
            *out_claimable = current_game.can_enact_threefold_repetition_rule() ? 1 : 0;
            return REFEREE_OK;
        });
    }

    REFEREE_EXPORT int referee_submit_draw(void* game_handle_opaque) noexcept {
        return guarded("referee_submit_draw", game_handle_opaque, [](referee::game& current_game) {
            current_game.submit_draw();
#ifdef REFEREE_VERBOSE_API
            std::cout << "[referee C API] referee_submit_draw: game drawn by agreement." << std::endl;
#endif
            return REFEREE_OK;
        });
    }

} // extern "C"
