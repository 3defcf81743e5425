#include "referee/types.hpp"
#include "referee/errors.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace referee {

char to_char(piece_type type) noexcept {
    switch(type) {
    case piece_type::pawn:
        return 'P';
    case piece_type::knight:
        return 'N';
    case piece_type::bishop:
        return 'B';
    case piece_type::rook:
        return 'R';
    case piece_type::queen:
        return 'Q';
    case piece_type::king:
        return 'K';
    }

    return '?';
}

char to_char(piece p) noexcept {
    char c = to_char(p.type);

    return p.piece_player == player::white ? c : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

piece_type parse_piece_type(std::string_view text) {
    auto first = text.find_first_not_of(" \t\r\n");
    auto last = text.find_last_not_of(" \t\r\n");

    std::string lowered;

    if(first != std::string_view::npos) {
        lowered = text.substr(first, last - first + 1);
    }

    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    using enum piece_type;

    if(lowered == "p" || lowered == "pawn") return pawn;
    if(lowered == "n" || lowered == "knight") return knight;
    if(lowered == "b" || lowered == "bishop") return bishop;
    if(lowered == "r" || lowered == "rook") return rook;
    if(lowered == "q" || lowered == "queen") return queen;
    if(lowered == "k" || lowered == "king") return king;

    throw invalid_promotion_choice_error{"'" + std::string{text} + "' does not name a piece"};
}

} // namespace referee
