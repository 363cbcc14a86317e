#include "core/bitboard.hpp"
#include "core/cards.hpp"

namespace hu_poker {

// pop_lsb rend les cartes par index croissant : la sortie est déjà triée
std::string board_to_string(Bitboard board) {
    std::string out;
    out.reserve(static_cast<size_t>(count_set_bits(board)) * 2);
    while (board != EMPTY_BOARD) {
        out += to_string(pop_lsb(board));
    }
    return out;
}

std::vector<Card> board_to_cards(Bitboard board) {
    std::vector<Card> cards;
    cards.reserve(count_set_bits(board));
    while (board != EMPTY_BOARD) {
        cards.push_back(pop_lsb(board));
    }
    return cards;
}

Bitboard cards_to_board(const std::vector<Card>& cards) {
    Bitboard board = EMPTY_BOARD;
    for (Card c : cards) {
        set_card(board, c);
    }
    return board;
}

std::vector<Card> complement_cards(Bitboard known) {
    return board_to_cards(FULL_DECK & ~known);
}

} // namespace hu_poker
