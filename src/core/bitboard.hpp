#ifndef HU_BITBOARD_HPP
#define HU_BITBOARD_HPP

#include <bit>
#include <cstdint>
#include <string>
#include <vector>

#include "core/cards.hpp"

namespace hu_poker {

// Ensemble de cartes : bit i = carte d'index i (0-51)
using Bitboard = uint64_t;

// Masque de rangs : bit (rank - 2) = rang présent (13 bits)
using RankMask = uint16_t;

constexpr Bitboard EMPTY_BOARD = 0ULL;
constexpr int NUM_CARDS = 52;
constexpr Bitboard FULL_DECK = (1ULL << NUM_CARDS) - 1;

inline void set_card(Bitboard& board, Card c) {
    if (is_valid_card(c)) {
        board |= (1ULL << c);
    }
}

inline void clear_card(Bitboard& board, Card c) {
    if (is_valid_card(c)) {
        board &= ~(1ULL << c);
    }
}

inline bool test_card(Bitboard board, Card c) {
    if (!is_valid_card(c)) return false;
    return (board & (1ULL << c)) != 0;
}

inline int count_set_bits(Bitboard board) {
    return std::popcount(board);
}

// Extraire la carte du bit le moins significatif et l'enlever
inline Card pop_lsb(Bitboard& board) {
    if (board == 0) {
        return INVALID_CARD;
    }
    const int lsb_index = std::countr_zero(board);
    board &= (board - 1);
    return static_cast<Card>(lsb_index);
}

// Rangs présents dans une couleur donnée
inline RankMask suit_rank_mask(Bitboard board, Suit s) {
    const int shift = static_cast<int>(s) * NUM_RANKS;
    return static_cast<RankMask>((board >> shift) & 0x1FFF);
}

// Rangs présents toutes couleurs confondues
inline RankMask rank_mask(Bitboard board) {
    return static_cast<RankMask>(suit_rank_mask(board, Suit::CLUBS) |
                                 suit_rank_mask(board, Suit::DIAMONDS) |
                                 suit_rank_mask(board, Suit::HEARTS) |
                                 suit_rank_mask(board, Suit::SPADES));
}

// Fonctions de conversion
std::string board_to_string(Bitboard board);
std::vector<Card> board_to_cards(Bitboard board);
Bitboard cards_to_board(const std::vector<Card>& cards);

// Cartes du paquet absentes de `known`, par index croissant
std::vector<Card> complement_cards(Bitboard known);

} // namespace hu_poker

#endif // HU_BITBOARD_HPP
