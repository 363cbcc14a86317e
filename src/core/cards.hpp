#ifndef HU_CARDS_HPP
#define HU_CARDS_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <stdexcept> // Pour std::invalid_argument

namespace hu_poker {

// Une carte = index 0-51 (suit * 13 + rank - 2)
using Card = uint8_t;

// Constante pour une carte invalide/inconnue
constexpr Card INVALID_CARD = 52;

// Enum pour les couleurs (suits)
enum class Suit : uint8_t { CLUBS = 0, DIAMONDS = 1, HEARTS = 2, SPADES = 3 };

// Enum pour les rangs : valeur numérique = rang poker (2..14, As = 14)
enum class Rank : uint8_t {
    TWO = 2, THREE = 3, FOUR = 4, FIVE = 5, SIX = 6, SEVEN = 7, EIGHT = 8,
    NINE = 9, TEN = 10, JACK = 11, QUEEN = 12, KING = 13, ACE = 14
};

constexpr int NUM_RANKS = 13;
constexpr int NUM_SUITS = 4;

constexpr Card make_card(Rank r, Suit s) {
    return static_cast<Card>(static_cast<uint8_t>(s) * NUM_RANKS + (static_cast<uint8_t>(r) - 2));
}

constexpr Rank get_rank(Card c) {
    return static_cast<Rank>(c % NUM_RANKS + 2);
}

constexpr Suit get_suit(Card c) {
    return static_cast<Suit>(c / NUM_RANKS);
}

// Valeur entière du rang (2..14), pratique pour les calculs
constexpr int rank_value(Card c) {
    return static_cast<int>(get_rank(c));
}

constexpr bool is_valid_card(Card c) {
    return c < INVALID_CARD;
}

// Fonctions de conversion string <-> Card/Rank/Suit
std::string to_string(Suit s);
std::string to_string(Rank r);
std::string to_string(Card c);

Card card_from_string(const std::string& s);
std::vector<Card> cards_from_string(const std::string& s); // "As Kd 2c"
Rank rank_from_char(char r);
Suit suit_from_char(char s);

// Nom pluriel d'un rang ("aces", "kings"...) pour les descriptions de mains
std::string rank_plural_name(Rank r);

} // namespace hu_poker

#endif // HU_CARDS_HPP
