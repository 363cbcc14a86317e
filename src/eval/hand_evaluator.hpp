#ifndef HU_HAND_EVALUATOR_HPP
#define HU_HAND_EVALUATOR_HPP

#include <vector>
#include <cstdint>
#include <string>

#include "core/cards.hpp"
#include "core/bitboard.hpp"

namespace hu_poker {

// Catégories de main, de la plus faible à la plus forte
enum class HandCategory : uint8_t {
    HIGH_CARD = 0,
    ONE_PAIR,
    TWO_PAIR,
    THREE_OF_A_KIND,
    STRAIGHT,
    FLUSH,
    FULL_HOUSE,
    FOUR_OF_A_KIND,
    STRAIGHT_FLUSH
};

/**
 * @brief Valeur d'une meilleure main de 5 cartes : catégorie puis rangs de départage.
 *
 * Le départage contient uniquement les rangs pertinents pour la catégorie
 * (ex. double paire : paire haute, paire basse, kicker). Pour une quinte,
 * un seul rang : la carte haute (5 pour la roue A-2-3-4-5).
 * Deux valeurs égales signifient un partage du pot.
 */
struct HandValue {
    HandCategory     category = HandCategory::HIGH_CARD;
    std::vector<int> tiebreak;

    bool operator==(const HandValue& other) const {
        return category == other.category && tiebreak == other.tiebreak;
    }
    bool operator!=(const HandValue& other) const { return !(*this == other); }

    bool operator<(const HandValue& other) const {
        if (category != other.category) return category < other.category;
        return tiebreak < other.tiebreak; // lexicographique
    }
    bool operator>(const HandValue& other) const { return other < *this; }
    bool operator<=(const HandValue& other) const { return !(other < *this); }
    bool operator>=(const HandValue& other) const { return !(*this < other); }

    // Force normalisée dans [0, 1] utilisée par le bot
    double strength() const;

    // Ex: "Full house, aces full of kings"
    std::string describe() const;
};

/**
 * @brief Évalue la meilleure main de 5 cartes parmi 5, 6 ou 7 cartes.
 * @throws std::invalid_argument si moins de 5 / plus de 7 cartes, carte invalide ou doublon.
 */
HandValue evaluate_hand(const std::vector<Card>& cards);

/**
 * @brief Surcharge pratique : cartes privées + board (5 à 7 cartes au total).
 */
HandValue evaluate_hand(const std::vector<Card>& hole_cards, const std::vector<Card>& board);

// Plus haute carte d'une quinte contenue dans le masque (0 si aucune)
int straight_top(RankMask mask);

std::string category_to_string(HandCategory category);

} // namespace hu_poker

#endif // HU_HAND_EVALUATOR_HPP
