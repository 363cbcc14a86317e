#ifndef HU_BOT_PREFLOP_TABLE_HPP
#define HU_BOT_PREFLOP_TABLE_HPP

#include <string>
#include <vector>

#include "core/cards.hpp"

namespace hu_poker {

// Catégories de mains de départ heads-up, de la plus faible à la plus forte
enum class PreflopTier {
    TRASH = 0,
    MARGINAL,
    PLAYABLE,
    STRONG,
    PREMIUM
};

// Force de base d'une catégorie (0.25 .. 0.90)
double tier_base_strength(PreflopTier tier);

std::string tier_to_string(PreflopTier tier);

/**
 * @brief Classe deux cartes privées via les tables paires / assorties / dépareillées.
 * @throws std::invalid_argument si la main ne contient pas exactement 2 cartes valides.
 */
PreflopTier classify_preflop(const std::vector<Card>& hole_cards);

// Force de base de la catégorie + bonus de kicker (jusqu'à +0.05), plafonnée à 1
double preflop_strength(const std::vector<Card>& hole_cards);

} // namespace hu_poker

#endif // HU_BOT_PREFLOP_TABLE_HPP
