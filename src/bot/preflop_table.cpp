#include "bot/preflop_table.hpp"
#include <algorithm>
#include <array>
#include <stdexcept>

namespace hu_poker {

namespace {

// Codes internes des tables : 1=Premium .. 5=Trash, 0 = case inutilisée
constexpr uint8_t P = 1;
constexpr uint8_t S = 2;
constexpr uint8_t L = 3;
constexpr uint8_t M = 4;
constexpr uint8_t T = 5;

// Paires, indexées par rang - 2 (22 .. AA)
constexpr std::array<uint8_t, NUM_RANKS> PAIR_TIER = {
    M, M, M, M, L, L, L, L, S, S, P, P, P
};

// Assorties : SUITED[bas][haut]
constexpr std::array<std::array<uint8_t, NUM_RANKS>, NUM_RANKS> SUITED = {{
    //  2  3  4  5  6  7  8  9  T  J  Q  K  A
    {{0, T, T, T, T, T, T, T, T, T, T, M, L}}, // 2
    {{0, 0, M, T, T, T, T, T, T, T, T, M, L}}, // 3
    {{0, 0, 0, M, M, T, T, T, T, T, T, M, L}}, // 4
    {{0, 0, 0, 0, M, M, M, T, T, T, T, M, L}}, // 5
    {{0, 0, 0, 0, 0, M, L, M, T, T, T, M, L}}, // 6
    {{0, 0, 0, 0, 0, 0, L, L, M, T, T, M, L}}, // 7
    {{0, 0, 0, 0, 0, 0, 0, L, L, M, M, M, L}}, // 8
    {{0, 0, 0, 0, 0, 0, 0, 0, L, L, M, L, L}}, // 9
    {{0, 0, 0, 0, 0, 0, 0, 0, 0, L, L, L, S}}, // T
    {{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, L, S, S}}, // J
    {{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, S, S}}, // Q
    {{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, P}}, // K
    {{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0}}, // A
}};

// Dépareillées : OFFSUIT[haut][bas]
constexpr std::array<std::array<uint8_t, NUM_RANKS>, NUM_RANKS> OFFSUIT = {{
    //  2  3  4  5  6  7  8  9  T  J  Q  K  A
    {{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0}}, // 2
    {{T, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0}}, // 3
    {{T, M, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0}}, // 4
    {{T, T, M, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0}}, // 5
    {{T, T, T, M, 0, 0, 0, 0, 0, 0, 0, 0, 0}}, // 6
    {{T, T, T, T, M, 0, 0, 0, 0, 0, 0, 0, 0}}, // 7
    {{T, T, T, T, T, M, 0, 0, 0, 0, 0, 0, 0}}, // 8
    {{T, T, T, T, T, T, M, 0, 0, 0, 0, 0, 0}}, // 9
    {{T, T, T, T, T, T, T, M, 0, 0, 0, 0, 0}}, // T
    {{T, T, T, T, T, T, T, T, M, 0, 0, 0, 0}}, // J
    {{T, T, T, T, T, T, T, T, M, M, 0, 0, 0}}, // Q
    {{T, T, T, T, T, T, T, T, M, M, L, 0, 0}}, // K
    {{T, T, T, M, M, M, M, M, L, L, S, P, 0}}, // A
}};

PreflopTier tier_from_code(uint8_t code) {
    switch (code) {
        case P: return PreflopTier::PREMIUM;
        case S: return PreflopTier::STRONG;
        case L: return PreflopTier::PLAYABLE;
        case M: return PreflopTier::MARGINAL;
        default: return PreflopTier::TRASH;
    }
}

void check_hole_cards(const std::vector<Card>& hole_cards) {
    if (hole_cards.size() != 2 || !is_valid_card(hole_cards[0]) || !is_valid_card(hole_cards[1])
        || hole_cards[0] == hole_cards[1]) {
        throw std::invalid_argument("Preflop classification expects exactly 2 distinct valid cards");
    }
}

} // namespace

double tier_base_strength(PreflopTier tier) {
    switch (tier) {
        case PreflopTier::PREMIUM:  return 0.90;
        case PreflopTier::STRONG:   return 0.75;
        case PreflopTier::PLAYABLE: return 0.60;
        case PreflopTier::MARGINAL: return 0.45;
        case PreflopTier::TRASH:    return 0.25;
    }
    return 0.25;
}

std::string tier_to_string(PreflopTier tier) {
    switch (tier) {
        case PreflopTier::PREMIUM:  return "Premium";
        case PreflopTier::STRONG:   return "Strong";
        case PreflopTier::PLAYABLE: return "Playable";
        case PreflopTier::MARGINAL: return "Marginal";
        case PreflopTier::TRASH:    return "Trash";
    }
    return "Unknown";
}

PreflopTier classify_preflop(const std::vector<Card>& hole_cards) {
    check_hole_cards(hole_cards);
    const int r0 = rank_value(hole_cards[0]);
    const int r1 = rank_value(hole_cards[1]);

    if (r0 == r1) return tier_from_code(PAIR_TIER[r0 - 2]);

    const int hi = std::max(r0, r1) - 2;
    const int lo = std::min(r0, r1) - 2;
    const bool suited = get_suit(hole_cards[0]) == get_suit(hole_cards[1]);
    return tier_from_code(suited ? SUITED[lo][hi] : OFFSUIT[hi][lo]);
}

double preflop_strength(const std::vector<Card>& hole_cards) {
    const double base = tier_base_strength(classify_preflop(hole_cards));
    const int hi = std::max(rank_value(hole_cards[0]), rank_value(hole_cards[1]));
    const int lo = std::min(rank_value(hole_cards[0]), rank_value(hole_cards[1]));
    const double kicker_bonus = (hi - 2) / 12.0 * 0.04 + (lo - 2) / 12.0 * 0.01;
    return std::min(1.0, base + kicker_bonus);
}

} // namespace hu_poker
