// ─────────────────────────────────────────────────────────────────────────────
//  src/eval/hand_evaluator.cpp
//  Évaluateur 5-7 cartes basé sur les bitboards : comptage des rangs,
//  masques par couleur, détection des quintes sur masque de rangs.
// ─────────────────────────────────────────────────────────────────────────────
#include "hand_evaluator.hpp"
#include "core/bitboard.hpp"
#include "core/cards.hpp"
#include <stdexcept>
#include <algorithm>
#include <array>
#include <vector>
#include <bit>

namespace hu_poker {

namespace {

constexpr RankMask ACE_BIT = static_cast<RankMask>(1u << (14 - 2));
constexpr RankMask WHEEL_MASK = static_cast<RankMask>(ACE_BIT | 0xF); // A,2,3,4,5

// Les n rangs les plus hauts du masque, en ordre décroissant
std::vector<int> top_ranks(RankMask mask, size_t n) {
    std::vector<int> out;
    for (int r = 14; r >= 2 && out.size() < n; --r) {
        if (mask & (1u << (r - 2))) out.push_back(r);
    }
    return out;
}

RankMask without(RankMask mask, int rank) {
    return static_cast<RankMask>(mask & ~(1u << (rank - 2)));
}

} // namespace

int straight_top(RankMask mask) {
    for (int top = 14; top >= 6; --top) {
        const RankMask run = static_cast<RankMask>(0x1Fu << (top - 6));
        if ((mask & run) == run) return top;
    }
    if ((mask & WHEEL_MASK) == WHEEL_MASK) return 5;
    return 0;
}

HandValue evaluate_hand(const std::vector<Card>& cards) {
    if (cards.size() < 5 || cards.size() > 7) {
        throw std::invalid_argument("evaluate_hand expects 5 to 7 cards, got " + std::to_string(cards.size()));
    }

    Bitboard board = EMPTY_BOARD;
    for (Card c : cards) {
        if (!is_valid_card(c) || test_card(board, c)) {
            throw std::invalid_argument("evaluate_hand: invalid or duplicate card " + to_string(c));
        }
        set_card(board, c);
    }

    std::array<int, 15> counts{};
    for (Card c : cards) counts[rank_value(c)]++;

    const RankMask all_ranks = rank_mask(board);

    // Couleur : au plus une couleur peut avoir 5 cartes sur 7
    RankMask flush_mask = 0;
    for (int s = 0; s < NUM_SUITS; ++s) {
        RankMask m = suit_rank_mask(board, static_cast<Suit>(s));
        if (std::popcount(static_cast<unsigned>(m)) >= 5) flush_mask = m;
    }

    HandValue v;

    if (flush_mask) {
        const int sf_top = straight_top(flush_mask);
        if (sf_top) {
            v.category = HandCategory::STRAIGHT_FLUSH;
            v.tiebreak = {sf_top};
            return v;
        }
    }

    std::vector<int> quads, trips, pairs; // ordre décroissant
    for (int r = 14; r >= 2; --r) {
        if (counts[r] == 4) quads.push_back(r);
        else if (counts[r] == 3) trips.push_back(r);
        else if (counts[r] == 2) pairs.push_back(r);
    }

    if (!quads.empty()) {
        const int q = quads.front();
        v.category = HandCategory::FOUR_OF_A_KIND;
        v.tiebreak = {q};
        const auto kicker = top_ranks(without(all_ranks, q), 1);
        v.tiebreak.insert(v.tiebreak.end(), kicker.begin(), kicker.end());
        return v;
    }

    if (!trips.empty() && (trips.size() >= 2 || !pairs.empty())) {
        const int t = trips[0];
        int p = pairs.empty() ? 0 : pairs[0];
        if (trips.size() >= 2) p = std::max(p, trips[1]);
        v.category = HandCategory::FULL_HOUSE;
        v.tiebreak = {t, p};
        return v;
    }

    if (flush_mask) {
        v.category = HandCategory::FLUSH;
        v.tiebreak = top_ranks(flush_mask, 5);
        return v;
    }

    const int st_top = straight_top(all_ranks);
    if (st_top) {
        v.category = HandCategory::STRAIGHT;
        v.tiebreak = {st_top};
        return v;
    }

    if (!trips.empty()) {
        const int t = trips[0];
        v.category = HandCategory::THREE_OF_A_KIND;
        v.tiebreak = {t};
        const auto kickers = top_ranks(without(all_ranks, t), 2);
        v.tiebreak.insert(v.tiebreak.end(), kickers.begin(), kickers.end());
        return v;
    }

    if (pairs.size() >= 2) {
        const int hi = pairs[0];
        const int lo = pairs[1];
        v.category = HandCategory::TWO_PAIR;
        v.tiebreak = {hi, lo};
        // Le kicker peut venir d'une troisième paire
        const auto kicker = top_ranks(without(without(all_ranks, hi), lo), 1);
        v.tiebreak.insert(v.tiebreak.end(), kicker.begin(), kicker.end());
        return v;
    }

    if (pairs.size() == 1) {
        const int p = pairs[0];
        v.category = HandCategory::ONE_PAIR;
        v.tiebreak = {p};
        const auto kickers = top_ranks(without(all_ranks, p), 3);
        v.tiebreak.insert(v.tiebreak.end(), kickers.begin(), kickers.end());
        return v;
    }

    v.category = HandCategory::HIGH_CARD;
    v.tiebreak = top_ranks(all_ranks, 5);
    return v;
}

HandValue evaluate_hand(const std::vector<Card>& hole_cards, const std::vector<Card>& board) {
    std::vector<Card> all(hole_cards);
    all.insert(all.end(), board.begin(), board.end());
    return evaluate_hand(all);
}

double HandValue::strength() const {
    const double base = static_cast<double>(category) / 8.0;
    const double kicker_bonus = tiebreak.empty() ? 0.0 : (tiebreak[0] - 2) / 12.0 * 0.1;
    return std::min(1.0, base + kicker_bonus);
}

std::string category_to_string(HandCategory category) {
    switch (category) {
        case HandCategory::HIGH_CARD:       return "High Card";
        case HandCategory::ONE_PAIR:        return "One Pair";
        case HandCategory::TWO_PAIR:        return "Two Pair";
        case HandCategory::THREE_OF_A_KIND: return "Three of a Kind";
        case HandCategory::STRAIGHT:        return "Straight";
        case HandCategory::FLUSH:           return "Flush";
        case HandCategory::FULL_HOUSE:      return "Full House";
        case HandCategory::FOUR_OF_A_KIND:  return "Four of a Kind";
        case HandCategory::STRAIGHT_FLUSH:  return "Straight Flush";
    }
    return "Unknown";
}

std::string HandValue::describe() const {
    auto name = [this](size_t i) {
        return i < tiebreak.size() ? rank_plural_name(static_cast<Rank>(tiebreak[i])) : std::string("?");
    };
    auto high = [this]() {
        return tiebreak.empty() ? std::string("?") : to_string(static_cast<Rank>(tiebreak[0]));
    };
    switch (category) {
        case HandCategory::STRAIGHT_FLUSH:
            if (!tiebreak.empty() && tiebreak[0] == 14) return "Royal flush";
            return high() + "-high straight flush";
        case HandCategory::FOUR_OF_A_KIND:  return "Four of a kind, " + name(0);
        case HandCategory::FULL_HOUSE:      return "Full house, " + name(0) + " full of " + name(1);
        case HandCategory::FLUSH:           return high() + "-high flush";
        case HandCategory::STRAIGHT:        return high() + "-high straight";
        case HandCategory::THREE_OF_A_KIND: return "Three of a kind, " + name(0);
        case HandCategory::TWO_PAIR:        return "Two pair, " + name(0) + " and " + name(1);
        case HandCategory::ONE_PAIR:        return "Pair of " + name(0);
        case HandCategory::HIGH_CARD:       return high() + " high";
    }
    return "Unknown";
}

} // namespace hu_poker
