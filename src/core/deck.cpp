#include "core/deck.hpp"
#include "core/bitboard.hpp"
#include <stdexcept>
#include <random>
#include <algorithm>
#include <numeric>
#include <string>
#include <utility>

namespace hu_poker {

Deck::Deck()
    : cards_(NUM_CARDS),
      next_card_index_(0)
{
    std::iota(cards_.begin(), cards_.end(), static_cast<Card>(0));
}

void Deck::reset() {
    std::iota(cards_.begin(), cards_.end(), static_cast<Card>(0));
    next_card_index_ = 0;
}

Card Deck::draw() {
    if (next_card_index_ >= cards_.size()) {
        throw std::runtime_error("Deck is empty, cannot draw card.");
    }
    return cards_[next_card_index_++];
}

std::vector<Card> Deck::draw_n(size_t n) {
    std::vector<Card> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.push_back(draw());
    }
    return out;
}

void Deck::shuffle(std::mt19937& rng) {
    // Remélanger TOUT le paquet, pas juste la partie non distribuée
    std::shuffle(cards_.begin(), cards_.end(), rng);
    next_card_index_ = 0;
}

void Deck::stack_for_testing(const std::vector<Card>& top_cards) {
    if (top_cards.size() > static_cast<size_t>(NUM_CARDS)) {
        throw std::invalid_argument("Stacked deck cannot hold more than " + std::to_string(NUM_CARDS) + " cards.");
    }
    Bitboard used = EMPTY_BOARD;
    std::vector<Card> stacked;
    stacked.reserve(NUM_CARDS);
    for (Card c : top_cards) {
        if (!is_valid_card(c) || test_card(used, c)) {
            throw std::invalid_argument("Invalid or duplicate card in stacked deck: " + to_string(c));
        }
        set_card(used, c);
        stacked.push_back(c);
    }
    for (Card c = 0; c < NUM_CARDS; ++c) {
        if (!test_card(used, c)) stacked.push_back(c);
    }
    cards_ = std::move(stacked);
    next_card_index_ = 0;
}

} // namespace hu_poker
