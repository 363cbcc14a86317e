#ifndef HU_CORE_DECK_HPP
#define HU_CORE_DECK_HPP

#include "core/cards.hpp"
#include <vector>
#include <random>
#include <cstddef>

namespace hu_poker {

// Paquet de 52 cartes avec curseur. Le mélange utilise le générateur
// fourni par l'appelant (pas d'état aléatoire global).
class Deck {
public:
    Deck();
    ~Deck() = default;

    Card draw();
    std::vector<Card> draw_n(size_t n);
    void shuffle(std::mt19937& rng);
    void reset();

    size_t remaining() const { return cards_.size() - next_card_index_; }

    // Place les cartes données sur le dessus du paquet, le reste suit dans
    // l'ordre canonique. Pour les scénarios de test déterministes.
    void stack_for_testing(const std::vector<Card>& top_cards);

private:
    std::vector<Card> cards_;
    size_t            next_card_index_;
};

} // namespace hu_poker

#endif // HU_CORE_DECK_HPP
