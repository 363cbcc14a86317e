#include <catch2/catch_test_macros.hpp>
#include <catch2/benchmark/catch_benchmark.hpp>
#include "eval/hand_evaluator.hpp"
#include "bot/draws.hpp"
#include "core/cards.hpp"
#include "core/bitboard.hpp"
#include <vector>
#include <random>
#include <algorithm>
#include <numeric>

using namespace hu_poker;

namespace {
    std::vector<Card> get_local_standard_deck() {
        std::vector<Card> deck(NUM_CARDS);
        std::iota(deck.begin(), deck.end(), static_cast<Card>(0));
        return deck;
    }

    // n mains de 7 cartes tirées d'un paquet mélangé
    std::vector<std::vector<Card>> random_hands(size_t n, size_t cards_per_hand, uint32_t seed) {
        std::vector<Card> deck = get_local_standard_deck();
        std::mt19937 rng(seed);
        std::vector<std::vector<Card>> hands;
        hands.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            std::shuffle(deck.begin(), deck.end(), rng);
            hands.emplace_back(deck.begin(), deck.begin() + static_cast<std::ptrdiff_t>(cards_per_hand));
        }
        return hands;
    }
} // namespace anonyme

TEST_CASE("Evaluate Performance", "[evaluator][!benchmark]") {
    const auto hands = random_hands(10000, 7, 12345);

    BENCHMARK("Evaluate 10k Hands (7 Cards)") {
        int category_sum = 0;
        for (const auto& hand : hands) {
            category_sum += static_cast<int>(evaluate_hand(hand).category);
        }
        return category_sum;
    };

    BENCHMARK("Showdown 10k Hands (2 + 2 + 5 Cards)") {
        int p0_wins = 0;
        for (const auto& hand : hands) {
            const std::vector<Card> board(hand.begin() + 2, hand.end());
            const std::vector<Card> p0(hand.begin(), hand.begin() + 2);
            // Contre la main du board seul
            if (evaluate_hand(p0, board) > evaluate_hand(board)) ++p0_wins;
        }
        return p0_wins;
    };
}

TEST_CASE("Draw Detection Performance", "[draws][!benchmark]") {
    const auto hands = random_hands(10000, 5, 54321);

    BENCHMARK("Detect draws 10k flops") {
        int outs = 0;
        for (const auto& hand : hands) {
            const std::vector<Card> hole(hand.begin(), hand.begin() + 2);
            const std::vector<Card> board(hand.begin() + 2, hand.end());
            outs += detect_draws(hole, board).outs();
        }
        return outs;
    };
}
