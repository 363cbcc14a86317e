#include <catch2/catch_test_macros.hpp>
#include <random>
#include <stdexcept>
#include <vector>
#include "core/deck.hpp"
#include "core/bitboard.hpp"
#include "core/cards.hpp"

using namespace hu_poker;

TEST_CASE("Deck draws every card once", "[deck]") {
    Deck deck;
    std::mt19937 rng(42);
    deck.shuffle(rng);
    REQUIRE(deck.remaining() == 52);

    Bitboard seen = EMPTY_BOARD;
    for (int i = 0; i < NUM_CARDS; ++i) {
        Card c = deck.draw();
        REQUIRE(is_valid_card(c));
        REQUIRE_FALSE(test_card(seen, c));
        set_card(seen, c);
    }
    REQUIRE(seen == FULL_DECK);
    REQUIRE(deck.remaining() == 0);
    REQUIRE_THROWS_AS(deck.draw(), std::runtime_error);
}

TEST_CASE("Deck shuffle is reproducible from the seed", "[deck]") {
    Deck a, b, c;
    std::mt19937 rng_a(7), rng_b(7), rng_c(8);
    a.shuffle(rng_a);
    b.shuffle(rng_b);
    c.shuffle(rng_c);

    std::vector<Card> from_a = a.draw_n(10);
    REQUIRE(from_a == b.draw_n(10));
    REQUIRE(from_a != c.draw_n(10));
}

TEST_CASE("Deck reset restores canonical order", "[deck]") {
    Deck deck;
    std::mt19937 rng(1);
    deck.shuffle(rng);
    deck.draw_n(5);
    deck.reset();
    REQUIRE(deck.remaining() == 52);
    REQUIRE(deck.draw() == 0);
    REQUIRE(deck.draw() == 1);
}

TEST_CASE("Stacked deck", "[deck]") {
    Deck deck;

    SECTION("Top cards come first, the rest follows without duplicates") {
        std::vector<Card> top = cards_from_string("As Kd 2c");
        deck.stack_for_testing(top);
        REQUIRE(deck.draw_n(3) == top);
        REQUIRE(deck.remaining() == 49);

        Bitboard seen = cards_to_board(top);
        while (deck.remaining() > 0) {
            Card c = deck.draw();
            REQUIRE_FALSE(test_card(seen, c));
            set_card(seen, c);
        }
        REQUIRE(seen == FULL_DECK);
    }

    SECTION("Duplicates and invalid cards are rejected") {
        REQUIRE_THROWS_AS(deck.stack_for_testing(cards_from_string("As As")), std::invalid_argument);
        REQUIRE_THROWS_AS(deck.stack_for_testing({INVALID_CARD}), std::invalid_argument);
    }

    SECTION("A rejected stack leaves the deck untouched") {
        std::mt19937 rng(3);
        deck.shuffle(rng);
        Deck copy = deck;
        REQUIRE_THROWS_AS(deck.stack_for_testing(cards_from_string("Kd 2c Kd")), std::invalid_argument);
        REQUIRE(deck.draw_n(52) == copy.draw_n(52));
    }
}
