#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/cards.hpp"

using namespace hu_poker;

TEST_CASE("Card Creation and Properties", "[cards]") {
    Card ac = make_card(Rank::ACE, Suit::CLUBS);
    Card kd = make_card(Rank::KING, Suit::DIAMONDS);
    Card _2s = make_card(Rank::TWO, Suit::SPADES);

    SECTION("Index layout is suit * 13 + rank - 2") {
        REQUIRE(make_card(Rank::TWO, Suit::CLUBS) == 0);
        REQUIRE(ac == 12);
        REQUIRE(make_card(Rank::TWO, Suit::DIAMONDS) == 13);
        REQUIRE(make_card(Rank::ACE, Suit::SPADES) == 51);
    }

    SECTION("Card ranks and suits are correct") {
        REQUIRE(get_rank(ac) == Rank::ACE);
        REQUIRE(get_suit(ac) == Suit::CLUBS);
        REQUIRE(get_rank(kd) == Rank::KING);
        REQUIRE(get_suit(kd) == Suit::DIAMONDS);
        REQUIRE(get_rank(_2s) == Rank::TWO);
        REQUIRE(get_suit(_2s) == Suit::SPADES);
        REQUIRE(rank_value(ac) == 14);
        REQUIRE(rank_value(_2s) == 2);
    }

    SECTION("Validity") {
        REQUIRE(is_valid_card(0));
        REQUIRE(is_valid_card(51));
        REQUIRE_FALSE(is_valid_card(INVALID_CARD));
    }
}

TEST_CASE("Card String Conversions", "[cards][string]") {
    SECTION("to_string conversions") {
        REQUIRE(to_string(make_card(Rank::ACE, Suit::SPADES)) == "As");
        REQUIRE(to_string(make_card(Rank::TEN, Suit::DIAMONDS)) == "Td");
        REQUIRE(to_string(make_card(Rank::TWO, Suit::CLUBS)) == "2c");
        REQUIRE(to_string(INVALID_CARD) == "??");
    }

    SECTION("card_from_string conversions") {
        REQUIRE(card_from_string("As") == make_card(Rank::ACE, Suit::SPADES));
        REQUIRE(card_from_string("Td") == make_card(Rank::TEN, Suit::DIAMONDS));
        REQUIRE(card_from_string("2c") == make_card(Rank::TWO, Suit::CLUBS));
        // casse tolérée
        REQUIRE(card_from_string("as") == make_card(Rank::ACE, Suit::SPADES));
        REQUIRE(card_from_string("tH") == make_card(Rank::TEN, Suit::HEARTS));
    }

    SECTION("card_from_string invalid inputs") {
        REQUIRE_THROWS_AS(card_from_string("XX"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string("A"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string("1c"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string("Tsx"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string(""), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string(" Td "), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string("Ax"), std::invalid_argument);
    }

    SECTION("cards_from_string splits on whitespace") {
        std::vector<Card> cards = cards_from_string("As Kd  2c");
        REQUIRE(cards.size() == 3);
        REQUIRE(cards[0] == card_from_string("As"));
        REQUIRE(cards[1] == card_from_string("Kd"));
        REQUIRE(cards[2] == card_from_string("2c"));
        REQUIRE(cards_from_string("").empty());
        REQUIRE_THROWS_AS(cards_from_string("As Zz"), std::invalid_argument);
    }

    SECTION("Every card round-trips through its name") {
        for (Card c = 0; c < INVALID_CARD; ++c) {
            REQUIRE(card_from_string(to_string(c)) == c);
        }
    }
}

TEST_CASE("Rank names", "[cards][string]") {
    REQUIRE(rank_plural_name(Rank::ACE) == "aces");
    REQUIRE(rank_plural_name(Rank::SIX) == "sixes");
    REQUIRE(rank_plural_name(Rank::TWO) == "twos");
    REQUIRE(to_string(Rank::TEN) == "T");
    REQUIRE(to_string(Suit::HEARTS) == "h");
}
