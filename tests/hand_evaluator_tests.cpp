#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <random>
#include <stdexcept>
#include <vector>
#include "eval/hand_evaluator.hpp"
#include "core/cards.hpp"

using namespace hu_poker;

namespace {

HandValue eval(const char* cards) {
    return evaluate_hand(cards_from_string(cards));
}

} // namespace

TEST_CASE("Evaluator categories", "[evaluator]") {
    REQUIRE(eval("Ah Kh Qh Jh Th 2c 3d").category == HandCategory::STRAIGHT_FLUSH);
    REQUIRE(eval("9s 9h 9d 9c Ah 2c 3d").category == HandCategory::FOUR_OF_A_KIND);
    REQUIRE(eval("Ah As Ad Kc Ks 2d 3h").category == HandCategory::FULL_HOUSE);
    REQUIRE(eval("Ah 9h 7h 4h 2h Kc Qd").category == HandCategory::FLUSH);
    REQUIRE(eval("9c 8d 7h 6s 5c Ad Kd").category == HandCategory::STRAIGHT);
    REQUIRE(eval("7c 7d 7h Ks 2c 9d 4s").category == HandCategory::THREE_OF_A_KIND);
    REQUIRE(eval("Kc Kd 4h 4s 2c 9d 7s").category == HandCategory::TWO_PAIR);
    REQUIRE(eval("Jc Jd 4h 8s 2c 9d As").category == HandCategory::ONE_PAIR);
    REQUIRE(eval("Ac Jd 4h 8s 2c 9d 6s").category == HandCategory::HIGH_CARD);

    REQUIRE(category_to_string(HandCategory::FULL_HOUSE) == "Full House");
    REQUIRE(category_to_string(HandCategory::HIGH_CARD) == "High Card");
}

TEST_CASE("Full house beats two pair and flush", "[evaluator]") {
    HandValue full = eval("Ah As Ad Kc Ks 2d 3h");
    REQUIRE(full.tiebreak == std::vector<int>{14, 13});
    REQUIRE(full.describe() == "Full house, aces full of kings");

    HandValue two_pair = eval("Ah As Kc Ks Qd 2d 3h");
    HandValue flush = eval("Ah 9h 7h 4h 2h Kc Qd");
    REQUIRE(two_pair.category == HandCategory::TWO_PAIR);
    REQUIRE(flush.category == HandCategory::FLUSH);
    REQUIRE(full > two_pair);
    REQUIRE(full > flush);
    REQUIRE(flush > two_pair);
}

TEST_CASE("Wheel is a five-high straight", "[evaluator]") {
    HandValue wheel = eval("Ah 2c 3d 4s 5h Kd 9c");
    REQUIRE(wheel.category == HandCategory::STRAIGHT);
    REQUIRE(wheel.tiebreak == std::vector<int>{5});
    REQUIRE(wheel.describe() == "5-high straight");

    HandValue six_high = eval("6h 2c 3d 4s 5h Kd 9c");
    REQUIRE(six_high > wheel);

    HandValue steel_wheel = eval("Ah 2h 3h 4h 5h Kd 9c");
    REQUIRE(steel_wheel.category == HandCategory::STRAIGHT_FLUSH);
    REQUIRE(steel_wheel.tiebreak == std::vector<int>{5});
}

TEST_CASE("Royal flush beats four of a kind", "[evaluator]") {
    HandValue royal = eval("As Ks Qs Js Ts 2c 3d");
    HandValue quads = eval("Ac Ad Ah As Kd 2c 3d");
    REQUIRE(royal.describe() == "Royal flush");
    REQUIRE(royal > quads);
}

TEST_CASE("Kickers and ties", "[evaluator]") {
    SECTION("Third pair can only serve as kicker") {
        HandValue v = eval("Kc Kd 8h 8s 6c 6d 2s");
        REQUIRE(v.category == HandCategory::TWO_PAIR);
        REQUIRE(v.tiebreak == std::vector<int>{13, 8, 6});
    }

    SECTION("Two sets make a full house with the lower set as pair") {
        HandValue v = eval("Qc Qd Qh 5s 5c 5d 2s");
        REQUIRE(v.category == HandCategory::FULL_HOUSE);
        REQUIRE(v.tiebreak == std::vector<int>{12, 5});
    }

    SECTION("Kicker decides between equal pairs") {
        HandValue board_ace = evaluate_hand(cards_from_string("Ad 9h"), cards_from_string("Jc Js 7d 4c 2h"));
        HandValue board_king = evaluate_hand(cards_from_string("Kd 9s"), cards_from_string("Jc Js 7d 4c 2h"));
        REQUIRE(board_ace > board_king);
    }

    SECTION("Board plays for both hands") {
        std::vector<Card> board = cards_from_string("As Ks Qd Jc Th");
        HandValue a = evaluate_hand(cards_from_string("2c 3d"), board);
        HandValue b = evaluate_hand(cards_from_string("4h 5h"), board);
        REQUIRE(a == b);
        REQUIRE_FALSE(a < b);
        REQUIRE_FALSE(b < a);
    }
}

TEST_CASE("Evaluation ignores card order", "[evaluator]") {
    std::vector<Card> cards = cards_from_string("Ah As Ad Kc Ks 2d 3h");
    const HandValue expected = evaluate_hand(cards);
    std::mt19937 rng(11);
    for (int i = 0; i < 50; ++i) {
        std::shuffle(cards.begin(), cards.end(), rng);
        REQUIRE(evaluate_hand(cards) == expected);
    }
}

TEST_CASE("Evaluator input validation", "[evaluator]") {
    REQUIRE_THROWS_AS(evaluate_hand(cards_from_string("Ah Kh Qh Jh")), std::invalid_argument);
    REQUIRE_THROWS_AS(evaluate_hand(cards_from_string("Ah Kh Qh Jh Th 9h 8h 7h")), std::invalid_argument);
    REQUIRE_THROWS_AS(evaluate_hand(cards_from_string("Ah Ah Qh Jh Th")), std::invalid_argument);
    REQUIRE_NOTHROW(evaluate_hand(cards_from_string("Ah Kh Qh Jh Th")));
}

TEST_CASE("Strength is monotonic across categories", "[evaluator]") {
    const double high = eval("Ac Jd 4h 8s 2c 9d 6s").strength();
    const double pair = eval("Jc Jd 4h 8s 2c 9d As").strength();
    const double trips = eval("7c 7d 7h Ks 2c 9d 4s").strength();
    const double royal = eval("As Ks Qs Js Ts 2c 3d").strength();
    REQUIRE(high < pair);
    REQUIRE(pair < trips);
    REQUIRE(royal <= 1.0);
    REQUIRE(high >= 0.0);
}
