#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <stdexcept>
#include <string>
#include <vector>
#include "hu/bot_engine.h"
#include "hu/game_state.h"
#include "core/cards.hpp"

using namespace hu_poker;

namespace {

// Ordre de distribution : BB, BTN, BB, BTN puis flop, turn, river
std::vector<Card> stacked_deck(const std::string& bb_hole, const std::string& btn_hole, const std::string& board) {
    const std::vector<Card> bb = cards_from_string(bb_hole);
    const std::vector<Card> btn = cards_from_string(btn_hole);
    std::vector<Card> deck = {bb[0], btn[0], bb[1], btn[1]};
    for (Card c : cards_from_string(board)) deck.push_back(c);
    return deck;
}

void act(GameState& state, ActionType type, int amount = 0) {
    state.apply_action(Action{state.get_current_player(), type, amount});
}

// BTN (siège 0) relance à 20, la BB suit : pot de 40 au flop
void raise_and_call(GameState& state) {
    act(state, ActionType::RAISE, 20);
    act(state, ActionType::CALL);
}

} // namespace

TEST_CASE("Bot profile and construction", "[bot]") {
    REQUIRE(BotEngine(1.5, 1).get_aggression() == 1.0);
    REQUIRE(BotEngine(-0.5, 1).get_aggression() == 0.0);

    const BotProfile passive = BotEngine::blend_profile(0.0);
    const BotProfile aggressive = BotEngine::blend_profile(1.0);
    const BotProfile middle = BotEngine::blend_profile(0.5);

    REQUIRE(passive.bluff_freq == 0.0);
    REQUIRE(aggressive.bluff_freq > passive.bluff_freq);
    REQUIRE(aggressive.open_raise < passive.open_raise);
    REQUIRE(aggressive.cbet_freq > passive.cbet_freq);
    REQUIRE(middle.value_bet == Catch::Approx((passive.value_bet + aggressive.value_bet) / 2));
    REQUIRE(BotEngine(0.0, 1).get_profile().open_raise == Catch::Approx(passive.open_raise));
}

TEST_CASE("Bot refuses to act without a pending decision", "[bot]") {
    GameState state(100, 1, 0);
    BotEngine bot(0.5, 1);
    REQUIRE_THROWS_AS(bot.decide(state), std::logic_error);

    state.start_new_hand();
    act(state, ActionType::FOLD);
    REQUIRE_THROWS_AS(bot.decide(state), std::logic_error);
}

TEST_CASE("Bot actions are always legal", "[bot][invariants]") {
    for (double aggression : {0.0, 0.5, 1.0}) {
        for (uint32_t seed = 1; seed <= 10; ++seed) {
            GameState state(50, seed, 0);
            BotEngine bot0(aggression, seed * 2);
            BotEngine bot1(aggression, seed * 2 + 1);

            for (int hand = 0; hand < 40 && !state.is_session_over(); ++hand) {
                state.start_new_hand();
                int guard = 0;
                while (state.is_hand_in_progress()) {
                    REQUIRE(++guard < 100);
                    const LegalActions legal = state.get_legal_actions();
                    BotEngine& bot = legal.player_index == 0 ? bot0 : bot1;
                    const Action action = bot.decide(state);
                    INFO("aggression " << aggression << ", seed " << seed << ", hand " << hand);
                    REQUIRE(legal.contains(action));
                    state.apply_action(action);
                }
            }
            REQUIRE(state.get_player_stack(0) + state.get_player_stack(1) == 200);
        }
    }
}

TEST_CASE("Bot preflop decisions", "[bot][preflop]") {
    SECTION("Aces open-raise from the button") {
        for (uint32_t seed = 1; seed <= 20; ++seed) {
            GameState state(100, seed, 0);
            state.start_new_hand_with_deck(stacked_deck("7c 2d", "As Ah", "Kd Qc 4s 9h 3c"));
            BotEngine bot(0.5, seed);
            const Action action = bot.decide(state);
            REQUIRE(action.player_index == 0);
            REQUIRE(action.type == ActionType::RAISE);
            REQUIRE(action.amount >= 4);
        }
    }

    SECTION("Trash checks its big blind option") {
        for (uint32_t seed = 1; seed <= 20; ++seed) {
            GameState state(100, seed, 0);
            state.start_new_hand_with_deck(stacked_deck("7c 2d", "As Ah", "Kd Qc 4s 9h 3c"));
            act(state, ActionType::CALL);
            BotEngine bot(0.5, seed);
            const Action action = bot.decide(state);
            REQUIRE(action.player_index == 1);
            REQUIRE(action.type == ActionType::CHECK);
        }
    }

    SECTION("Aces never fold to a raise") {
        for (uint32_t seed = 1; seed <= 20; ++seed) {
            GameState state(100, seed, 0);
            state.start_new_hand_with_deck(stacked_deck("As Ah", "7c 2d", "Kd Qc 4s 9h 3c"));
            act(state, ActionType::RAISE, 6);
            BotEngine bot(0.0, seed);
            REQUIRE(bot.decide(state).type != ActionType::FOLD);
        }
    }
}

TEST_CASE("Bot facing a turn bet", "[bot][postflop]") {
    const std::string board = "Kd Qc 4s 9h 3c";

    SECTION("Air out of position folds") {
        for (uint32_t seed = 1; seed <= 30; ++seed) {
            GameState state(100, seed, 0);
            state.start_new_hand_with_deck(stacked_deck("7s 2h", "Ac Ad", board));
            raise_and_call(state);
            act(state, ActionType::CHECK); // flop BB
            act(state, ActionType::CHECK); // flop BTN
            act(state, ActionType::CHECK); // turn BB
            act(state, ActionType::BET, 10);

            BotEngine bot(0.5, seed);
            const Action action = bot.decide(state);
            REQUIRE(action.player_index == 1);
            REQUIRE(action.type == ActionType::FOLD);
        }
    }

    SECTION("Trips never fold") {
        for (uint32_t seed = 1; seed <= 30; ++seed) {
            GameState state(100, seed, 0);
            state.start_new_hand_with_deck(stacked_deck("9c 9d", "Ac Ad", board));
            raise_and_call(state);
            act(state, ActionType::CHECK);
            act(state, ActionType::CHECK);
            act(state, ActionType::CHECK);
            act(state, ActionType::BET, 10);

            BotEngine bot(0.5, seed);
            REQUIRE(bot.decide(state).type != ActionType::FOLD);
        }
    }

    SECTION("Top pair in position never folds") {
        for (uint32_t seed = 1; seed <= 30; ++seed) {
            GameState state(100, seed, 0);
            state.start_new_hand_with_deck(stacked_deck("Ac Ad", "Kh Jc", board));
            raise_and_call(state);
            act(state, ActionType::CHECK);
            act(state, ActionType::CHECK);
            act(state, ActionType::BET, 10); // turn BB

            BotEngine bot(0.5, seed);
            const Action action = bot.decide(state);
            REQUIRE(action.player_index == 0);
            REQUIRE(action.type != ActionType::FOLD);
        }
    }
}

TEST_CASE("Flush draw on the flop does not fold", "[bot][postflop][draws]") {
    for (uint32_t seed = 1; seed <= 30; ++seed) {
        GameState state(100, seed, 0);
        state.start_new_hand_with_deck(stacked_deck("8h 9h", "Ac Ad", "2h Ks 5h Tc 3d"));
        raise_and_call(state);
        act(state, ActionType::CHECK);   // flop BB
        act(state, ActionType::BET, 10); // flop BTN

        BotEngine bot(0.5, seed);
        const Action action = bot.decide(state);
        REQUIRE(action.player_index == 1);
        REQUIRE(action.type != ActionType::FOLD);
    }
}

TEST_CASE("Turn flush draw folds more often to bigger bets", "[bot][postflop][draws]") {
    // Pot limpé de 4, la BB a 9 outs au turn (18 %)
    auto folds_against = [](double aggression, int bet) {
        int folds = 0;
        for (uint32_t seed = 1; seed <= 40; ++seed) {
            GameState state(100, seed, 0);
            state.start_new_hand_with_deck(stacked_deck("Jh 4h", "Ac Ad", "9h 8h 3c 2d Ks"));
            act(state, ActionType::CALL);  // BTN complète
            act(state, ActionType::CHECK); // option BB
            act(state, ActionType::CHECK); // flop BB
            act(state, ActionType::CHECK); // flop BTN
            act(state, ActionType::CHECK); // turn BB
            act(state, ActionType::BET, bet);
            REQUIRE(state.get_pot_size() == 4 + bet);

            BotEngine bot(aggression, seed);
            const Action action = bot.decide(state);
            REQUIRE(action.player_index == 1);
            if (action.type == ActionType::FOLD) ++folds;
        }
        return folds;
    };

    for (double aggression : {0.5, 1.0}) {
        INFO("aggression " << aggression);
        // Cote de 25 % : le tirage suit toujours
        const int small_folds = folds_against(aggression, 2);
        // Cote de 44 % : le tirage abandonne sauf semi-bluff
        const int big_folds = folds_against(aggression, 16);
        REQUIRE(small_folds == 0);
        REQUIRE(big_folds > 20);
        REQUIRE(big_folds > small_folds);
    }
}

TEST_CASE("Bot bets its strong hands", "[bot][postflop]") {
    for (uint32_t seed = 1; seed <= 20; ++seed) {
        GameState state(100, seed, 0);
        // Brelan de rois pour la BB, premier à parler au flop
        state.start_new_hand_with_deck(stacked_deck("Kh Ks", "7c 2d", "Kd Qc 4s 9h 3c"));
        raise_and_call(state);

        BotEngine bot(0.5, seed);
        const Action action = bot.decide(state);
        REQUIRE(action.player_index == 1);
        REQUIRE(action.type == ActionType::BET);
        REQUIRE(action.amount >= BB_SIZE);
        REQUIRE(action.amount <= state.get_player_stack(1));
    }
}
