#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>
#include "hu/session.h"
#include "hu/errors.h"
#include "core/cards.hpp"

using namespace hu_poker;

namespace {

Config seeded_config(uint32_t seed, double aggression = 0.5) {
    Config config;
    config.starting_stack_bb = 100;
    config.aggression = aggression;
    config.seed = seed;
    return config;
}

// Check si possible, sinon call
Action passive_action(const Session& session) {
    const LegalActions legal = session.get_state().get_legal_actions();
    return Action{Session::HUMAN_SEAT, legal.can_check ? ActionType::CHECK : ActionType::CALL, 0};
}

} // namespace

TEST_CASE("Session starts with the human on the button", "[session]") {
    Session session(seeded_config(42));
    REQUIRE(session.get_config().seed.value() == 42u);
    int published = 0;
    session.set_snapshot_listener([&](const TableSnapshot&) { ++published; });

    session.start_hand();
    REQUIRE(session.is_hand_in_progress());
    REQUIRE(session.is_human_turn());
    REQUIRE(session.get_state().get_button_seat() == Session::HUMAN_SEAT);
    REQUIRE(published == 1);

    const TableSnapshot snap = session.snapshot();
    REQUIRE(snap.seats[Session::HUMAN_SEAT].hole_cards.size() == 2);
    REQUIRE(snap.seats[Session::BOT_SEAT].hole_cards.empty());
    REQUIRE(snap.legal.player_index == Session::HUMAN_SEAT);

    session.apply_human_action(Action{Session::HUMAN_SEAT, ActionType::FOLD, 0});
    REQUIRE_FALSE(session.is_hand_in_progress());
    REQUIRE(published == 2);
    REQUIRE(session.get_stats().get_session_stats(Session::HUMAN_SEAT).hands_played == 1);
    REQUIRE(session.get_stats().get_session_stats(Session::HUMAN_SEAT).net_chips == -1);
}

TEST_CASE("Bot acts until the human is to act", "[session]") {
    Session session(seeded_config(7));
    session.start_hand();
    session.apply_human_action(Action{Session::HUMAN_SEAT, ActionType::FOLD, 0});

    // Main 2 : le bot est au bouton et parle en premier
    session.start_hand();
    REQUIRE(session.get_state().get_button_seat() == Session::BOT_SEAT);
    REQUIRE((!session.is_hand_in_progress() || session.is_human_turn()));
    if (session.is_hand_in_progress()) {
        const auto& history = session.get_state().get_action_history();
        REQUIRE_FALSE(history.empty());
        REQUIRE(history.front().action.player_index == Session::BOT_SEAT);
    }
}

TEST_CASE("Human actions are validated", "[session]") {
    Session session(seeded_config(11));

    REQUIRE_THROWS_AS(session.apply_human_action(Action{Session::HUMAN_SEAT, ActionType::CHECK, 0}), IllegalAction);

    session.start_hand();
    const int pot = session.get_state().get_pot_size();
    REQUIRE_THROWS_AS(session.apply_human_action(Action{Session::HUMAN_SEAT, ActionType::CHECK, 0}), IllegalAction);
    REQUIRE_THROWS_AS(session.apply_human_action(Action{Session::HUMAN_SEAT, ActionType::RAISE, 3}), IllegalAction);
    REQUIRE(session.get_state().get_pot_size() == pot);
    REQUIRE(session.is_human_turn());
    REQUIRE(session.get_state().get_action_history().empty());

    // Le siège indiqué par l'appelant est ignoré : l'humain joue toujours le siège 0
    const ActionEvent ev = session.apply_human_action(Action{Session::BOT_SEAT, ActionType::CALL, 0});
    REQUIRE(ev.action.player_index == Session::HUMAN_SEAT);
}

TEST_CASE("Same seed gives the same session", "[session]") {
    Session a(seeded_config(1234));
    Session b(seeded_config(1234));
    Session c(seeded_config(4321));
    REQUIRE(a.get_seed() == 1234);

    a.start_hand();
    b.start_hand();
    c.start_hand();
    const auto& hand_a = a.get_state().get_player_hand(Session::HUMAN_SEAT);
    REQUIRE(hand_a == b.get_state().get_player_hand(Session::HUMAN_SEAT));
    REQUIRE(a.get_state().get_player_hand(Session::BOT_SEAT) == b.get_state().get_player_hand(Session::BOT_SEAT));

    // Deux graines différentes : au moins une carte diffère sur les quatre
    std::vector<Card> dealt_a = hand_a;
    std::vector<Card> dealt_c = c.get_state().get_player_hand(Session::HUMAN_SEAT);
    for (Card card : a.get_state().get_player_hand(Session::BOT_SEAT)) dealt_a.push_back(card);
    for (Card card : c.get_state().get_player_hand(Session::BOT_SEAT)) dealt_c.push_back(card);
    REQUIRE(dealt_a != dealt_c);
}

TEST_CASE("Invalid configuration is rejected", "[session]") {
    Config config = seeded_config(1);
    config.starting_stack_bb = 0;
    REQUIRE_THROWS_AS(Session(config), ConfigError);

    config = seeded_config(1, 2.0);
    REQUIRE_THROWS_AS(Session(config), ConfigError);
}

TEST_CASE("Stacked deck through the session", "[session]") {
    Session session(seeded_config(3, 0.0));
    // Humain au bouton avec AA, bot en big blind avec 72o
    session.start_hand_with_deck(cards_from_string("7c As 2d Ah Kd Qc 4s 9h 3c"));
    REQUIRE(session.get_state().get_player_hand(Session::HUMAN_SEAT) == cards_from_string("As Ah"));

    // Limp : le bot checke son option avec une main faible
    session.apply_human_action(Action{Session::HUMAN_SEAT, ActionType::CALL, 0});
    REQUIRE(session.get_state().get_current_street() == Street::FLOP);
    REQUIRE(session.get_state().get_action_history().back().action.player_index == Session::BOT_SEAT);
}

TEST_CASE("Passive human plays a full session", "[session][invariants]") {
    Session session(seeded_config(2024, 1.0));
    int hands = 0;
    while (!session.is_session_over() && hands < 150) {
        session.start_hand();
        ++hands;
        int guard = 0;
        while (session.is_human_turn()) {
            REQUIRE(++guard < 100);
            session.apply_human_action(passive_action(session));
        }
        REQUIRE_FALSE(session.is_hand_in_progress());
    }
    session.end_session();

    const auto& state = session.get_state();
    REQUIRE(state.get_player_stack(0) + state.get_player_stack(1) == 400);

    const StatsSnapshot stats = session.get_stats().snapshot();
    REQUIRE(stats.session[0].hands_played == static_cast<uint64_t>(hands));
    REQUIRE(stats.session[1].hands_played == static_cast<uint64_t>(hands));
    REQUIRE(stats.session[0].net_chips == state.get_player_stack(0) - 200);
    REQUIRE(stats.session[0].pfr_hands == 0);
    REQUIRE(stats.lifetime.sessions == 1);
    REQUIRE(stats.lifetime.hands_played == static_cast<uint64_t>(hands));
}
