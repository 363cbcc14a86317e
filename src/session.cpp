#include "hu/session.h"
#include "hu/errors.h"
#include "hu/game_utils.hpp"
#include "spdlog/spdlog.h"
#include <random>
#include <stdexcept>
#include <utility>

namespace hu_poker {

namespace {

uint32_t resolve_seed(const Config& config) {
    validate_config(config);
    return config.seed ? *config.seed : std::random_device{}();
}

// Graines distinctes pour le mélange et pour le bot, dérivées de la graine de session
uint32_t derive_seed(uint32_t seed, uint32_t stream) {
    std::seed_seq seq{seed, stream};
    uint32_t out = 0;
    seq.generate(&out, &out + 1);
    return out;
}

} // namespace

Session::Session(const Config& config, PlayerStats lifetime_base)
    : config_(config),
      seed_(resolve_seed(config)),
      state_(config.starting_stack_bb, derive_seed(seed_, 0), HUMAN_SEAT),
      bot_(config.aggression, derive_seed(seed_, 1)),
      stats_(HUMAN_SEAT, lifetime_base),
      listener_()
{
    spdlog::info("Session: stack {} BB, agression {:.2f}, graine {}",
                 config_.starting_stack_bb, config_.aggression, seed_);
}

void Session::set_snapshot_listener(SnapshotListener listener) {
    listener_ = std::move(listener);
}

void Session::start_hand() {
    state_.start_new_hand();
    after_hand_start();
}

void Session::start_hand_with_deck(const std::vector<Card>& top_cards) {
    state_.start_new_hand_with_deck(top_cards);
    after_hand_start();
}

void Session::after_hand_start() {
    stats_.on_hand_start(state_.get_hand_start());
    // Main terminée dès les blinds (tapis forcés) : aucun événement d'action
    if (!state_.is_hand_in_progress() && state_.get_hand_result()) {
        stats_.on_hand_complete(*state_.get_hand_result());
    }
    publish();
    run_bot();
}

bool Session::is_human_turn() const {
    return state_.is_hand_in_progress() && state_.get_current_player() == HUMAN_SEAT;
}

ActionEvent Session::apply_human_action(Action action) {
    if (!is_human_turn()) {
        throw IllegalAction("Not the human seat's turn");
    }
    action.player_index = HUMAN_SEAT;
    const ActionEvent event = state_.apply_action(action);
    record_event(event);
    publish();
    run_bot();
    return event;
}

void Session::run_bot() {
    while (state_.is_hand_in_progress() && state_.get_current_player() == BOT_SEAT) {
        const Action action = bot_.decide(state_);
        const ActionEvent event = state_.apply_action(action);
        record_event(event);
        publish();
    }
}

void Session::record_event(const ActionEvent& event) {
    stats_.on_action(event);
    if (event.hand_over) {
        const auto& result = state_.get_hand_result();
        if (!result) throw std::logic_error("Hand over without a result");
        stats_.on_hand_complete(*result);
    }
}

void Session::end_session() {
    stats_.record_session_end();
    spdlog::info("Session terminée après {} mains", state_.get_hand_number());
}

void Session::publish() const {
    if (listener_) listener_(snapshot());
}

} // namespace hu_poker
