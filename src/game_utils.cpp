#include "hu/game_utils.hpp"
#include "hu/errors.h"
#include <sstream>
#include <cmath>
#include "core/cards.hpp" // Pour to_string(Card)

namespace hu_poker {

namespace {
constexpr int MAX_STARTING_STACK_BB = 1'000'000;
}

std::string street_to_string(Street s) {
    switch (s) {
        case Street::PREFLOP:  return "Preflop";
        case Street::FLOP:     return "Flop";
        case Street::TURN:     return "Turn";
        case Street::RIVER:    return "River";
        case Street::SHOWDOWN: return "Showdown";
    }
    return "UnknownStreet";
}

std::string action_type_to_string(ActionType type) {
    switch (type) {
        case ActionType::FOLD:  return "FOLD";
        case ActionType::CHECK: return "CHECK";
        case ActionType::CALL:  return "CALL";
        case ActionType::BET:   return "BET";
        case ActionType::RAISE: return "RAISE";
    }
    return "UNKNOWN_ACTION_TYPE";
}

std::string vec_to_string(const std::vector<Card>& cards) {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < cards.size(); ++i) {
        ss << (cards[i] == INVALID_CARD ? "--" : to_string(cards[i]));
        if (i < cards.size() - 1) {
            ss << " ";
        }
    }
    ss << "]";
    return ss.str();
}

std::string action_to_string(const Action& action) {
    const std::string type_str = action_type_to_string(action.type);
    // FOLD / CHECK : montant non pertinent
    if (action.type == ActionType::FOLD || action.type == ActionType::CHECK) {
        return type_str;
    }
    return type_str + " " + std::to_string(action.amount);
}

std::string legal_actions_to_string(const LegalActions& legal) {
    if (legal.empty()) return "none";
    std::stringstream ss;
    const char* sep = "";
    if (legal.can_fold)  { ss << sep << "fold"; sep = " | "; }
    if (legal.can_check) { ss << sep << "check"; sep = " | "; }
    if (legal.can_call)  {
        ss << sep << "call " << legal.to_call << (legal.call_is_all_in ? " (all-in)" : "");
        sep = " | ";
    }
    if (legal.can_bet)   { ss << sep << "bet " << legal.min_to << ".." << legal.max_to; sep = " | "; }
    if (legal.can_raise) { ss << sep << "raise " << legal.min_to << ".." << legal.max_to; }
    return ss.str();
}

std::string hand_history_to_string(const std::vector<ActionEvent>& history) {
    std::stringstream ss;
    for (size_t i = 0; i < history.size(); ++i) {
        const ActionEvent& ev = history[i];
        ss << street_to_string(ev.street) << ": P" << ev.action.player_index << " "
           << action_to_string(ev.action) << (ev.all_in ? " (all-in)" : "");
        if (i < history.size() - 1) ss << ", ";
    }
    return ss.str();
}

// -----------------------------------------------------------------------------
//  LegalActions
// -----------------------------------------------------------------------------
bool LegalActions::contains(const Action& action) const {
    if (action.player_index != player_index) return false;
    switch (action.type) {
        case ActionType::FOLD:  return can_fold;
        case ActionType::CHECK: return can_check;
        case ActionType::CALL:  return can_call; // montant fixé par le moteur
        case ActionType::BET:
            return can_bet && action.amount >= min_to && action.amount <= max_to;
        case ActionType::RAISE:
            return can_raise && action.amount >= min_to && action.amount <= max_to;
    }
    return false;
}

// -----------------------------------------------------------------------------
//  Config
// -----------------------------------------------------------------------------
void validate_config(const Config& config) {
    if (config.starting_stack_bb <= 0) {
        throw ConfigError("Starting stack must be a positive number of big blinds (got "
                          + std::to_string(config.starting_stack_bb) + ")");
    }
    if (config.starting_stack_bb > MAX_STARTING_STACK_BB) {
        throw ConfigError("Starting stack too large (max " + std::to_string(MAX_STARTING_STACK_BB) + " big blinds)");
    }
    if (std::isnan(config.aggression) || config.aggression < 0.0 || config.aggression > 1.0) {
        throw ConfigError("Aggression must be within [0, 1] (got " + std::to_string(config.aggression) + ")");
    }
}

} // namespace hu_poker
