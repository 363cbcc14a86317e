#include "hu/bot_engine.h"
#include "hu/game_utils.hpp"
#include "bot/preflop_table.hpp"
#include "bot/draws.hpp"
#include "eval/hand_evaluator.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace hu_poker {

namespace {

constexpr BotProfile PASSIVE_PROFILE = {
    0.62, 0.40, 0.75, 0.86, 0.60, 2.5, 3.0,
    0.50, 0.30, 0.42, 0.15, 0.45, 0.00,
    0.25, 0.50, 0.75
};

constexpr BotProfile AGGRESSIVE_PROFILE = {
    0.42, 0.33, 0.55, 0.72, 0.48, 3.0, 3.5,
    0.40, 0.20, 0.32, 0.11, 0.85, 0.25,
    0.35, 0.70, 1.00
};

double lerp(double a, double b, double t) {
    return a + (b - a) * t;
}

} // namespace

// -----------------------------------------------------------------------------
//  Construction / profil
// -----------------------------------------------------------------------------
BotEngine::BotEngine(double aggression, uint32_t seed)
    : aggression_(std::clamp(aggression, 0.0, 1.0)),
      profile_(blend_profile(aggression_)),
      rng_(seed)
{
    spdlog::debug("BotEngine: agression {:.2f}, graine {}", aggression_, seed);
}

BotProfile BotEngine::blend_profile(double aggression) {
    const double t = std::clamp(aggression, 0.0, 1.0);
    const BotProfile& p = PASSIVE_PROFILE;
    const BotProfile& a = AGGRESSIVE_PROFILE;
    BotProfile out;
    out.open_raise     = lerp(p.open_raise, a.open_raise, t);
    out.limp           = lerp(p.limp, a.limp, t);
    out.iso_raise      = lerp(p.iso_raise, a.iso_raise, t);
    out.three_bet      = lerp(p.three_bet, a.three_bet, t);
    out.call_raise     = lerp(p.call_raise, a.call_raise, t);
    out.open_size_bb   = lerp(p.open_size_bb, a.open_size_bb, t);
    out.three_bet_mult = lerp(p.three_bet_mult, a.three_bet_mult, t);
    out.value_bet      = lerp(p.value_bet, a.value_bet, t);
    out.thin_bet       = lerp(p.thin_bet, a.thin_bet, t);
    out.raise_vs_bet   = lerp(p.raise_vs_bet, a.raise_vs_bet, t);
    out.call_base      = lerp(p.call_base, a.call_base, t);
    out.cbet_freq      = lerp(p.cbet_freq, a.cbet_freq, t);
    out.bluff_freq     = lerp(p.bluff_freq, a.bluff_freq, t);
    out.small_frac     = lerp(p.small_frac, a.small_frac, t);
    out.medium_frac    = lerp(p.medium_frac, a.medium_frac, t);
    out.large_frac     = lerp(p.large_frac, a.large_frac, t);
    return out;
}

// -----------------------------------------------------------------------------
//  decide
// -----------------------------------------------------------------------------
Action BotEngine::decide(const GameState& state) {
    const LegalActions legal = state.get_legal_actions();
    if (legal.empty() || legal.player_index < 0) {
        throw std::logic_error("BotEngine::decide called with no decision pending");
    }

    Action action = state.get_current_street() == Street::PREFLOP
        ? decide_preflop(state, legal)
        : decide_postflop(state, legal);
    action = ensure_legal(legal, action);

    spdlog::debug("Bot P{} ({}): {}", legal.player_index, street_to_string(state.get_current_street()),
                  action_to_string(action));
    return action;
}

// -----------------------------------------------------------------------------
//  Préflop
// -----------------------------------------------------------------------------
Action BotEngine::decide_preflop(const GameState& state, const LegalActions& legal) {
    const int seat = legal.player_index;
    const double strength = preflop_strength(state.get_player_hand(seat));
    const double adjusted = strength + (aggression_ - 0.5) * 0.10 + noise();
    const auto& bets = state.get_current_bets();
    const int max_bet = std::max(bets[0], bets[1]);
    const int bb = state.get_big_blind_size();

    spdlog::trace("Bot P{} préflop: force {:.3f}, ajustée {:.3f}", seat, strength, adjusted);

    if (legal.can_check) {
        // Option de la big blind sur un limp
        if (adjusted > profile_.iso_raise) {
            return aggressive_to(legal, static_cast<int>(std::round(bb * (profile_.open_size_bb + 0.5))));
        }
        return check_or_fold(legal);
    }

    const bool facing_raise = state.get_aggressions_this_street() > 0;
    if (!facing_raise) {
        // Bouton, pot non ouvert
        if (adjusted > profile_.open_raise) {
            return aggressive_to(legal, static_cast<int>(std::round(bb * profile_.open_size_bb)));
        }
        if (adjusted > profile_.limp) return check_or_call(legal);
        if (chance(profile_.bluff_freq * 0.3)) {
            return aggressive_to(legal, static_cast<int>(std::round(bb * profile_.open_size_bb)));
        }
        return check_or_fold(legal);
    }

    // Face à une relance : le seuil de call monte avec la taille de la relance
    const double raise_bb = static_cast<double>(max_bet) / bb;
    const double call_threshold = profile_.call_raise + std::min(0.15, std::max(0.0, raise_bb - 3.0) * 0.02);

    if (adjusted > profile_.three_bet && legal.can_raise) {
        return aggressive_to(legal, static_cast<int>(std::round(max_bet * profile_.three_bet_mult)));
    }
    if (adjusted > call_threshold) return check_or_call(legal);
    if (adjusted > profile_.limp && legal.to_call <= 3 * bb) return check_or_call(legal);
    if (aggression_ > 0.7 && legal.can_raise && chance(profile_.bluff_freq * 0.2)) {
        return aggressive_to(legal, static_cast<int>(std::round(max_bet * profile_.three_bet_mult)));
    }
    return check_or_fold(legal);
}

// -----------------------------------------------------------------------------
//  Postflop
// -----------------------------------------------------------------------------
Action BotEngine::decide_postflop(const GameState& state, const LegalActions& legal) {
    const int seat = legal.player_index;
    const Street street = state.get_current_street();
    const auto& hole = state.get_player_hand(seat);
    const auto& board = state.get_board();

    const double made = evaluate_hand(hole, board).strength();
    // Pas d'équité de tirage à la river
    const DrawInfo draws = street == Street::RIVER ? DrawInfo{} : detect_draws(hole, board);
    const double effective = made + draws.strength_boost(street);
    const double adjusted = adjust_postflop_strength(effective, state, seat);
    const BoardTexture texture = analyze_board_texture(board);

    spdlog::trace("Bot P{} {}: faite {:.3f}, tirages {} outs, ajustée {:.3f}, board {}",
                  seat, street_to_string(street), made, draws.outs(), adjusted, texture_to_string(texture));

    if (legal.can_check) {
        if (street == Street::RIVER) return river_bet_or_check(state, legal, adjusted);
        return bet_or_check(state, legal, adjusted, draws, texture);
    }
    return facing_bet(state, legal, adjusted, draws);
}

Action BotEngine::bet_or_check(const GameState& state, const LegalActions& legal, double adjusted,
                               const DrawInfo& draws, BoardTexture texture) {
    const int seat = legal.player_index;
    double texture_frac = profile_.medium_frac;
    if (texture == BoardTexture::DRY) texture_frac = profile_.small_frac;
    else if (texture == BoardTexture::WET) texture_frac = profile_.large_frac;

    if (adjusted > profile_.value_bet) return pot_fraction_bet(state, legal, profile_.large_frac);
    if (adjusted > profile_.thin_bet) return pot_fraction_bet(state, legal, texture_frac);

    // Continuation bet : agresseur préflop, premier à miser au flop
    const bool cbet_spot = state.get_current_street() == Street::FLOP
                        && state.get_preflop_aggressor() == seat
                        && state.get_aggressions_this_street() == 0;
    if (cbet_spot && chance(profile_.cbet_freq)) {
        return pot_fraction_bet(state, legal, texture_frac);
    }

    // Semi-bluff avec un gros tirage
    if (draws.outs() >= 8 && chance(profile_.bluff_freq * 2.0)) {
        return pot_fraction_bet(state, legal, profile_.medium_frac);
    }
    if (adjusted < 0.10 && chance(profile_.bluff_freq)) {
        return pot_fraction_bet(state, legal, texture == BoardTexture::DRY ? profile_.small_frac : profile_.medium_frac);
    }
    return check_or_fold(legal);
}

Action BotEngine::river_bet_or_check(const GameState& state, const LegalActions& legal, double adjusted) {
    if (adjusted > profile_.value_bet) return pot_fraction_bet(state, legal, profile_.large_frac);
    if (adjusted > profile_.thin_bet - 0.05) return pot_fraction_bet(state, legal, profile_.small_frac);
    if (adjusted < 0.08 && chance(profile_.bluff_freq * 0.6)) {
        return pot_fraction_bet(state, legal, profile_.large_frac);
    }
    return check_or_fold(legal);
}

Action BotEngine::facing_bet(const GameState& state, const LegalActions& legal, double adjusted,
                             const DrawInfo& draws) {
    const int seat = legal.player_index;
    const Street street = state.get_current_street();
    const double pot_odds = state.pot_odds(seat).value_or(0.0);

    // Équité estimée : la meilleure entre la main faite et les tirages (règle des 4 et 2)
    const double made_adjusted = adjusted - draws.strength_boost(street);
    const double made_equity = std::clamp(made_adjusted * 2.2 - 0.15, 0.0, 1.0);
    const double equity = std::max(made_equity, draws.equity(street));
    // Marge de call accordée au-dessous de la cote, plus large quand le bot est agressif
    const double margin = profile_.call_base * 0.25 + 0.10 * aggression_;

    if (adjusted > profile_.raise_vs_bet) {
        if (legal.can_raise) return pot_fraction_bet(state, legal, profile_.medium_frac);
        return check_or_call(legal);
    }
    if (street != Street::RIVER && draws.outs() >= 8 && legal.can_raise
        && chance(profile_.bluff_freq)) {
        return pot_fraction_bet(state, legal, profile_.medium_frac);
    }
    spdlog::trace("Bot P{}: équité {:.3f} (faite {:.3f}), cote {:.3f}, marge {:.3f}",
                  seat, equity, made_equity, pot_odds, margin);
    if (equity >= pot_odds - margin) return check_or_call(legal);
    if (adjusted < 0.08 && aggression_ > 0.7 && legal.can_raise && chance(profile_.bluff_freq * 0.4)) {
        return pot_fraction_bet(state, legal, profile_.medium_frac);
    }
    return check_or_fold(legal);
}

// -----------------------------------------------------------------------------
//  Helpers
// -----------------------------------------------------------------------------
double BotEngine::adjust_postflop_strength(double effective, const GameState& state, int seat) {
    // Le bouton parle en dernier postflop
    const double position = state.get_player_position(seat) == Position::BUTTON ? 0.06 : -0.04;
    const double aggression_adj = (aggression_ - 0.5) * 0.12;
    return effective + position + aggression_adj + noise();
}

Action BotEngine::pot_fraction_bet(const GameState& state, const LegalActions& legal, double fraction) const {
    if (!legal.can_bet && !legal.can_raise) return check_or_call(legal);
    const auto& bets = state.get_current_bets();
    const int max_bet = std::max(bets[0], bets[1]);
    const int to_call = state.amount_to_call(legal.player_index);
    // Pot "après call", comme pour une relance au pot
    const double effective_pot = static_cast<double>(state.get_pot_size() + to_call);
    const int increment = static_cast<int>(std::round(effective_pot * fraction));
    return aggressive_to(legal, max_bet + increment);
}

Action BotEngine::aggressive_to(const LegalActions& legal, int total) const {
    if (!legal.can_bet && !legal.can_raise) return check_or_call(legal);
    Action action;
    action.player_index = legal.player_index;
    action.type = legal.can_bet ? ActionType::BET : ActionType::RAISE;
    action.amount = std::clamp(total, legal.min_to, legal.max_to);
    return action;
}

Action BotEngine::check_or_call(const LegalActions& legal) const {
    Action action;
    action.player_index = legal.player_index;
    action.type = legal.can_check ? ActionType::CHECK : ActionType::CALL;
    return action;
}

Action BotEngine::check_or_fold(const LegalActions& legal) const {
    Action action;
    action.player_index = legal.player_index;
    action.type = legal.can_check ? ActionType::CHECK : ActionType::FOLD;
    return action;
}

Action BotEngine::ensure_legal(const LegalActions& legal, Action action) const {
    if (legal.contains(action)) return action;
    spdlog::warn("Bot: action {} hors de l'ensemble légal ({}), repli", action_to_string(action),
                 legal_actions_to_string(legal));
    Action fallback;
    fallback.player_index = legal.player_index;
    if (legal.can_check) fallback.type = ActionType::CHECK;
    else if (legal.can_call) fallback.type = ActionType::CALL;
    else fallback.type = ActionType::FOLD;
    return fallback;
}

double BotEngine::noise() {
    std::uniform_real_distribution<double> dist(-0.05, 0.05);
    return dist(rng_);
}

bool BotEngine::chance(double probability) {
    if (probability <= 0.0) return false;
    std::bernoulli_distribution dist(std::min(1.0, probability));
    return dist(rng_);
}

} // namespace hu_poker
