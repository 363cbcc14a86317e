#include <hu/game_state.h>
#include "hu/errors.h"
#include "hu/game_utils.hpp"          // Pour street_to_string / action_to_string
#include "spdlog/spdlog.h"             // Logging
#include <spdlog/fmt/ranges.h>
#include <stdexcept>
#include <algorithm>
#include <string>
#include <vector>
#include <sstream>
#include "core/cards.hpp"
#include "core/deck.hpp"
#include "core/bitboard.hpp"

namespace hu_poker {

// -----------------------------------------------------------------------------
//  Constructeurs
// -----------------------------------------------------------------------------
GameState::GameState(int starting_stack_bb, uint32_t seed, int first_button_seat)
    : starting_stack_          (starting_stack_bb * BB_SIZE),
      stacks_                  {},
      current_bets_            {},
      committed_               {},
      has_folded_              {},
      has_acted_               {},
      player_hands_            {},
      pot_size_                (0),
      total_chips_             (0),
      current_player_index_    (-1),
      last_raise_size_         (BB_SIZE),
      button_pos_              (first_button_seat),
      hand_number_             (0),
      hand_in_progress_        (false),
      current_street_          (Street::PREFLOP),
      preflop_aggressor_       (-1),
      street_aggressor_        (-1),
      aggressions_this_street_ (0),
      rng_                     (seed),
      deck_                    (),
      board_                   (),
      action_history_          (),
      hand_start_              (),
      hand_result_             (),
      uncalled_returned_       (0)
{
    if (starting_stack_bb <= 0) throw ConfigError("Starting stack must be > 0 big blinds");
    if (first_button_seat < 0 || first_button_seat >= NUM_SEATS) throw std::invalid_argument("Invalid button seat");
    stacks_.fill(starting_stack_);
    total_chips_ = starting_stack_ * NUM_SEATS;
    spdlog::debug("GameState initialisé: stack {} jetons par siège, graine {}, BTN initial {}",
                  starting_stack_, seed, button_pos_);
}

GameState::GameState(const Config& config)
    : GameState((validate_config(config), config.starting_stack_bb),
                config.seed.value_or(std::random_device{}()))
{
}

// -----------------------------------------------------------------------------
//  Accesseurs simples
// -----------------------------------------------------------------------------
int GameState::get_current_player() const { return current_player_index_; }
int GameState::get_player_stack(int i) const { validate_player_index(i); return stacks_[i]; }
const std::array<int, NUM_SEATS>& GameState::get_current_bets() const { return current_bets_; }
int GameState::get_committed_this_hand(int i) const { validate_player_index(i); return committed_[i]; }
int GameState::get_pot_size() const { return pot_size_; }
int GameState::get_last_raise_size() const { return last_raise_size_; }
Street GameState::get_current_street() const { return current_street_; }
const std::vector<Card>& GameState::get_player_hand(int i) const { validate_player_index(i); return player_hands_[i]; }
const std::vector<Card>& GameState::get_board() const { return board_; }
bool GameState::is_player_folded(int i) const { validate_player_index(i); return has_folded_[i]; }
bool GameState::is_all_in(int i) const { validate_player_index(i); return hand_in_progress_ && !has_folded_[i] && stacks_[i] == 0; }
int GameState::get_button_seat() const { return button_pos_; }
int GameState::get_big_blind_seat() const { return opponent_of(button_pos_); }
int GameState::get_hand_number() const { return hand_number_; }
int GameState::get_big_blind_size() const { return BB_SIZE; }
int GameState::get_total_chips() const { return total_chips_; }
int GameState::get_preflop_aggressor() const { return preflop_aggressor_; }
int GameState::get_street_aggressor() const { return street_aggressor_; }
int GameState::get_aggressions_this_street() const { return aggressions_this_street_; }
const std::vector<ActionEvent>& GameState::get_action_history() const { return action_history_; }
const HandStart& GameState::get_hand_start() const { return hand_start_; }
const std::optional<HandResult>& GameState::get_hand_result() const { return hand_result_; }

Position GameState::get_player_position(int i) const {
    validate_player_index(i);
    return i == button_pos_ ? Position::BUTTON : Position::BIG_BLIND;
}

bool GameState::is_session_over() const {
    if (hand_in_progress_) return false;
    return stacks_[0] == 0 || stacks_[1] == 0;
}

int GameState::amount_to_call(int i) const {
    validate_player_index(i);
    const int max_bet = std::max(current_bets_[0], current_bets_[1]);
    return std::max(0, max_bet - current_bets_[i]);
}

std::optional<double> GameState::pot_odds(int i) const {
    const int to_call = std::min(amount_to_call(i), stacks_[i]);
    if (to_call == 0) return std::nullopt;
    return static_cast<double>(to_call) / static_cast<double>(pot_size_ + to_call);
}

void GameState::validate_player_index(int i) const {
    if (i < 0 || i >= NUM_SEATS) throw std::out_of_range("Idx joueur " + std::to_string(i));
}

// -----------------------------------------------------------------------------
//  Début de main
// -----------------------------------------------------------------------------
void GameState::start_new_hand() {
    begin_hand(nullptr);
}

void GameState::start_new_hand_with_deck(const std::vector<Card>& top_cards) {
    begin_hand(&top_cards);
}

void GameState::begin_hand(const std::vector<Card>* top_cards) {
    if (hand_in_progress_) throw std::logic_error("Cannot start a new hand: hand in progress");
    if (stacks_[0] == 0 || stacks_[1] == 0) throw std::logic_error("Cannot start a new hand: a seat has no chips");

    // Le paquet d'abord : une pile de test invalide lance sans toucher à l'état
    if (top_cards) {
        deck_.stack_for_testing(*top_cards);
    } else {
        deck_.shuffle(rng_);
    }

    if (hand_number_ > 0) button_pos_ = opponent_of(button_pos_);
    ++hand_number_;

    current_bets_.fill(0);
    committed_.fill(0);
    has_folded_.fill(false);
    has_acted_.fill(false);
    for (auto& hand : player_hands_) hand.clear();
    board_.clear();
    action_history_.clear();
    hand_result_.reset();
    pot_size_ = 0;
    last_raise_size_ = BB_SIZE;
    current_street_ = Street::PREFLOP;
    preflop_aggressor_ = -1;
    street_aggressor_ = -1;
    aggressions_this_street_ = 0;
    uncalled_returned_ = 0;
    total_chips_ = stacks_[0] + stacks_[1];

    // Distribution alternée en commençant par la big blind
    const int bb_player = get_big_blind_seat();
    for (int i = 0; i < 4; ++i) {
        const int player = (i % 2 == 0) ? bb_player : button_pos_;
        player_hands_[player].push_back(deck_.draw());
    }

    hand_start_ = HandStart{};
    hand_start_.hand_number = hand_number_;
    hand_start_.button_seat = button_pos_;
    hand_start_.starting_stacks = stacks_;

    // Blinds : le bouton poste la SB, l'autre siège la BB
    post_blind(button_pos_, SB_SIZE);
    post_blind(bb_player, BB_SIZE);
    hand_start_.blinds_posted = current_bets_;

    hand_in_progress_ = true;
    spdlog::debug("Main #{}: BTN=P{}, mises {}, pot {}", hand_number_, button_pos_,
                  fmt::join(current_bets_, ","), pot_size_);

    // Le bouton parle en premier préflop
    current_player_index_ = select_next_actor(button_pos_);
    if (current_player_index_ < 0) {
        spdlog::debug("Main #{}: aucun joueur ne peut parler après les blinds", hand_number_);
        end_betting_round();
    }
    check_chip_conservation();
}

void GameState::post_blind(int player, int amount) {
    const int post = std::min(stacks_[player], amount);
    commit_chips(player, post);
    spdlog::debug("P{} poste {} (stack {})", player, post, stacks_[player]);
}

void GameState::commit_chips(int player, int amount) {
    stacks_[player] -= amount;
    current_bets_[player] += amount;
    committed_[player] += amount;
    pot_size_ += amount;
}

// -----------------------------------------------------------------------------
//  Actions légales
// -----------------------------------------------------------------------------
LegalActions GameState::get_legal_actions() const {
    LegalActions legal;
    const int p = current_player_index_;
    if (!hand_in_progress_ || p < 0) return legal;

    legal.player_index = p;
    const int opp = opponent_of(p);
    const int stack = stacks_[p];
    const int max_bet = std::max(current_bets_[0], current_bets_[1]);
    const int to_call = max_bet - current_bets_[p];
    const int all_in_to = current_bets_[p] + stack;

    if (to_call == 0) {
        legal.can_check = true;
        if (stack > 0 && stacks_[opp] > 0) {
            legal.can_bet = true;
            legal.min_to = std::min(max_bet + last_raise_size_, all_in_to);
            legal.max_to = all_in_to;
        }
        return legal;
    }

    legal.can_fold = true;
    legal.can_call = true;
    legal.to_call = std::min(to_call, stack);
    legal.call_is_all_in = stack <= to_call;
    if (stack > to_call && stacks_[opp] > 0) {
        legal.can_raise = true;
        legal.min_to = std::min(max_bet + last_raise_size_, all_in_to);
        legal.max_to = all_in_to;
    }
    return legal;
}

// -----------------------------------------------------------------------------
//  Ordre de parole
// -----------------------------------------------------------------------------
bool GameState::needs_action(int p) const {
    if (has_folded_[p] || stacks_[p] == 0) return false;
    const int max_bet = std::max(current_bets_[0], current_bets_[1]);
    if (current_bets_[p] < max_bet) return true;
    // Mises égalisées : plus rien à disputer si l'adversaire est à tapis
    if (stacks_[opponent_of(p)] == 0) return false;
    return !has_acted_[p];
}

int GameState::select_next_actor(int first_candidate) const {
    if (needs_action(first_candidate)) return first_candidate;
    const int other = opponent_of(first_candidate);
    if (needs_action(other)) return other;
    return -1;
}

// -----------------------------------------------------------------------------
//  apply_action
// -----------------------------------------------------------------------------
ActionEvent GameState::apply_action(const Action& action)
{
    const int acting_player = current_player_index_;
    if (!hand_in_progress_ || acting_player < 0) {
        spdlog::warn("Action refusée: aucune main en cours");
        throw IllegalAction("No hand in progress");
    }
    if (action.player_index != acting_player) {
        spdlog::warn("Action refusée: P{} n'a pas la parole (P{} doit parler)", action.player_index, acting_player);
        throw IllegalAction("Player " + std::to_string(action.player_index) + " is not to act");
    }
    const LegalActions legal = get_legal_actions();
    if (!legal.contains(action)) {
        spdlog::warn("Action refusée pour P{}: {}", acting_player, action_to_string(action));
        throw IllegalAction("Illegal action: " + action_to_string(action) + " (" + legal_actions_to_string(legal) + ")");
    }

    ActionEvent event;
    event.hand_number = hand_number_;
    event.street = current_street_;
    event.action = action;
    event.to_call_before = amount_to_call(acting_player);
    event.aggressions_before = aggressions_this_street_;

    const int opp = opponent_of(acting_player);
    const int max_bet = std::max(current_bets_[0], current_bets_[1]);

    switch (action.type) {
        case ActionType::FOLD: {
            has_folded_[acting_player] = true;
            event.action.amount = 0;
            spdlog::info("P{} FOLD", acting_player);
            break;
        }
        case ActionType::CHECK: {
            event.action.amount = 0;
            spdlog::info("P{} CHECK", acting_player);
            break;
        }
        case ActionType::CALL: {
            commit_chips(acting_player, legal.to_call);
            event.chips_added = legal.to_call;
            event.action.amount = current_bets_[acting_player];
            spdlog::info("P{} CALL {} (stack {})", acting_player, legal.to_call, stacks_[acting_player]);
            break;
        }
        case ActionType::BET:
        case ActionType::RAISE: {
            const int total_bet = action.amount;
            const int added = total_bet - current_bets_[acting_player];
            const int increment = total_bet - max_bet;
            commit_chips(acting_player, added);
            event.chips_added = added;
            // Un tapis inférieur à la relance minimale ne modifie pas l'incrément
            if (increment >= last_raise_size_) last_raise_size_ = increment;
            street_aggressor_ = acting_player;
            if (current_street_ == Street::PREFLOP) preflop_aggressor_ = acting_player;
            ++aggressions_this_street_;
            has_acted_[opp] = false; // l'action est rouverte
            spdlog::info("P{} {} to {} (+{}, inc {}, stack {})", acting_player,
                         action.type == ActionType::BET ? "BET" : "RAISE",
                         total_bet, added, increment, stacks_[acting_player]);
            break;
        }
    }
    has_acted_[acting_player] = true;
    event.all_in = (action.type != ActionType::FOLD && stacks_[acting_player] == 0);

    const Street street_before = current_street_;
    if (action.type == ActionType::FOLD) {
        resolve_fold(acting_player);
    } else {
        const int next = select_next_actor(opp);
        if (next >= 0) {
            current_player_index_ = next;
        } else {
            end_betting_round();
        }
    }

    event.pot_after = pot_size_;
    event.hand_over = !hand_in_progress_;
    event.street_closed = event.hand_over || current_street_ != street_before;
    action_history_.push_back(event);

    check_chip_conservation();
    return event;
}

// -----------------------------------------------------------------------------
//  Fin de tour d'enchères / progression des streets
// -----------------------------------------------------------------------------
void GameState::end_betting_round()
{
    return_uncalled_bet();
    while (true) {
        if (current_street_ == Street::RIVER) {
            resolve_showdown();
            return;
        }
        progress_to_next_street();
        // Postflop : la big blind parle en premier
        const int next = select_next_actor(get_big_blind_seat());
        if (next >= 0) {
            current_player_index_ = next;
            return;
        }
        // Plus d'enchères possibles (tapis) : on distribue la suite sans miser
        spdlog::debug("Aucune enchère possible sur {}, street suivante", street_to_string(current_street_));
    }
}

void GameState::progress_to_next_street() {
    spdlog::debug("Progressing to next street from {}", street_to_string(current_street_));
    switch (current_street_) {
        case Street::PREFLOP: {
            auto flop = deck_.draw_n(3);
            board_.insert(board_.end(), flop.begin(), flop.end());
            current_street_ = Street::FLOP;
            break;
        }
        case Street::FLOP:
            board_.push_back(deck_.draw());
            current_street_ = Street::TURN;
            break;
        case Street::TURN:
            board_.push_back(deck_.draw());
            current_street_ = Street::RIVER;
            break;
        default:
            throw std::logic_error("progress_to_next_street appelé depuis " + street_to_string(current_street_));
    }
    spdlog::debug("{}: [{}]", street_to_string(current_street_), board_to_string());

    current_bets_.fill(0);
    has_acted_.fill(false);
    last_raise_size_ = BB_SIZE;
    street_aggressor_ = -1;
    aggressions_this_street_ = 0;
}

void GameState::return_uncalled_bet() {
    const int hi = current_bets_[0] >= current_bets_[1] ? 0 : 1;
    const int lo = opponent_of(hi);
    const int excess = current_bets_[hi] - current_bets_[lo];
    if (excess <= 0) return;
    if (stacks_[lo] != 0 && !has_folded_[lo]) {
        throw std::logic_error("Betting round closed with unmatched bets");
    }
    stacks_[hi] += excess;
    current_bets_[hi] -= excess;
    committed_[hi] -= excess;
    pot_size_ -= excess;
    uncalled_returned_ += excess;
    spdlog::debug("Mise non suivie: {} rendus à P{}", excess, hi);
}

// -----------------------------------------------------------------------------
//  Résolution
// -----------------------------------------------------------------------------
void GameState::resolve_fold(int folder) {
    return_uncalled_bet();
    finish_hand(opponent_of(folder), false);
}

void GameState::resolve_showdown() {
    current_street_ = Street::SHOWDOWN;
    spdlog::debug("Hand reached Showdown");
    const HandValue v0 = evaluate_hand(player_hands_[0], board_);
    const HandValue v1 = evaluate_hand(player_hands_[1], board_);

    int winner = -1;
    if (v0 > v1) winner = 0;
    else if (v1 > v0) winner = 1;

    finish_hand(winner, true);
    hand_result_->best_hand[0] = v0;
    hand_result_->best_hand[1] = v1;
    spdlog::info("Showdown: P0 {} / P1 {}", v0.describe(), v1.describe());
}

void GameState::finish_hand(int winner, bool showdown) {
    HandResult result;
    result.hand_number = hand_number_;
    result.winner = winner;
    result.pot = pot_size_;
    result.showdown = showdown;
    result.button_seat = button_pos_;
    result.board = board_;
    result.uncalled_returned = uncalled_returned_;
    switch (board_.size()) {
        case 0:  result.street_reached = Street::PREFLOP; break;
        case 3:  result.street_reached = Street::FLOP; break;
        case 4:  result.street_reached = Street::TURN; break;
        default: result.street_reached = Street::RIVER; break;
    }

    if (winner >= 0) {
        stacks_[winner] += pot_size_;
        result.amount_won[winner] = pot_size_;
    } else {
        // Pot partagé : le jeton impair va au bouton
        const int half = pot_size_ / 2;
        const int odd = pot_size_ % 2;
        const int other = opponent_of(button_pos_);
        stacks_[button_pos_] += half + odd;
        stacks_[other] += half;
        result.amount_won[button_pos_] = half + odd;
        result.amount_won[other] = half;
    }
    pot_size_ = 0;
    for (int p = 0; p < NUM_SEATS; ++p) {
        result.net[p] = stacks_[p] - hand_start_.starting_stacks[p];
    }

    hand_in_progress_ = false;
    current_player_index_ = -1;
    hand_result_ = result;

    if (winner >= 0) {
        spdlog::info("Main #{}: P{} gagne {} ({})", hand_number_, winner, result.pot, showdown ? "showdown" : "fold");
    } else {
        spdlog::info("Main #{}: pot partagé ({})", hand_number_, result.pot);
    }
}

void GameState::check_chip_conservation() const {
    if (stacks_[0] + stacks_[1] + pot_size_ != total_chips_) {
        spdlog::critical("Conservation des jetons violée: {} + {} + {} != {}",
                         stacks_[0], stacks_[1], pot_size_, total_chips_);
        throw std::logic_error("Chip conservation violated");
    }
}

// -----------------------------------------------------------------------------
//  Vues / affichage
// -----------------------------------------------------------------------------
std::vector<Card> GameState::get_unseen_cards(int player_index) const {
    validate_player_index(player_index);
    Bitboard known = cards_to_board(player_hands_[player_index]);
    for (Card c : board_) set_card(known, c);

    return complement_cards(known);
}

TableSnapshot GameState::snapshot(int viewer) const {
    TableSnapshot snap;
    snap.hand_number = hand_number_;
    snap.street = current_street_;
    snap.pot = pot_size_;
    snap.to_act = current_player_index_;
    snap.button_seat = button_pos_;
    snap.hand_over = !hand_in_progress_;
    snap.board = board_;
    snap.legal = get_legal_actions();
    if (!action_history_.empty()) snap.last_action = action_history_.back();
    snap.result = hand_result_;

    const bool reveal_all = viewer < 0 || (hand_result_ && hand_result_->showdown);
    for (int p = 0; p < NUM_SEATS; ++p) {
        SeatView& seat = snap.seats[p];
        seat.stack = stacks_[p];
        seat.bet = current_bets_[p];
        seat.committed = committed_[p];
        seat.position = get_player_position(p);
        seat.folded = has_folded_[p];
        seat.all_in = is_all_in(p);
        if (reveal_all || p == viewer) seat.hole_cards = player_hands_[p];
    }
    return snap;
}

std::string GameState::board_to_string() const {
    return vec_to_string(board_);
}

std::string GameState::toString() const {
    std::stringstream ss;
    ss << "Hand #" << hand_number_ << " | Street: " << street_to_string(current_street_) << " | Pot: " << pot_size_
       << " | Board: " << board_to_string() << " | Next: "
       << (current_player_index_ >= 0 ? "P" + std::to_string(current_player_index_) : std::string("None"))
       << " | LastRaise: " << last_raise_size_ << "\n";
    for (int i = 0; i < NUM_SEATS; ++i) {
        ss << "  P" << i << "(" << position_to_string(get_player_position(i)) << "): Stack=" << stacks_[i]
           << ", Bet=" << current_bets_[i] << ", Hand=" << vec_to_string(player_hands_[i])
           << (has_folded_[i] ? " (Folded)" : "") << "\n";
    }
    return ss.str();
}

} // namespace hu_poker
