#ifndef HU_GAME_STATE_H
#define HU_GAME_STATE_H

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "core/cards.hpp"
#include "core/deck.hpp"
#include "eval/hand_evaluator.hpp"
#include "hu/common_types.h"

namespace hu_poker {

// Vue d'un siège telle que vue par un observateur
struct SeatView {
    int stack = 0;
    int bet = 0;          // engagé sur la street
    int committed = 0;    // engagé sur la main
    Position position = Position::BUTTON;
    bool folded = false;
    bool all_in = false;
    std::vector<Card> hole_cards; // vide si cachées pour l'observateur
};

// Projection immuable de l'état du moteur, publiée après chaque transition
struct TableSnapshot {
    int hand_number = 0;
    Street street = Street::PREFLOP;
    int pot = 0;
    int to_act = -1;
    int button_seat = 0;
    bool hand_over = true;
    std::vector<Card> board;
    std::array<SeatView, NUM_SEATS> seats{};
    LegalActions legal;
    std::optional<ActionEvent> last_action;
    std::optional<HandResult> result;
};

/**
 * Machine à états d'une main heads-up : blinds, ordre de parole,
 * actions légales, pot, progression des streets, showdown.
 *
 * Les sièges 0 et 1 gardent leur stack d'une main à l'autre ; le bouton
 * alterne à chaque nouvelle main. Le générateur aléatoire est injecté par
 * graine pour des mains reproductibles.
 */
class GameState {
public:
    // Constructeur
    GameState(int starting_stack_bb, uint32_t seed, int first_button_seat = 0);
    explicit GameState(const Config& config);

    // Cycle de vie d'une main
    void start_new_hand();
    void start_new_hand_with_deck(const std::vector<Card>& top_cards);

    // Lance IllegalAction si l'action n'est pas légale (état inchangé)
    ActionEvent apply_action(const Action& action);
    LegalActions get_legal_actions() const;

    bool is_hand_in_progress() const { return hand_in_progress_; }
    bool is_hand_over() const { return !hand_in_progress_ && hand_number_ > 0; }
    bool is_session_over() const;

    // Getters
    int get_current_player() const;
    int get_player_stack(int player_index) const;
    const std::array<int, NUM_SEATS>& get_current_bets() const;
    int get_committed_this_hand(int player_index) const;
    int get_pot_size() const;
    int get_last_raise_size() const;
    Street get_current_street() const;
    const std::vector<Card>& get_player_hand(int player_index) const;
    const std::vector<Card>& get_board() const;
    bool is_player_folded(int player_index) const;
    bool is_all_in(int player_index) const;
    int get_button_seat() const;
    int get_big_blind_seat() const;
    Position get_player_position(int player_index) const;
    int get_hand_number() const;
    int get_big_blind_size() const;
    int get_total_chips() const;
    int get_preflop_aggressor() const;
    int get_street_aggressor() const;
    int get_aggressions_this_street() const;
    const std::vector<ActionEvent>& get_action_history() const;
    const HandStart& get_hand_start() const;
    const std::optional<HandResult>& get_hand_result() const;

    int amount_to_call(int player_index) const;
    // Part du pot final à payer pour suivre ; vide si rien à suivre
    std::optional<double> pot_odds(int player_index) const;
    // Cartes inconnues du point de vue d'un siège (hors ses cartes et le board)
    std::vector<Card> get_unseen_cards(int player_index) const;

    // viewer = -1 : toutes les cartes visibles
    TableSnapshot snapshot(int viewer) const;

    // Utilitaires
    std::string toString() const;

private:
    int starting_stack_;
    std::array<int, NUM_SEATS> stacks_;
    std::array<int, NUM_SEATS> current_bets_;
    std::array<int, NUM_SEATS> committed_;
    std::array<bool, NUM_SEATS> has_folded_;
    std::array<bool, NUM_SEATS> has_acted_;
    std::array<std::vector<Card>, NUM_SEATS> player_hands_;
    int pot_size_;
    int total_chips_;
    int current_player_index_;
    int last_raise_size_;
    int button_pos_;
    int hand_number_;
    bool hand_in_progress_;
    Street current_street_;
    int preflop_aggressor_;
    int street_aggressor_;
    int aggressions_this_street_;
    std::mt19937 rng_;
    Deck deck_;
    std::vector<Card> board_;
    std::vector<ActionEvent> action_history_;
    HandStart hand_start_;
    std::optional<HandResult> hand_result_;
    int uncalled_returned_;

    // Méthodes privées
    void begin_hand(const std::vector<Card>* top_cards);
    void post_blind(int player_index, int amount);
    void commit_chips(int player_index, int amount);
    bool needs_action(int player_index) const;
    int select_next_actor(int first_candidate) const;
    void end_betting_round();
    void progress_to_next_street();
    void return_uncalled_bet();
    void resolve_fold(int folder);
    void resolve_showdown();
    void finish_hand(int winner, bool showdown);
    void check_chip_conservation() const;
    void validate_player_index(int player_index) const;
    std::string board_to_string() const;
};

} // namespace hu_poker

#endif // HU_GAME_STATE_H
