#ifndef HU_COMMON_TYPES_H
#define HU_COMMON_TYPES_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/cards.hpp"
#include "eval/hand_evaluator.hpp"

namespace hu_poker {

// Blinds fixes (en jetons)
constexpr int SB_SIZE = 1;
constexpr int BB_SIZE = 2;

constexpr int NUM_SEATS = 2;

// Position d'un siège pour la main en cours (alterne à chaque main)
enum class Position {
    BUTTON,    // Poste la small blind, parle en premier préflop
    BIG_BLIND  // Parle en premier sur toutes les streets postflop
};

// Enum pour les tours de jeu
enum class Street {
    PREFLOP,
    FLOP,
    TURN,
    RIVER,
    SHOWDOWN
};

// Types d'action possibles
enum class ActionType {
    FOLD,
    CHECK,
    CALL,
    BET,
    RAISE
};

// Structure pour représenter une action concrète.
// BET / RAISE : amount = mise TOTALE du joueur sur la street après l'action.
// CALL : amount rempli par le moteur (ignoré en entrée). FOLD / CHECK : 0.
struct Action {
    int player_index = -1;
    ActionType type = ActionType::FOLD;
    int amount = 0;

    bool is_aggressive() const {
        return type == ActionType::BET || type == ActionType::RAISE;
    }

    bool operator==(const Action& other) const {
        return player_index == other.player_index &&
               type == other.type &&
               amount == other.amount;
    }
};

// Ensemble des actions légales pour le joueur qui doit parler
struct LegalActions {
    int  player_index = -1;
    bool can_fold  = false;
    bool can_check = false;
    bool can_call  = false;
    bool can_bet   = false;
    bool can_raise = false;
    int  to_call   = 0;   // jetons à ajouter pour suivre (plafonné au stack)
    bool call_is_all_in = false;
    int  min_to    = 0;   // mise totale minimale pour BET/RAISE
    int  max_to    = 0;   // mise totale maximale (tapis)

    bool empty() const { return !can_fold && !can_check && !can_call && !can_bet && !can_raise; }
    bool contains(const Action& action) const;
};

// Une action telle qu'appliquée par le moteur (journal + flux d'événements)
struct ActionEvent {
    int        hand_number = 0;
    Street     street = Street::PREFLOP;
    Action     action;               // montant normalisé (CALL rempli)
    int        chips_added = 0;      // jetons effectivement ajoutés au pot
    int        to_call_before = 0;   // montant à suivre avant l'action
    int        aggressions_before = 0; // bets/raises volontaires déjà faits sur cette street
    bool       all_in = false;
    int        pot_after = 0;
    bool       street_closed = false;
    bool       hand_over = false;
};

// Début de main, diffusé au démarrage de chaque main
struct HandStart {
    int hand_number = 0;
    int button_seat = 0;
    std::array<int, NUM_SEATS> starting_stacks{};
    std::array<int, NUM_SEATS> blinds_posted{};
};

// Enregistrement terminal d'une main
struct HandResult {
    int  hand_number = 0;
    int  winner = -1;           // -1 = pot partagé
    int  pot = 0;               // pot disputé attribué (hors mise non suivie)
    bool showdown = false;      // false = résolu sur fold
    Street street_reached = Street::PREFLOP; // dernière street distribuée
    int  button_seat = 0;
    std::array<int, NUM_SEATS> net{};        // variation de stack sur la main
    std::array<int, NUM_SEATS> amount_won{}; // jetons reçus du pot
    std::array<std::optional<HandValue>, NUM_SEATS> best_hand{};
    std::vector<Card> board;
    int  uncalled_returned = 0; // mise non suivie rendue à son auteur
    bool saw_flop() const { return board.size() >= 3; }
};

// Paramètres de session (immuables une fois validés)
struct Config {
    int starting_stack_bb = 100;
    double aggression = 0.5;
    std::optional<uint32_t> seed;   // absent = graine aléatoire
    std::string stats_file;         // vide = chemin par défaut
    bool verbose = false;
};

// Lance ConfigError si stack <= 0 ou agression hors [0, 1]
void validate_config(const Config& config);

inline int opponent_of(int seat) { return 1 - seat; }

// Fonction utilitaire pour convertir une position en string
inline const char* position_to_string(Position pos) {
    switch (pos) {
        case Position::BUTTON:    return "BTN";
        case Position::BIG_BLIND: return "BB";
    }
    return "INVALID";
}

} // namespace hu_poker

#endif // HU_COMMON_TYPES_H
