#ifndef HU_GAME_UTILS_HPP
#define HU_GAME_UTILS_HPP

#include "hu/common_types.h"
#include <string>
#include <vector>
#include "core/cards.hpp" // Pour Card et to_string(Card)

namespace hu_poker {

// Fonction pour convertir l'enum Street en string
std::string street_to_string(Street s);

std::string action_type_to_string(ActionType type);

// Fonction utilitaire pour convertir une Action en string
std::string action_to_string(const Action& action);

// "[As Kd 2c]"
std::string vec_to_string(const std::vector<Card>& cards);

// Résumé lisible de l'ensemble légal ("fold | call 4 | raise 8..200")
std::string legal_actions_to_string(const LegalActions& legal);

std::string hand_history_to_string(const std::vector<ActionEvent>& history);

} // namespace hu_poker

#endif // HU_GAME_UTILS_HPP
