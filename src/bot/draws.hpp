#ifndef HU_BOT_DRAWS_HPP
#define HU_BOT_DRAWS_HPP

#include <string>
#include <vector>

#include "core/cards.hpp"
#include "hu/common_types.h"

namespace hu_poker {

// Tirages détectés pour une main sur un board de 3 ou 4 cartes
struct DrawInfo {
    bool flush_draw = false;        // 4 cartes à la couleur
    bool oesd = false;              // quinte ouverte des deux côtés
    bool gutshot = false;           // quinte ventrale (ou ouverte d'un seul côté)
    int  overcards = 0;             // cartes privées au-dessus du board
    bool backdoor_flush = false;    // flop uniquement
    bool backdoor_straight = false; // flop uniquement

    // Outs propres : couleur 9, quinte ouverte 8, ventrale 4 (plafonné à 15)
    int outs() const;

    // Règle des 4 et 2 : outs x 4% au flop, x 2% au turn, 0 à la river
    double equity(Street street) const;

    // Bonus de force ajouté à la main faite pour les décisions du bot
    double strength_boost(Street street) const;

    bool any() const { return flush_draw || oesd || gutshot; }
};

DrawInfo detect_draws(const std::vector<Card>& hole_cards, const std::vector<Card>& board);

// Texture du board : sec, moyen, humide
enum class BoardTexture {
    DRY,
    MEDIUM,
    WET
};

BoardTexture analyze_board_texture(const std::vector<Card>& board);

std::string texture_to_string(BoardTexture texture);

} // namespace hu_poker

#endif // HU_BOT_DRAWS_HPP
