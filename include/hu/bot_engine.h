#ifndef HU_BOT_ENGINE_H
#define HU_BOT_ENGINE_H

#include <cstdint>
#include <random>
#include <string>

#include "hu/common_types.h"
#include "hu/game_state.h"
#include "bot/draws.hpp"

namespace hu_poker {

/**
 * Profil de jeu du bot. Les seuils et tailles effectifs sont interpolés
 * linéairement entre le profil passif (agression 0) et le profil agressif
 * (agression 1).
 */
struct BotProfile {
    // Préflop (force de main normalisée)
    double open_raise;        // bouton : relance d'ouverture
    double limp;              // bouton : complète la small blind
    double iso_raise;         // big blind : relance sur un limp
    double three_bet;         // face à une relance
    double call_raise;        // face à une relance, seuil de call de base
    double open_size_bb;      // taille d'ouverture en big blinds
    double three_bet_mult;    // 3-bet = multiple de la mise adverse

    // Postflop
    double value_bet;         // mise pour la valeur (grosse taille)
    double thin_bet;          // mise fine, taille selon la texture
    double raise_vs_bet;      // relance face à une mise
    double call_base;         // base de la marge de call sous la cote
    double cbet_freq;         // fréquence de continuation bet
    double bluff_freq;        // fréquence de bluff / semi-bluff
    double small_frac;        // fractions du pot
    double medium_frac;
    double large_frac;
};

class BotEngine {
public:
    // agression ramenée dans [0, 1]
    BotEngine(double aggression, uint32_t seed);

    /**
     * @brief Choisit une action pour le siège qui doit parler.
     * Lit uniquement ses propres cartes, le board, le pot, les stacks et
     * l'historique de la main. L'action retournée est toujours légale.
     * @throws std::logic_error si aucune décision n'est attendue.
     */
    Action decide(const GameState& state);

    double get_aggression() const { return aggression_; }
    const BotProfile& get_profile() const { return profile_; }

    static BotProfile blend_profile(double aggression);

private:
    double aggression_;
    BotProfile profile_;
    std::mt19937 rng_;

    Action decide_preflop(const GameState& state, const LegalActions& legal);
    Action decide_postflop(const GameState& state, const LegalActions& legal);

    Action bet_or_check(const GameState& state, const LegalActions& legal, double adjusted,
                        const DrawInfo& draws, BoardTexture texture);
    Action river_bet_or_check(const GameState& state, const LegalActions& legal, double adjusted);
    Action facing_bet(const GameState& state, const LegalActions& legal, double adjusted,
                      const DrawInfo& draws);

    // Ajustements position / agression / bruit
    double adjust_postflop_strength(double effective, const GameState& state, int seat);

    // Mise / relance à une fraction du pot (après call), bornée à [min_to, max_to]
    Action pot_fraction_bet(const GameState& state, const LegalActions& legal, double fraction) const;
    // Mise / relance à un total donné, borné à [min_to, max_to]
    Action aggressive_to(const LegalActions& legal, int total) const;
    Action check_or_call(const LegalActions& legal) const;
    Action check_or_fold(const LegalActions& legal) const;
    // Dernier filet : toute action hors de l'ensemble légal devient check / call / fold
    Action ensure_legal(const LegalActions& legal, Action action) const;

    double noise();
    bool chance(double probability);
};

} // namespace hu_poker

#endif // HU_BOT_ENGINE_H
