#ifndef HU_STATS_AGGREGATOR_H
#define HU_STATS_AGGREGATOR_H

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "hu/common_types.h"

namespace hu_poker {

// Compteurs bruts d'un joueur. Les pourcentages sont calculés à la lecture.
struct PlayerStats {
    uint64_t hands_played = 0;
    uint64_t sessions = 0;

    // Préflop
    uint64_t vpip_hands = 0;
    uint64_t pfr_hands = 0;
    uint64_t three_bet_opportunities = 0;
    uint64_t three_bet_hands = 0;

    // Postflop
    uint64_t cbet_opportunities = 0;
    uint64_t cbet_hands = 0;
    uint64_t fold_to_cbet_opportunities = 0;
    uint64_t fold_to_cbet_hands = 0;

    // Showdown
    uint64_t saw_flop_hands = 0;
    uint64_t wtsd_hands = 0;
    uint64_t wsd_hands = 0;

    // Facteur d'agression (actions postflop)
    uint64_t postflop_bets = 0;
    uint64_t postflop_raises = 0;
    uint64_t postflop_calls = 0;

    // Résultats
    int64_t  net_chips = 0;
    uint64_t biggest_pot_won = 0;
    uint64_t biggest_pot_lost = 0;

    // Pourcentages (0..100), 0 si aucune occasion
    double vpip() const;
    double pfr() const;
    double three_bet() const;
    double cbet() const;
    double fold_to_cbet() const;
    double wtsd() const;   // sur les mains qui ont vu le flop
    double wsd() const;    // sur les showdowns
    // (bets + raises) / calls ; 99.9 si agression sans aucun call
    double aggression_factor() const;
    double net_bb() const;
    double bb_per_100() const;

    // Table nom -> valeur, dans l'ordre du fichier de stats
    std::vector<std::pair<std::string, int64_t>> counters() const;
    // Noms absents = 0, noms inconnus ignorés.
    // Lance PersistenceCorrupt si un compteur non signé est négatif.
    static PlayerStats from_counters(const std::map<std::string, int64_t>& values);

    // Cumul : les compteurs s'additionnent, les plus gros pots prennent le max
    PlayerStats& operator+=(const PlayerStats& other);
    bool operator==(const PlayerStats& other) const;
};

PlayerStats operator+(PlayerStats lhs, const PlayerStats& rhs);

struct StatDefinition {
    const char* abbrev;
    const char* name;
    const char* explanation;
};

const std::vector<StatDefinition>& stat_definitions();

// Stats de session par siège + cumul à vie du siège suivi
struct StatsSnapshot {
    int hero_seat = 0;
    std::array<PlayerStats, NUM_SEATS> session{};
    PlayerStats lifetime;
};

/**
 * Accumulateur alimenté par le flux d'événements du moteur.
 *
 * Les drapeaux de main (VPIP, PFR, 3-bet, c-bet, showdown) sont mis en attente
 * pendant la main et validés par on_hand_complete ; les compteurs d'agression
 * postflop sont enregistrés immédiatement. Une main abandonnée (pas de
 * on_hand_complete) ne contribue que par ses actions déjà enregistrées.
 */
class StatsAggregator {
public:
    explicit StatsAggregator(int hero_seat = 0, PlayerStats lifetime_base = PlayerStats{});

    void on_hand_start(const HandStart& start);
    void on_action(const ActionEvent& event);
    void on_hand_complete(const HandResult& result);

    // Compte la session (une seule fois)
    void record_session_end();

    StatsSnapshot snapshot() const;
    const PlayerStats& get_session_stats(int seat) const;
    PlayerStats get_lifetime_stats() const;
    int get_hero_seat() const { return hero_seat_; }
    bool is_hand_open() const { return hand_open_; }

private:
    struct HandFlags {
        bool vpip = false;
        bool pfr = false;
        bool three_bet_opportunity = false;
        bool three_bet = false;
        bool cbet_opportunity = false;
        bool cbet = false;
        bool fold_to_cbet_opportunity = false;
        bool fold_to_cbet = false;
    };

    int hero_seat_;
    PlayerStats lifetime_base_;
    std::array<PlayerStats, NUM_SEATS> session_;
    bool session_recorded_;

    // État de la main en cours
    bool hand_open_;
    HandStart current_start_;
    std::array<HandFlags, NUM_SEATS> flags_;
    int preflop_raises_;
    int preflop_aggressor_;
    bool cbet_made_;

    void reset_hand_state();
    void record_preflop(const ActionEvent& event);
    void record_flop(const ActionEvent& event);
    void record_aggression(const ActionEvent& event);
    void validate_seat(int seat) const;
};

} // namespace hu_poker

#endif // HU_STATS_AGGREGATOR_H
