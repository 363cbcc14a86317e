#ifndef HU_SESSION_H
#define HU_SESSION_H

#include <cstdint>
#include <functional>
#include <vector>

#include "hu/common_types.h"
#include "hu/game_state.h"
#include "hu/bot_engine.h"
#include "hu/stats_aggregator.h"

namespace hu_poker {

/**
 * Pilote d'une session humain contre bot : enchaîne les mains, interroge le
 * bot quand c'est à lui, relaie chaque événement au StatsAggregator et publie
 * un TableSnapshot (vu du siège humain) après chaque transition.
 */
class Session {
public:
    using SnapshotListener = std::function<void(const TableSnapshot&)>;

    static constexpr int HUMAN_SEAT = 0;
    static constexpr int BOT_SEAT = 1;

    // Lance ConfigError si la configuration est invalide
    explicit Session(const Config& config, PlayerStats lifetime_base = PlayerStats{});

    void set_snapshot_listener(SnapshotListener listener);

    // Démarre la main suivante puis fait jouer le bot jusqu'au tour de l'humain
    void start_hand();
    void start_hand_with_deck(const std::vector<Card>& top_cards);

    // Lance IllegalAction si ce n'est pas le tour de l'humain ou si l'action
    // n'est pas légale (état inchangé)
    ActionEvent apply_human_action(Action action);

    bool is_human_turn() const;
    bool is_hand_in_progress() const { return state_.is_hand_in_progress(); }
    bool is_session_over() const { return state_.is_session_over(); }

    // Clôt la session pour les stats (une seule fois)
    void end_session();

    TableSnapshot snapshot() const { return state_.snapshot(HUMAN_SEAT); }
    const GameState& get_state() const { return state_; }
    const StatsAggregator& get_stats() const { return stats_; }
    const Config& get_config() const { return config_; }
    uint32_t get_seed() const { return seed_; }

private:
    Config config_;
    uint32_t seed_;
    GameState state_;
    BotEngine bot_;
    StatsAggregator stats_;
    SnapshotListener listener_;

    void after_hand_start();
    void run_bot();
    void record_event(const ActionEvent& event);
    void publish() const;
};

} // namespace hu_poker

#endif // HU_SESSION_H
