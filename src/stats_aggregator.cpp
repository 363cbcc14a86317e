#include "hu/stats_aggregator.h"
#include "hu/errors.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <stdexcept>

namespace hu_poker {

namespace {

struct CounterField {
    const char* name;
    uint64_t PlayerStats::* field;
};

// Ordre des compteurs dans le fichier de stats (net_chips est signé, traité à part)
const std::vector<CounterField>& unsigned_fields() {
    static const std::vector<CounterField> fields = {
        {"hands_played",               &PlayerStats::hands_played},
        {"sessions",                   &PlayerStats::sessions},
        {"vpip_hands",                 &PlayerStats::vpip_hands},
        {"pfr_hands",                  &PlayerStats::pfr_hands},
        {"three_bet_opportunities",    &PlayerStats::three_bet_opportunities},
        {"three_bet_hands",            &PlayerStats::three_bet_hands},
        {"cbet_opportunities",         &PlayerStats::cbet_opportunities},
        {"cbet_hands",                 &PlayerStats::cbet_hands},
        {"fold_to_cbet_opportunities", &PlayerStats::fold_to_cbet_opportunities},
        {"fold_to_cbet_hands",         &PlayerStats::fold_to_cbet_hands},
        {"saw_flop_hands",             &PlayerStats::saw_flop_hands},
        {"wtsd_hands",                 &PlayerStats::wtsd_hands},
        {"wsd_hands",                  &PlayerStats::wsd_hands},
        {"postflop_bets",              &PlayerStats::postflop_bets},
        {"postflop_raises",            &PlayerStats::postflop_raises},
        {"postflop_calls",             &PlayerStats::postflop_calls},
    };
    return fields;
}

constexpr const char* NET_CHIPS = "net_chips";
constexpr const char* BIGGEST_POT_WON = "biggest_pot_won";
constexpr const char* BIGGEST_POT_LOST = "biggest_pot_lost";

double percentage(uint64_t part, uint64_t whole) {
    if (whole == 0) return 0.0;
    return static_cast<double>(part) / static_cast<double>(whole) * 100.0;
}

uint64_t non_negative(const std::string& name, int64_t value) {
    if (value < 0) {
        throw PersistenceCorrupt("Counter '" + name + "' is negative (" + std::to_string(value) + ")");
    }
    return static_cast<uint64_t>(value);
}

} // namespace

// -----------------------------------------------------------------------------
//  PlayerStats
// -----------------------------------------------------------------------------
double PlayerStats::vpip() const { return percentage(vpip_hands, hands_played); }
double PlayerStats::pfr() const { return percentage(pfr_hands, hands_played); }
double PlayerStats::three_bet() const { return percentage(three_bet_hands, three_bet_opportunities); }
double PlayerStats::cbet() const { return percentage(cbet_hands, cbet_opportunities); }
double PlayerStats::fold_to_cbet() const { return percentage(fold_to_cbet_hands, fold_to_cbet_opportunities); }
double PlayerStats::wtsd() const { return percentage(wtsd_hands, saw_flop_hands); }
double PlayerStats::wsd() const { return percentage(wsd_hands, wtsd_hands); }

double PlayerStats::aggression_factor() const {
    const uint64_t aggressive = postflop_bets + postflop_raises;
    if (postflop_calls == 0) {
        return aggressive > 0 ? 99.9 : 0.0;
    }
    return static_cast<double>(aggressive) / static_cast<double>(postflop_calls);
}

double PlayerStats::net_bb() const {
    return static_cast<double>(net_chips) / BB_SIZE;
}

double PlayerStats::bb_per_100() const {
    if (hands_played == 0) return 0.0;
    return net_bb() / static_cast<double>(hands_played) * 100.0;
}

std::vector<std::pair<std::string, int64_t>> PlayerStats::counters() const {
    std::vector<std::pair<std::string, int64_t>> out;
    for (const auto& f : unsigned_fields()) {
        out.emplace_back(f.name, static_cast<int64_t>(this->*(f.field)));
    }
    out.emplace_back(NET_CHIPS, net_chips);
    out.emplace_back(BIGGEST_POT_WON, static_cast<int64_t>(biggest_pot_won));
    out.emplace_back(BIGGEST_POT_LOST, static_cast<int64_t>(biggest_pot_lost));
    return out;
}

PlayerStats PlayerStats::from_counters(const std::map<std::string, int64_t>& values) {
    PlayerStats stats;
    for (const auto& f : unsigned_fields()) {
        auto it = values.find(f.name);
        if (it != values.end()) stats.*(f.field) = non_negative(f.name, it->second);
    }
    if (auto it = values.find(NET_CHIPS); it != values.end()) stats.net_chips = it->second;
    if (auto it = values.find(BIGGEST_POT_WON); it != values.end()) {
        stats.biggest_pot_won = non_negative(BIGGEST_POT_WON, it->second);
    }
    if (auto it = values.find(BIGGEST_POT_LOST); it != values.end()) {
        stats.biggest_pot_lost = non_negative(BIGGEST_POT_LOST, it->second);
    }
    return stats;
}

PlayerStats& PlayerStats::operator+=(const PlayerStats& other) {
    for (const auto& f : unsigned_fields()) {
        this->*(f.field) += other.*(f.field);
    }
    net_chips += other.net_chips;
    biggest_pot_won = std::max(biggest_pot_won, other.biggest_pot_won);
    biggest_pot_lost = std::max(biggest_pot_lost, other.biggest_pot_lost);
    return *this;
}

bool PlayerStats::operator==(const PlayerStats& other) const {
    return counters() == other.counters();
}

PlayerStats operator+(PlayerStats lhs, const PlayerStats& rhs) {
    lhs += rhs;
    return lhs;
}

const std::vector<StatDefinition>& stat_definitions() {
    static const std::vector<StatDefinition> defs = {
        {"VPIP", "Voluntarily Put $ In Pot", "% of hands with voluntary money in preflop (calls or raises, not blinds)"},
        {"PFR", "Pre-Flop Raise", "% of hands raised preflop. Close to VPIP for tight-aggressive play"},
        {"3Bet", "3-Bet Frequency", "% of re-raises when facing a single raise preflop"},
        {"Cbet", "Continuation Bet", "% of flop bets after raising preflop"},
        {"FCbet", "Fold to C-bet", "% of folds facing a continuation bet"},
        {"WTSD", "Went to Showdown", "% of hands reaching showdown after seeing the flop"},
        {"W$SD", "Won $ at Showdown", "% of showdowns won outright"},
        {"AF", "Aggression Factor", "(bets + raises) / calls over postflop actions"},
        {"BB/100", "Win Rate", "Big blinds won per 100 hands"},
    };
    return defs;
}

// -----------------------------------------------------------------------------
//  StatsAggregator
// -----------------------------------------------------------------------------
StatsAggregator::StatsAggregator(int hero_seat, PlayerStats lifetime_base)
    : hero_seat_(hero_seat),
      lifetime_base_(lifetime_base),
      session_{},
      session_recorded_(false),
      hand_open_(false),
      current_start_{},
      flags_{},
      preflop_raises_(0),
      preflop_aggressor_(-1),
      cbet_made_(false)
{
    validate_seat(hero_seat);
}

void StatsAggregator::validate_seat(int seat) const {
    if (seat < 0 || seat >= NUM_SEATS) throw std::out_of_range("Invalid seat " + std::to_string(seat));
}

void StatsAggregator::reset_hand_state() {
    flags_ = {};
    preflop_raises_ = 0;
    preflop_aggressor_ = -1;
    cbet_made_ = false;
}

void StatsAggregator::on_hand_start(const HandStart& start) {
    if (hand_open_) {
        spdlog::debug("Stats: main #{} abandonnée, drapeaux non validés", current_start_.hand_number);
    }
    reset_hand_state();
    current_start_ = start;
    hand_open_ = true;
}

void StatsAggregator::on_action(const ActionEvent& event) {
    const int seat = event.action.player_index;
    validate_seat(seat);

    record_aggression(event);
    if (!hand_open_) return; // pas de drapeaux de main hors d'une main ouverte

    if (event.street == Street::PREFLOP) {
        record_preflop(event);
    } else if (event.street == Street::FLOP) {
        record_flop(event);
    }
}

void StatsAggregator::record_aggression(const ActionEvent& event) {
    if (event.street == Street::PREFLOP) return;
    PlayerStats& stats = session_[event.action.player_index];
    switch (event.action.type) {
        case ActionType::BET:   ++stats.postflop_bets; break;
        case ActionType::RAISE: ++stats.postflop_raises; break;
        case ActionType::CALL:  ++stats.postflop_calls; break;
        default: break;
    }
}

void StatsAggregator::record_preflop(const ActionEvent& event) {
    const int seat = event.action.player_index;
    const ActionType type = event.action.type;
    HandFlags& flags = flags_[seat];

    // 3-bet : face à exactement une relance volontaire
    if (preflop_raises_ == 1 && preflop_aggressor_ != seat) {
        flags.three_bet_opportunity = true;
        if (event.action.is_aggressive()) flags.three_bet = true;
    }

    // Le bouton qui complète la small blind dans un pot non relevé ne compte pas
    const bool completes_blind = type == ActionType::CALL
                              && seat == current_start_.button_seat
                              && event.aggressions_before == 0;
    if ((type == ActionType::CALL && !completes_blind) || event.action.is_aggressive()) {
        flags.vpip = true;
    }
    if (event.action.is_aggressive()) {
        flags.pfr = true;
        ++preflop_raises_;
        preflop_aggressor_ = seat;
    }
}

void StatsAggregator::record_flop(const ActionEvent& event) {
    const int seat = event.action.player_index;
    HandFlags& flags = flags_[seat];

    if (seat == preflop_aggressor_) {
        // Premier passage de l'agresseur préflop, personne n'a encore misé
        if (!flags.cbet_opportunity && event.aggressions_before == 0) {
            flags.cbet_opportunity = true;
            if (event.action.is_aggressive()) {
                flags.cbet = true;
                cbet_made_ = true;
            }
        }
        return;
    }

    // Face au c-bet seul (aucune relance entre-temps)
    if (cbet_made_ && !flags.fold_to_cbet_opportunity && event.aggressions_before == 1) {
        flags.fold_to_cbet_opportunity = true;
        if (event.action.type == ActionType::FOLD) flags.fold_to_cbet = true;
    }
}

void StatsAggregator::on_hand_complete(const HandResult& result) {
    if (!hand_open_) {
        spdlog::warn("Stats: résultat de la main #{} reçu sans début de main", result.hand_number);
    }

    for (int seat = 0; seat < NUM_SEATS; ++seat) {
        PlayerStats& stats = session_[seat];
        const HandFlags& flags = flags_[seat];

        ++stats.hands_played;
        if (flags.vpip) ++stats.vpip_hands;
        if (flags.pfr) ++stats.pfr_hands;
        if (flags.three_bet_opportunity) ++stats.three_bet_opportunities;
        if (flags.three_bet) ++stats.three_bet_hands;
        if (flags.cbet_opportunity) ++stats.cbet_opportunities;
        if (flags.cbet) ++stats.cbet_hands;
        if (flags.fold_to_cbet_opportunity) ++stats.fold_to_cbet_opportunities;
        if (flags.fold_to_cbet) ++stats.fold_to_cbet_hands;

        if (result.saw_flop()) ++stats.saw_flop_hands;
        if (result.showdown) {
            ++stats.wtsd_hands;
            if (result.winner == seat) ++stats.wsd_hands;
        }

        stats.net_chips += result.net[seat];
        const uint64_t pot = static_cast<uint64_t>(result.pot);
        if (result.winner == seat) {
            stats.biggest_pot_won = std::max(stats.biggest_pot_won, pot);
        } else if (result.winner == opponent_of(seat)) {
            stats.biggest_pot_lost = std::max(stats.biggest_pot_lost, pot);
        }
    }

    spdlog::debug("Stats: main #{} enregistrée (gagnant {}, pot {}, showdown {})",
                  result.hand_number, result.winner, result.pot, result.showdown);
    reset_hand_state();
    hand_open_ = false;
}

void StatsAggregator::record_session_end() {
    if (session_recorded_) return;
    for (auto& stats : session_) ++stats.sessions;
    session_recorded_ = true;
}

StatsSnapshot StatsAggregator::snapshot() const {
    StatsSnapshot snap;
    snap.hero_seat = hero_seat_;
    snap.session = session_;
    snap.lifetime = get_lifetime_stats();
    return snap;
}

const PlayerStats& StatsAggregator::get_session_stats(int seat) const {
    validate_seat(seat);
    return session_[seat];
}

PlayerStats StatsAggregator::get_lifetime_stats() const {
    return lifetime_base_ + session_[hero_seat_];
}

} // namespace hu_poker
