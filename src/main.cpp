#include "hu/common_types.h"
#include "hu/errors.h"
#include "hu/game_utils.hpp"
#include "hu/session.h"
#include "hu/stats_store.h"
#include "spdlog/spdlog.h"
#include "fmt/format.h"

#include <iostream>   // std::cin
#include <string>     // std::string
#include <sstream>    // std::istringstream
#include <optional>   // std::optional
#include <exception>  // std::exception

#ifndef HU_POKER_VERSION
#define HU_POKER_VERSION "dev"
#endif

namespace {

using namespace hu_poker;

constexpr int EXIT_USAGE = 2;

void print_usage(const char* prog) {
    fmt::print("Usage: {} [options]\n", prog);
    fmt::print("Heads-up No-Limit Hold'em against a rule-based bot.\n\n");
    fmt::print("  --stack N          Starting stack in big blinds (default: 100)\n");
    fmt::print("  --aggression X     Bot aggression in [0, 1] (default: 0.5)\n");
    fmt::print("  --seed N           RNG seed for reproducible sessions\n");
    fmt::print("  --stats-file PATH  Lifetime stats file (default: {})\n", StatsStore::default_path());
    fmt::print("  --verbose          Debug logging\n");
    fmt::print("  --help             Show this help\n");
    fmt::print("  --version          Show version\n");
}

int parse_int(const std::string& flag, const std::string& text) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(flag + ": not an integer: '" + text + "'");
    }
    if (consumed != text.size()) throw ConfigError(flag + ": not an integer: '" + text + "'");
    return value;
}

double parse_double(const std::string& flag, const std::string& text) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(flag + ": not a number: '" + text + "'");
    }
    if (consumed != text.size()) throw ConfigError(flag + ": not a number: '" + text + "'");
    return value;
}

uint32_t parse_seed(const std::string& text) {
    size_t consumed = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("--seed: not an unsigned integer: '" + text + "'");
    }
    if (consumed != text.size() || value > 0xFFFFFFFFull) {
        throw ConfigError("--seed: not a 32-bit unsigned integer: '" + text + "'");
    }
    return static_cast<uint32_t>(value);
}

// ─────────────────────────────────────────────────────────────
// Affichage
// ─────────────────────────────────────────────────────────────
std::string seat_name(int seat) {
    return seat == Session::HUMAN_SEAT ? "You" : "Bot";
}

void print_table(const TableSnapshot& snap) {
    fmt::print("\n── Hand #{} · {} · Pot {} ──\n", snap.hand_number, street_to_string(snap.street), snap.pot);
    fmt::print("Board: {}\n", vec_to_string(snap.board));
    for (int seat = 0; seat < NUM_SEATS; ++seat) {
        const SeatView& s = snap.seats[seat];
        fmt::print("  {:<4}({:<3}) stack {:>6}  bet {:>5}  {}{}{}\n", seat_name(seat), position_to_string(s.position),
                   s.stack, s.bet, s.hole_cards.empty() ? "[?? ??]" : vec_to_string(s.hole_cards),
                   s.folded ? " folded" : "", s.all_in ? " ALL-IN" : "");
    }
}

void print_result(const TableSnapshot& snap) {
    if (!snap.result) return;
    const HandResult& r = *snap.result;
    if (r.showdown) {
        print_table(snap);
        for (int seat = 0; seat < NUM_SEATS; ++seat) {
            if (r.best_hand[seat]) fmt::print("  {}: {}\n", seat_name(seat), r.best_hand[seat]->describe());
        }
    }
    if (r.uncalled_returned > 0) fmt::print("Uncalled bet of {} returned.\n", r.uncalled_returned);
    if (r.winner < 0) {
        fmt::print("Split pot ({} chips).\n", r.pot);
    } else {
        fmt::print("{} win{} {} chips{}.\n", seat_name(r.winner), r.winner == Session::HUMAN_SEAT ? "" : "s",
                   r.pot, r.showdown ? " at showdown" : "");
    }
}

void on_snapshot(const TableSnapshot& snap) {
    if (snap.last_action && snap.last_action->hand_number == snap.hand_number) {
        const ActionEvent& ev = *snap.last_action;
        if (ev.action.player_index == Session::BOT_SEAT) {
            fmt::print("Bot: {}{}\n", action_to_string(ev.action), ev.all_in ? " (all-in)" : "");
        }
    }
    if (snap.hand_over) {
        print_result(snap);
    } else if (snap.to_act == Session::HUMAN_SEAT) {
        print_table(snap);
    }
}

void print_stats(const StatsSnapshot& stats) {
    auto line = [](const char* label, const PlayerStats& s) {
        fmt::print("{:<9} hands {:>5}  VPIP {:5.1f}  PFR {:5.1f}  3Bet {:5.1f}  Cbet {:5.1f}  FCbet {:5.1f}  "
                   "WTSD {:5.1f}  W$SD {:5.1f}  AF {:4.1f}  BB/100 {:7.2f}\n",
                   label, s.hands_played, s.vpip(), s.pfr(), s.three_bet(), s.cbet(), s.fold_to_cbet(),
                   s.wtsd(), s.wsd(), s.aggression_factor(), s.bb_per_100());
    };
    fmt::print("\n");
    line("You", stats.session[Session::HUMAN_SEAT]);
    line("Bot", stats.session[Session::BOT_SEAT]);
    line("Lifetime", stats.lifetime);
    fmt::print("Biggest pot won {} / lost {}, sessions {}\n", stats.lifetime.biggest_pot_won,
               stats.lifetime.biggest_pot_lost, stats.lifetime.sessions);
}

// ─────────────────────────────────────────────────────────────
// Commandes
// ─────────────────────────────────────────────────────────────
enum class Command { ACTION, STATS, QUIT, INVALID };

struct ParsedCommand {
    Command command = Command::INVALID;
    Action action;
    std::string error;
};

ParsedCommand parse_command(const std::string& line, const LegalActions& legal) {
    ParsedCommand parsed;
    std::istringstream in(line);
    std::string verb;
    in >> verb;
    parsed.action.player_index = legal.player_index;

    if (verb == "q") { parsed.command = Command::QUIT; return parsed; }
    if (verb == "s") { parsed.command = Command::STATS; return parsed; }

    parsed.command = Command::ACTION;
    if (verb == "f") {
        parsed.action.type = ActionType::FOLD;
    } else if (verb == "k") {
        parsed.action.type = ActionType::CHECK;
    } else if (verb == "c") {
        parsed.action.type = ActionType::CALL;
    } else if (verb == "b" || verb == "r") {
        int amount = 0;
        if (!(in >> amount)) {
            parsed.command = Command::INVALID;
            parsed.error = "Missing amount (e.g. '" + verb + " 6')";
            return parsed;
        }
        parsed.action.type = verb == "b" ? ActionType::BET : ActionType::RAISE;
        parsed.action.amount = amount;
    } else if (verb == "a") {
        if (legal.can_bet || legal.can_raise) {
            parsed.action.type = legal.can_bet ? ActionType::BET : ActionType::RAISE;
            parsed.action.amount = legal.max_to;
        } else {
            parsed.action.type = ActionType::CALL;
        }
    } else {
        parsed.command = Command::INVALID;
        parsed.error = "Unknown command '" + verb + "'";
    }
    return parsed;
}

// false si l'utilisateur quitte
bool play_hand(Session& session) {
    session.start_hand();
    std::string line;
    while (session.is_human_turn()) {
        const LegalActions legal = session.get_state().get_legal_actions();
        fmt::print("Your move [{}]  (f k c b N r N a s q) > ", legal_actions_to_string(legal));
        std::cout.flush();
        if (!std::getline(std::cin, line)) return false;

        const ParsedCommand parsed = parse_command(line, legal);
        switch (parsed.command) {
            case Command::QUIT:
                return false;
            case Command::STATS:
                print_stats(session.get_stats().snapshot());
                break;
            case Command::INVALID:
                fmt::print("{}\n", parsed.error);
                break;
            case Command::ACTION:
                try {
                    session.apply_human_action(parsed.action);
                } catch (const IllegalAction& e) {
                    fmt::print("Illegal action: {}\n", e.what());
                }
                break;
        }
    }
    return true;
}

} // namespace

int main(int argc, char* argv[])
{
    // ─────────────────────────────────────────────────────────────
    // Paramètres
    // ─────────────────────────────────────────────────────────────
    Config config;
    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw ConfigError(arg + " expects a value");
                return argv[++i];
            };
            if (arg == "--stack") {
                config.starting_stack_bb = parse_int(arg, next());
            } else if (arg == "--aggression") {
                config.aggression = parse_double(arg, next());
            } else if (arg == "--seed") {
                config.seed = parse_seed(next());
            } else if (arg == "--stats-file") {
                config.stats_file = next();
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--version") {
                fmt::print("heads_up_poker {}\n", HU_POKER_VERSION);
                return 0;
            } else {
                fmt::print(stderr, "Unknown option: {}\n", arg);
                print_usage(argv[0]);
                return EXIT_USAGE;
            }
        }
        validate_config(config);
    } catch (const ConfigError& e) {
        fmt::print(stderr, "Configuration error: {}\n", e.what());
        return EXIT_USAGE;
    }

    // ─────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────
    spdlog::set_level(config.verbose ? spdlog::level::debug : spdlog::level::warn);
    spdlog::info("Démarrage de heads_up_poker {}", HU_POKER_VERSION);

    try
    {
        StatsStore store(config.stats_file);
        const LoadResult loaded = store.load();
        if (loaded.status == LoadStatus::CORRUPT) {
            fmt::print("Warning: stats file {} unreadable ({}), starting from zero.\n", store.get_path(),
                       loaded.message);
        }

        Session session(config, loaded.stats);
        session.set_snapshot_listener(on_snapshot);
        fmt::print("Heads-up NLHE · {} BB stacks · bot aggression {:.2f} · seed {}\n",
                   config.starting_stack_bb, config.aggression, session.get_seed());

        bool keep_playing = true;
        while (keep_playing && !session.is_session_over()) {
            keep_playing = play_hand(session);
            if (!keep_playing || session.is_session_over()) break;

            fmt::print("Enter for next hand, s for stats, q to quit > ");
            std::cout.flush();
            std::string line;
            while (std::getline(std::cin, line) && line == "s") {
                print_stats(session.get_stats().snapshot());
                fmt::print("Enter for next hand, q to quit > ");
                std::cout.flush();
            }
            if (!std::cin || line == "q") keep_playing = false;
        }

        if (session.is_session_over()) {
            const auto& st = session.get_state();
            fmt::print("\n{} busted.\n", st.get_player_stack(Session::HUMAN_SEAT) == 0 ? "You" : "The bot");
        }

        session.end_session();
        const StatsSnapshot stats = session.get_stats().snapshot();
        print_stats(stats);
        if (!store.save(stats.lifetime)) {
            fmt::print("Warning: could not save stats to {}\n", store.get_path());
        }
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur fatale : {}", e.what());
        return 1;
    }

    return 0;
}
