#ifndef HU_STATS_STORE_H
#define HU_STATS_STORE_H

#include <iosfwd>
#include <string>

#include "hu/stats_aggregator.h"

namespace hu_poker {

enum class LoadStatus {
    OK,
    MISSING,  // premier lancement : compteurs à zéro
    CORRUPT   // fichier illisible ou mal formé : compteurs à zéro
};

struct LoadResult {
    PlayerStats stats;
    LoadStatus status = LoadStatus::MISSING;
    std::string message;
};

/**
 * Persistance des compteurs à vie dans un fichier texte :
 *
 *   # heads_up_poker stats v1
 *   hands_played<TAB>42
 *   ...
 *
 * Le chargement ne lance jamais : un fichier absent ou corrompu donne des
 * compteurs à zéro (avec un avertissement pour le second cas).
 */
class StatsStore {
public:
    static constexpr const char* HEADER = "# heads_up_poker stats v1";

    explicit StatsStore(std::string path);

    LoadResult load() const;
    // false (et log d'erreur) si l'écriture échoue ; jamais fatal
    bool save(const PlayerStats& stats) const;

    const std::string& get_path() const { return path_; }

    // $XDG_DATA_HOME/heads_up_poker/stats.tsv, sinon $HOME/.local/share/..., sinon ./stats.tsv
    static std::string default_path();
    static std::string default_path(const char* xdg_data_home, const char* home);

    // Lance PersistenceCorrupt sur toute ligne mal formée
    static PlayerStats parse(std::istream& in);
    static void write(std::ostream& out, const PlayerStats& stats);

private:
    std::string path_;
};

} // namespace hu_poker

#endif // HU_STATS_STORE_H
