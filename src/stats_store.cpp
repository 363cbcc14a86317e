#include "hu/stats_store.h"
#include "hu/errors.h"
#include "spdlog/spdlog.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace hu_poker {

namespace {

constexpr const char* APP_DIR = "heads_up_poker";
constexpr const char* STATS_FILE = "stats.tsv";

int64_t parse_value(const std::string& text, long line_number) {
    size_t consumed = 0;
    int64_t value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception& e) {
        throw PersistenceCorrupt("Line " + std::to_string(line_number) + ": cannot parse value '" + text + "' ("
                                 + e.what() + ")");
    }
    if (consumed != text.size()) {
        throw PersistenceCorrupt("Line " + std::to_string(line_number) + ": trailing characters in '" + text + "'");
    }
    return value;
}

} // namespace

StatsStore::StatsStore(std::string path)
    : path_(std::move(path))
{
    if (path_.empty()) path_ = default_path();
}

std::string StatsStore::default_path() {
    return default_path(std::getenv("XDG_DATA_HOME"), std::getenv("HOME"));
}

std::string StatsStore::default_path(const char* xdg_data_home, const char* home) {
    namespace fs = std::filesystem;
    if (xdg_data_home && *xdg_data_home) {
        return (fs::path(xdg_data_home) / APP_DIR / STATS_FILE).string();
    }
    if (home && *home) {
        return (fs::path(home) / ".local" / "share" / APP_DIR / STATS_FILE).string();
    }
    return (fs::path(".") / STATS_FILE).string();
}

// --- Format texte ---

PlayerStats StatsStore::parse(std::istream& in) {
    std::string line;
    long line_count = 0;
    bool header_seen = false;
    std::map<std::string, int64_t> values;

    while (std::getline(in, line)) {
        line_count++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        if (!header_seen) {
            if (line != HEADER) {
                throw PersistenceCorrupt("Missing or unknown header: '" + line + "'");
            }
            header_seen = true;
            continue;
        }
        if (line[0] == '#') continue; // commentaire

        // nom<TAB>valeur
        std::stringstream ss_line(line);
        std::string segment;
        std::vector<std::string> parts;
        while (std::getline(ss_line, segment, '\t')) {
            parts.push_back(segment);
        }
        if (parts.size() != 2 || parts[0].empty()) {
            throw PersistenceCorrupt("Line " + std::to_string(line_count) + ": expected 'name<TAB>value', got '"
                                     + line + "'");
        }
        if (values.count(parts[0])) {
            throw PersistenceCorrupt("Line " + std::to_string(line_count) + ": duplicate counter '" + parts[0] + "'");
        }
        values[parts[0]] = parse_value(parts[1], line_count);
    }

    if (in.bad()) throw PersistenceCorrupt("Read error");
    if (!header_seen) throw PersistenceCorrupt("Empty stats file");
    return PlayerStats::from_counters(values);
}

void StatsStore::write(std::ostream& out, const PlayerStats& stats) {
    out << HEADER << "\n";
    for (const auto& [name, value] : stats.counters()) {
        out << name << "\t" << value << "\n";
    }
}

// --- Chargement / sauvegarde ---

LoadResult StatsStore::load() const {
    LoadResult result;
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        spdlog::info("Aucun fichier de stats ({}), compteurs à zéro", path_);
        result.status = LoadStatus::MISSING;
        return result;
    }

    std::ifstream infile(path_);
    if (!infile.is_open()) {
        result.status = LoadStatus::CORRUPT;
        result.message = "cannot open " + path_;
        spdlog::warn("Impossible d'ouvrir le fichier de stats {}: compteurs à zéro", path_);
        return result;
    }

    try {
        result.stats = parse(infile);
        result.status = LoadStatus::OK;
        spdlog::info("Stats chargées depuis {} ({} mains)", path_, result.stats.hands_played);
    } catch (const PersistenceCorrupt& e) {
        result.stats = PlayerStats{};
        result.status = LoadStatus::CORRUPT;
        result.message = e.what();
        spdlog::warn("Fichier de stats corrompu {}: {}. Compteurs à zéro.", path_, e.what());
    }
    return result;
}

bool StatsStore::save(const PlayerStats& stats) const {
    namespace fs = std::filesystem;
    const fs::path path(path_);
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            spdlog::error("Impossible de créer le dossier {}: {}", path.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream outfile(path_);
    if (!outfile.is_open()) {
        spdlog::error("Impossible d'ouvrir le fichier de sauvegarde : {}", path_);
        return false;
    }
    write(outfile, stats);
    outfile.close();
    if (outfile.fail()) {
        spdlog::error("Erreur lors de l'écriture ou de la fermeture du fichier : {}", path_);
        return false;
    }
    spdlog::info("Stats sauvegardées dans {}", path_);
    return true;
}

} // namespace hu_poker
