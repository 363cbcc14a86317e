#ifndef HU_ERRORS_H
#define HU_ERRORS_H

#include <stdexcept>
#include <string>

namespace hu_poker {

// Action hors de l'ensemble légal. L'état du moteur reste inchangé.
class IllegalAction : public std::logic_error {
public:
    explicit IllegalAction(const std::string& what) : std::logic_error(what) {}
};

// Paramètres de démarrage invalides. Fatal avant de jouer.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// Fichier de stats illisible ou mal formé. Récupéré par le store.
class PersistenceCorrupt : public std::runtime_error {
public:
    explicit PersistenceCorrupt(const std::string& what) : std::runtime_error(what) {}
};

} // namespace hu_poker

#endif // HU_ERRORS_H
