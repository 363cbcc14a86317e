// Ne pas utiliser Catch2::Catch2WithMain : nous définissons notre propre main
#include <catch2/catch_session.hpp> // Pour Catch::Session
#include <spdlog/spdlog.h>          // Pour spdlog

int main( int argc, char* argv[] ) {
    // Les tests ne montrent que les avertissements et erreurs
    spdlog::set_level(spdlog::level::warn);

    // Initialisation de Catch2
    Catch::Session session;

    // Lancer la session de tests Catch2
    int result = session.run( argc, argv );

    return result;
}
