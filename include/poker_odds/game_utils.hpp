#ifndef POKER_ODDS_GAME_UTILS_HPP
#define POKER_ODDS_GAME_UTILS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/cards.hpp" // Pour Card et to_string(Card)

namespace poker_odds {

// "[As Kd]"
std::string vec_to_string(const std::vector<Card>& cards);
// Emplacements du board, "--" pour un emplacement vide : "[Ah Kd 7c -- --]"
std::string slots_to_string(const std::vector<std::optional<Card>>& slots);

// Taille du pot saisie par l'utilisateur. Texte vide, non numérique,
// partiellement numérique, non fini ou négatif => 0.0.
double parse_pot_size(const std::string& text);

// Graine de --seed : entier décimal non signé sur 32 bits, sinon std::invalid_argument.
uint32_t parse_seed(const std::string& text);

} // namespace poker_odds

#endif // POKER_ODDS_GAME_UTILS_HPP
