#ifndef POKER_ODDS_CORE_DECK_HPP
#define POKER_ODDS_CORE_DECK_HPP

#include "core/cards.hpp"
#include <cstddef>
#include <random>
#include <vector>

namespace poker_odds {

// Les 52 cartes, couleurs puis rangs (2c 3c ... Ac 2d ... As).
std::vector<Card> full_deck();

// full_deck() moins les cartes connues, dans le même ordre.
// Lance DuplicateCardError si `known` contient deux fois la même carte.
std::vector<Card> remaining_deck(const std::vector<Card>& known);

// Paquet de tirage pour l'échantillonnage : chaque draw() renvoie le préfixe
// d'une nouvelle permutation aléatoire uniforme.
class Deck {
public:
    explicit Deck(std::vector<Card> cards);
    ~Deck() = default;

    // Tire k cartes sans remise (Fisher-Yates partiel sur les k premières positions).
    const std::vector<Card>& draw(std::size_t k, std::mt19937& rng);

    std::size_t size() const { return cards_.size(); }

private:
    std::vector<Card> cards_;
    std::vector<Card> drawn_;
};

} // namespace poker_odds

#endif // POKER_ODDS_CORE_DECK_HPP
