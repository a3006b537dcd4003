#ifndef POKER_ODDS_ERRORS_H
#define POKER_ODDS_ERRORS_H

#include <stdexcept>
#include <string>

namespace poker_odds {

// La même carte (rang, couleur) apparaît deux fois parmi les cartes connues.
class DuplicateCardError : public std::invalid_argument {
public:
    explicit DuplicateCardError(const std::string& card)
        : std::invalid_argument("Duplicate card: " + card), card_(card) {}

    const std::string& card() const { return card_; }

private:
    std::string card_;
};

// Levée par l'échantillonneur quand le drapeau d'annulation est positionné.
class ComputationCancelled : public std::runtime_error {
public:
    ComputationCancelled() : std::runtime_error("Computation cancelled") {}
};

} // namespace poker_odds

#endif // POKER_ODDS_ERRORS_H
