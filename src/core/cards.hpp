#ifndef POKER_ODDS_CARDS_HPP
#define POKER_ODDS_CARDS_HPP

#include <cstdint>
#include <string>
#include <stdexcept> // Pour std::invalid_argument

namespace poker_odds {

constexpr int NUM_RANKS = 13;
constexpr int NUM_SUITS = 4;
constexpr int NUM_CARDS = 52;

// Enum pour les couleurs (suits)
enum class Suit : uint8_t { CLUBS = 0, DIAMONDS = 1, HEARTS = 2, SPADES = 3 };
// Enum pour les rangs (ranks), ordinal 0-12
enum class Rank : uint8_t {
    TWO = 0, THREE = 1, FOUR = 2, FIVE = 3, SIX = 4, SEVEN = 5, EIGHT = 6,
    NINE = 7, TEN = 8, JACK = 9, QUEEN = 10, KING = 11, ACE = 12
};

// Une carte est une simple valeur (rang, couleur) : égalité structurelle.
struct Card {
    Rank rank = Rank::TWO;
    Suit suit = Suit::CLUBS;

    constexpr bool operator==(const Card& other) const {
        return rank == other.rank && suit == other.suit;
    }
    constexpr bool operator!=(const Card& other) const { return !(*this == other); }

    // Ordre couleur puis rang, identique à l'index 0-51
    constexpr bool operator<(const Card& other) const {
        if (suit != other.suit) return static_cast<int>(suit) < static_cast<int>(other.suit);
        return static_cast<int>(rank) < static_cast<int>(other.rank);
    }
};

constexpr Card make_card(Rank r, Suit s) {
    return Card{r, s};
}

// Force du rang : 2..14 (As = 14)
constexpr int rank_value(Rank r) {
    return static_cast<int>(r) + 2;
}

// Format: index 0-51 = suit * 13 + rank
constexpr int card_index(Card c) {
    return static_cast<int>(c.suit) * NUM_RANKS + static_cast<int>(c.rank);
}

Card card_from_index(int index);

// Fonctions de conversion string <-> Card/Rank/Suit
std::string to_string(Suit s);
std::string to_string(Rank r);
std::string to_string(Card c);

Card card_from_string(const std::string& s);
Rank rank_from_char(char r);
Suit suit_from_char(char s);

} // namespace poker_odds

#endif // POKER_ODDS_CARDS_HPP
