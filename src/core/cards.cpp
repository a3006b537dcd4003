#include "core/cards.hpp"
#include <cctype>
#include <stdexcept>
#include <string>

namespace poker_odds {

namespace {
// Caractères indexés par l'ordinal du rang / de la couleur
constexpr char RANK_CHARS[] = "23456789TJQKA";
constexpr char SUIT_CHARS[] = "cdhs";
} // namespace

Card card_from_index(int index) {
    if (index < 0 || index >= NUM_CARDS) {
        throw std::out_of_range("Card index out of range: " + std::to_string(index));
    }
    return make_card(static_cast<Rank>(index % NUM_RANKS), static_cast<Suit>(index / NUM_RANKS));
}

Rank rank_from_char(char r) {
    const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(r)));
    for (int i = 0; i < NUM_RANKS; ++i) {
        if (RANK_CHARS[i] == upper) return static_cast<Rank>(i);
    }
    throw std::invalid_argument("Invalid rank character: " + std::string(1, r));
}

Suit suit_from_char(char s) {
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(s)));
    for (int i = 0; i < NUM_SUITS; ++i) {
        if (SUIT_CHARS[i] == lower) return static_cast<Suit>(i);
    }
    throw std::invalid_argument("Invalid suit character: " + std::string(1, s));
}

std::string to_string(Rank r) {
    const int i = static_cast<int>(r);
    if (i < 0 || i >= NUM_RANKS) return "?";
    return std::string(1, RANK_CHARS[i]);
}

std::string to_string(Suit s) {
    const int i = static_cast<int>(s);
    if (i < 0 || i >= NUM_SUITS) return "?";
    return std::string(1, SUIT_CHARS[i]);
}

std::string to_string(Card c) {
    return to_string(c.rank) + to_string(c.suit);
}

Card card_from_string(const std::string& s) {
    // "Td" ou "10d"
    std::string rank_part;
    if (s.length() == 2) {
        rank_part = s.substr(0, 1);
    } else if (s.length() == 3 && s.compare(0, 2, "10") == 0) {
        rank_part = "T";
    } else {
        throw std::invalid_argument("Invalid card string format: '" + s + "'. Expected 'Rs'.");
    }
    try {
        Rank r = rank_from_char(rank_part[0]);
        Suit su = suit_from_char(s.back());
        return make_card(r, su);
    } catch (const std::invalid_argument& e) {
        // Propage l'erreur avec plus de contexte
        throw std::invalid_argument("Invalid card string '" + s + "': " + e.what());
    }
}

} // namespace poker_odds
