#ifndef POKER_ODDS_HAND_CATEGORY_H
#define POKER_ODDS_HAND_CATEGORY_H

#include <array>
#include <cstddef>
#include <string>

namespace poker_odds {

// Catégories de main, de la plus faible à la plus forte.
enum class HandCategory {
    HIGH_CARD = 0,
    PAIR,
    TWO_PAIR,
    THREE_OF_A_KIND,
    STRAIGHT,
    FLUSH,
    FULL_HOUSE,
    FOUR_OF_A_KIND,
    STRAIGHT_FLUSH,
    ROYAL_FLUSH
};

constexpr std::size_t NUM_HAND_CATEGORIES = 10;

constexpr std::array<HandCategory, NUM_HAND_CATEGORIES> ALL_HAND_CATEGORIES = {
    HandCategory::HIGH_CARD,      HandCategory::PAIR,           HandCategory::TWO_PAIR,
    HandCategory::THREE_OF_A_KIND, HandCategory::STRAIGHT,      HandCategory::FLUSH,
    HandCategory::FULL_HOUSE,     HandCategory::FOUR_OF_A_KIND, HandCategory::STRAIGHT_FLUSH,
    HandCategory::ROYAL_FLUSH
};

constexpr std::size_t category_index(HandCategory c) {
    return static_cast<std::size_t>(c);
}

std::string hand_category_to_string(HandCategory c);

} // namespace poker_odds

#endif // POKER_ODDS_HAND_CATEGORY_H
