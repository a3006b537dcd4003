// ─────────────────────────────────────────────────────────────────────────────
//  src/eval/hand_evaluator.cpp
//  Classement d'une main de 5 à 7 cartes dans l'une des dix catégories.
//  Comptage par tableaux fixes (13 rangs, 4 couleurs), détection des quintes
//  sur un masque de rangs.
// ─────────────────────────────────────────────────────────────────────────────
#include "eval/hand_evaluator.hpp"
#include "core/bitboard.hpp"
#include "core/cards.hpp"
#include <array>
#include <stdexcept>
#include <string>

namespace poker_odds {

int find_straight_high(uint16_t rank_mask) {
    // Bit v = force v présente (2..14), l'As occupe aussi le bit 1
    uint32_t values = static_cast<uint32_t>(rank_mask & 0x1FFF) << 2;
    if (rank_mask & (1u << static_cast<int>(Rank::ACE))) {
        values |= 1u << 1;
    }
    constexpr uint32_t RUN_OF_FIVE = 0x1F;
    for (int high = 14; high >= 5; --high) {
        const uint32_t window = RUN_OF_FIVE << (high - 4);
        if ((values & window) == window) {
            return high;
        }
    }
    return 0;
}

HandEvaluation analyze_hand(const std::vector<Card>& cards) {
    if (cards.size() < 5 || cards.size() > 7) {
        throw std::invalid_argument("Hand evaluation requires 5 to 7 cards, got " +
                                    std::to_string(cards.size()) + ".");
    }
    cards_to_board(cards); // DuplicateCardError si doublon

    std::array<int, NUM_RANKS> rank_counts{};
    std::array<int, NUM_SUITS> suit_counts{};
    std::array<uint16_t, NUM_SUITS> suit_rank_masks{};
    uint16_t rank_mask = 0;

    for (const Card& c : cards) {
        const int r = static_cast<int>(c.rank);
        const int s = static_cast<int>(c.suit);
        rank_counts[r]++;
        suit_counts[s]++;
        suit_rank_masks[s] |= static_cast<uint16_t>(1u << r);
        rank_mask |= static_cast<uint16_t>(1u << r);
    }

    // Avec 7 cartes au plus, une seule couleur peut atteindre 5
    int flush_suit = -1;
    for (int s = 0; s < NUM_SUITS; ++s) {
        if (suit_counts[s] >= 5) {
            flush_suit = s;
            break;
        }
    }

    if (flush_suit >= 0) {
        const int sf_high = find_straight_high(suit_rank_masks[flush_suit]);
        // 10-J-Q-K-A dans la couleur <=> quinte flush à l'As
        if (sf_high == rank_value(Rank::ACE)) {
            return {HandCategory::ROYAL_FLUSH, sf_high};
        }
        if (sf_high > 0) {
            return {HandCategory::STRAIGHT_FLUSH, sf_high};
        }
    }

    bool four_of_a_kind = false;
    int trips_groups = 0; // groupes de trois cartes ou plus
    int pair_count = 0;   // groupes d'exactement deux cartes
    for (int count : rank_counts) {
        if (count == 4) four_of_a_kind = true;
        if (count >= 3) trips_groups++;
        if (count == 2) pair_count++;
    }

    if (four_of_a_kind) {
        return {HandCategory::FOUR_OF_A_KIND, 0};
    }
    // Un second brelan fournit la paire du full
    if (trips_groups >= 1 && (pair_count >= 1 || trips_groups >= 2)) {
        return {HandCategory::FULL_HOUSE, 0};
    }
    if (flush_suit >= 0) {
        return {HandCategory::FLUSH, 0};
    }
    const int straight_high = find_straight_high(rank_mask);
    if (straight_high > 0) {
        return {HandCategory::STRAIGHT, straight_high};
    }
    if (trips_groups >= 1) {
        return {HandCategory::THREE_OF_A_KIND, 0};
    }
    if (pair_count >= 2) {
        return {HandCategory::TWO_PAIR, 0};
    }
    if (pair_count == 1) {
        return {HandCategory::PAIR, 0};
    }
    return {HandCategory::HIGH_CARD, 0};
}

HandCategory evaluate(const std::vector<Card>& cards) {
    return analyze_hand(cards).category;
}

std::string hand_category_to_string(HandCategory c) {
    switch (c) {
        case HandCategory::HIGH_CARD:       return "High Card";
        case HandCategory::PAIR:            return "Pair";
        case HandCategory::TWO_PAIR:        return "Two Pair";
        case HandCategory::THREE_OF_A_KIND: return "Three of a Kind";
        case HandCategory::STRAIGHT:        return "Straight";
        case HandCategory::FLUSH:           return "Flush";
        case HandCategory::FULL_HOUSE:      return "Full House";
        case HandCategory::FOUR_OF_A_KIND:  return "Four of a Kind";
        case HandCategory::STRAIGHT_FLUSH:  return "Straight Flush";
        case HandCategory::ROYAL_FLUSH:     return "Royal Flush";
        default:                            return "Unknown";
    }
}

} // namespace poker_odds
