#include "eval/exact_enumerator.hpp"
#include "core/bitboard.hpp"
#include "core/deck.hpp"
#include "eval/combinations.hpp"
#include "eval/hand_evaluator.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace poker_odds {

std::vector<Card> combine_known_cards(const std::vector<Card>& hole_cards,
                                      const std::vector<Card>& known_community) {
    if (hole_cards.size() != NUM_HOLE_CARDS) {
        throw std::invalid_argument("Exactly 2 hole cards are required, got " +
                                    std::to_string(hole_cards.size()) + ".");
    }
    std::vector<Card> known = hole_cards;
    known.insert(known.end(), known_community.begin(), known_community.end());
    cards_to_board(known); // DuplicateCardError si doublon
    return known;
}

CategoryCounts enumerate_category_counts(const std::vector<Card>& hole_cards,
                                         const std::vector<Card>& known_community,
                                         int missing_count) {
    if (missing_count < 1 || missing_count > 2) {
        throw std::invalid_argument("Exact enumeration supports 1 or 2 missing cards, got " +
                                    std::to_string(missing_count) + ".");
    }
    const std::vector<Card> known = combine_known_cards(hole_cards, known_community);
    const std::vector<Card> remaining = remaining_deck(known);

    CategoryCounts counts;
    std::vector<Card> hand = known;
    hand.resize(known.size() + missing_count);

    const uint64_t visited = for_each_combination(remaining, static_cast<std::size_t>(missing_count),
        [&](const std::vector<Card>& combo) {
            std::copy(combo.begin(), combo.end(), hand.begin() + known.size());
            counts.add(evaluate(hand));
        });

    spdlog::trace("Enumeration exacte : {} combinaisons de {} cartes parmi {}.",
                  visited, missing_count, remaining.size());
    return counts;
}

ProbabilityDistribution exact_distribution(const std::vector<Card>& hole_cards,
                                           const std::vector<Card>& known_community,
                                           int missing_count) {
    return ProbabilityDistribution::from_counts(
        enumerate_category_counts(hole_cards, known_community, missing_count));
}

} // namespace poker_odds
