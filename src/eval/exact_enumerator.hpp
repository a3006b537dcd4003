#ifndef POKER_ODDS_EXACT_ENUMERATOR_HPP
#define POKER_ODDS_EXACT_ENUMERATOR_HPP

#include "core/cards.hpp"
#include "poker_odds/probability_distribution.h"
#include <vector>

namespace poker_odds {

constexpr int NUM_HOLE_CARDS = 2;
constexpr int NUM_BOARD_CARDS = 5;

/**
 * @brief Concatène cartes privées et cartes communes connues.
 * @throws std::invalid_argument si hole_cards n'a pas exactement 2 cartes.
 * @throws DuplicateCardError si une carte apparaît deux fois.
 */
std::vector<Card> combine_known_cards(const std::vector<Card>& hole_cards,
                                      const std::vector<Card>& known_community);

/**
 * @brief Évalue chaque complétion possible des `missing_count` cartes manquantes.
 *        counts.total == C(taille du paquet restant, missing_count).
 * @throws std::invalid_argument si missing_count n'est pas 1 ou 2.
 */
CategoryCounts enumerate_category_counts(const std::vector<Card>& hole_cards,
                                         const std::vector<Card>& known_community,
                                         int missing_count);

ProbabilityDistribution exact_distribution(const std::vector<Card>& hole_cards,
                                           const std::vector<Card>& known_community,
                                           int missing_count);

} // namespace poker_odds

#endif // POKER_ODDS_EXACT_ENUMERATOR_HPP
