#ifndef POKER_ODDS_HAND_EVALUATOR_HPP
#define POKER_ODDS_HAND_EVALUATOR_HPP

#include <cstdint>
#include <vector>

#include "core/cards.hpp"
#include "poker_odds/hand_category.h"

namespace poker_odds {

// Résultat détaillé d'une évaluation.
struct HandEvaluation {
    HandCategory category = HandCategory::HIGH_CARD;
    // Carte haute (2..14) de la quinte retenue, 0 si la catégorie n'est pas une quinte.
    int straight_high = 0;
};

/**
 * @brief Classe un ensemble de 5 à 7 cartes dans sa meilleure catégorie.
 * @param cards 5 à 7 cartes distinctes, dans n'importe quel ordre.
 * @throws std::invalid_argument si la taille est hors de [5, 7].
 * @throws DuplicateCardError si une carte apparaît deux fois.
 */
HandCategory evaluate(const std::vector<Card>& cards);

/**
 * @brief Comme evaluate(), avec en plus la carte haute de la quinte.
 */
HandEvaluation analyze_hand(const std::vector<Card>& cards);

/**
 * @brief Cherche la meilleure quinte dans un masque de rangs (bit i = ordinal i).
 *        L'As compte aussi comme 1 (roue A-2-3-4-5).
 * @return La force (5..14) de la carte haute de la quinte la plus haute, 0 sinon.
 */
int find_straight_high(uint16_t rank_mask);

} // namespace poker_odds

#endif // POKER_ODDS_HAND_EVALUATOR_HPP
