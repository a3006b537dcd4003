#ifndef POKER_ODDS_MONTE_CARLO_HPP
#define POKER_ODDS_MONTE_CARLO_HPP

#include "core/cards.hpp"
#include "poker_odds/probability_distribution.h"
#include <atomic>
#include <random>
#include <vector>

namespace poker_odds {

constexpr int DEFAULT_MONTE_CARLO_ITERATIONS = 10000;

/**
 * @brief Estime la distribution des catégories par tirages aléatoires.
 *
 * Chaque essai tire `missing_count` cartes sans remise dans le paquet restant
 * (hors cartes connues), évalue la main complète et incrémente son compteur.
 * Même graine => même résultat, bit pour bit.
 *
 * @param cancel Drapeau optionnel, consulté entre deux essais.
 * @throws std::invalid_argument si iterations <= 0 ou missing_count < 1.
 * @throws ComputationCancelled si *cancel devient vrai en cours de route.
 */
CategoryCounts sample_category_counts(const std::vector<Card>& hole_cards,
                                      const std::vector<Card>& known_community,
                                      int missing_count,
                                      int iterations,
                                      std::mt19937& rng,
                                      const std::atomic<bool>* cancel = nullptr);

ProbabilityDistribution sample_distribution(const std::vector<Card>& hole_cards,
                                            const std::vector<Card>& known_community,
                                            int missing_count,
                                            int iterations,
                                            std::mt19937& rng,
                                            const std::atomic<bool>* cancel = nullptr);

} // namespace poker_odds

#endif // POKER_ODDS_MONTE_CARLO_HPP
