#include "eval/monte_carlo.hpp"
#include "core/deck.hpp"
#include "eval/exact_enumerator.hpp" // combine_known_cards
#include "eval/hand_evaluator.hpp"
#include "poker_odds/errors.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace poker_odds {

CategoryCounts sample_category_counts(const std::vector<Card>& hole_cards,
                                      const std::vector<Card>& known_community,
                                      int missing_count,
                                      int iterations,
                                      std::mt19937& rng,
                                      const std::atomic<bool>* cancel) {
    if (iterations <= 0) {
        throw std::invalid_argument("Monte Carlo iterations must be positive, got " +
                                    std::to_string(iterations) + ".");
    }
    if (missing_count < 1) {
        throw std::invalid_argument("Monte Carlo sampling needs at least 1 missing card, got " +
                                    std::to_string(missing_count) + ".");
    }
    const std::vector<Card> known = combine_known_cards(hole_cards, known_community);
    Deck deck(remaining_deck(known));

    CategoryCounts counts;
    std::vector<Card> hand = known;
    hand.resize(known.size() + missing_count);

    for (int i = 0; i < iterations; ++i) {
        if (cancel != nullptr && cancel->load(std::memory_order_relaxed)) {
            spdlog::debug("Monte Carlo annulé après {}/{} essais.", i, iterations);
            throw ComputationCancelled();
        }
        const std::vector<Card>& drawn = deck.draw(static_cast<std::size_t>(missing_count), rng);
        std::copy(drawn.begin(), drawn.end(), hand.begin() + known.size());
        counts.add(evaluate(hand));
    }

    spdlog::trace("Monte Carlo : {} essais, {} cartes tirées parmi {}.",
                  iterations, missing_count, deck.size());
    return counts;
}

ProbabilityDistribution sample_distribution(const std::vector<Card>& hole_cards,
                                            const std::vector<Card>& known_community,
                                            int missing_count,
                                            int iterations,
                                            std::mt19937& rng,
                                            const std::atomic<bool>* cancel) {
    return ProbabilityDistribution::from_counts(
        sample_category_counts(hole_cards, known_community, missing_count, iterations, rng, cancel));
}

} // namespace poker_odds
