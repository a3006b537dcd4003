#include "poker_odds/odds_engine.h"
#include "eval/exact_enumerator.hpp"
#include "eval/hand_evaluator.hpp"
#include "eval/monte_carlo.hpp"
#include "poker_odds/game_utils.hpp"
#include "spdlog/spdlog.h"
#include <stdexcept>
#include <string>
#include <utility>

namespace poker_odds {

std::vector<Card> OddsRequest::known_community() const {
    std::vector<Card> known;
    for (const auto& slot : community) {
        if (slot.has_value()) known.push_back(*slot);
    }
    return known;
}

int OddsRequest::missing_count() const {
    int present = 0;
    for (const auto& slot : community) {
        if (slot.has_value()) ++present;
    }
    return NUM_BOARD_CARDS - present;
}

std::string compute_method_to_string(ComputeMethod m) {
    switch (m) {
        case ComputeMethod::CERTAIN:     return "certain";
        case ComputeMethod::EXACT:       return "exact";
        case ComputeMethod::MONTE_CARLO: return "monte-carlo";
        default:                         return "unknown";
    }
}

double compute_expected_value(const ProbabilityDistribution& distribution,
                              double pot_size,
                              double cost) {
    if (pot_size < 0.0) {
        throw std::invalid_argument("Pot size must be non-negative, got " + std::to_string(pot_size) + ".");
    }
    if (cost < 0.0) {
        throw std::invalid_argument("Call cost must be non-negative, got " + std::to_string(cost) + ".");
    }
    const double p = distribution.pair_or_better();
    return p * pot_size - (1.0 - p) * cost;
}

OddsEngine::OddsEngine(EngineConfig config)
    : config_(std::move(config))
{
    if (config_.monte_carlo_iterations <= 0) {
        throw std::invalid_argument("EngineConfig: monte_carlo_iterations must be positive.");
    }
    if (config_.call_cost < 0.0) {
        throw std::invalid_argument("EngineConfig: call_cost must be non-negative.");
    }
    if (config_.max_exact_missing_cards < 0 || config_.max_exact_missing_cards > MAX_EXACT_MISSING_CARDS) {
        throw std::invalid_argument("EngineConfig: max_exact_missing_cards must be in [0, "
                                    + std::to_string(MAX_EXACT_MISSING_CARDS) + "].");
    }
}

OddsResult OddsEngine::dispatch(const OddsRequest& request,
                                std::mt19937& rng,
                                const std::atomic<bool>* cancel) const {
    const std::vector<Card> community = request.known_community();
    // Valide la requête (2 cartes privées, pas de doublon) avant toute répartition
    const std::vector<Card> known = combine_known_cards(request.hole_cards, community);
    const int missing = request.missing_count();

    OddsResult result;
    if (missing <= 0) {
        // Board complet (ou trop rempli) : on évalue les cartes telles quelles
        const HandCategory category = evaluate(known);
        result.distribution = ProbabilityDistribution::certain(category);
        result.method = ComputeMethod::CERTAIN;
        result.evaluated_hands = 1;
        spdlog::debug("Board complet {} : {}.", vec_to_string(known), hand_category_to_string(category));
    } else if (missing <= config_.max_exact_missing_cards) {
        spdlog::debug("{} carte(s) manquante(s) : énumération exacte.", missing);
        const CategoryCounts counts = enumerate_category_counts(request.hole_cards, community, missing);
        result.distribution = ProbabilityDistribution::from_counts(counts);
        result.method = ComputeMethod::EXACT;
        result.evaluated_hands = counts.total;
    } else {
        spdlog::debug("{} cartes manquantes : Monte Carlo ({} essais).", missing, config_.monte_carlo_iterations);
        const CategoryCounts counts = sample_category_counts(
            request.hole_cards, community, missing, config_.monte_carlo_iterations, rng, cancel);
        result.distribution = ProbabilityDistribution::from_counts(counts);
        result.method = ComputeMethod::MONTE_CARLO;
        result.evaluated_hands = counts.total;
    }
    return result;
}

ProbabilityDistribution OddsEngine::compute_distribution(const OddsRequest& request,
                                                         std::mt19937& rng,
                                                         const std::atomic<bool>* cancel) const {
    return dispatch(request, rng, cancel).distribution;
}

OddsResult OddsEngine::compute(const OddsRequest& request,
                               std::mt19937& rng,
                               const std::atomic<bool>* cancel) const {
    OddsResult result = dispatch(request, rng, cancel);
    result.expected_value = compute_expected_value(result.distribution, request.pot_size, config_.call_cost);
    return result;
}

} // namespace poker_odds
