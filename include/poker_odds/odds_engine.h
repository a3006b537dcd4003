#ifndef POKER_ODDS_ODDS_ENGINE_H
#define POKER_ODDS_ODDS_ENGINE_H

#include "core/cards.hpp"
#include "eval/monte_carlo.hpp" // DEFAULT_MONTE_CARLO_ITERATIONS
#include "poker_odds/probability_distribution.h"
#include <atomic>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace poker_odds {

// Prix fixe d'un call hypothétique
constexpr double DEFAULT_CALL_COST = 20.0;
// Plafond de l'énumération exacte (C(47,2) = 1081 tirages au flop)
constexpr int MAX_EXACT_MISSING_CARDS = 2;

struct EngineConfig {
    int monte_carlo_iterations = DEFAULT_MONTE_CARLO_ITERATIONS;
    double call_cost = DEFAULT_CALL_COST;
    // Au-delà de ce nombre de cartes manquantes on échantillonne (0..MAX_EXACT_MISSING_CARDS)
    int max_exact_missing_cards = MAX_EXACT_MISSING_CARDS;
    // Graine de la session ; std::nullopt => std::random_device
    std::optional<uint32_t> seed;
};

// Entrée d'un calcul : 2 cartes privées, emplacements du board (vides = non révélés).
struct OddsRequest {
    std::vector<Card> hole_cards;
    std::vector<std::optional<Card>> community;
    double pot_size = 0.0;

    std::vector<Card> known_community() const;
    // 5 - nombre d'emplacements renseignés ; <= 0 si le board est complet
    int missing_count() const;
};

enum class ComputeMethod { CERTAIN, EXACT, MONTE_CARLO };

std::string compute_method_to_string(ComputeMethod m);

struct OddsResult {
    ProbabilityDistribution distribution;
    double expected_value = 0.0;
    ComputeMethod method = ComputeMethod::CERTAIN;
    uint64_t evaluated_hands = 0;
    uint64_t sequence = 0; // renseigné par OddsSession
};

/**
 * @brief EV d'un call : p * pot - (1 - p) * cost, p = masse "Paire ou mieux".
 * @throws std::invalid_argument si pot_size ou cost est négatif.
 */
double compute_expected_value(const ProbabilityDistribution& distribution,
                              double pot_size,
                              double cost = DEFAULT_CALL_COST);

// Répartiteur sans état : board complet, énumération exacte ou Monte Carlo.
class OddsEngine {
public:
    explicit OddsEngine(EngineConfig config = {});

    // Lance DuplicateCardError si deux cartes connues sont identiques.
    ProbabilityDistribution compute_distribution(const OddsRequest& request,
                                                 std::mt19937& rng,
                                                 const std::atomic<bool>* cancel = nullptr) const;

    // Distribution + EV (pot de la requête, coût de la configuration).
    OddsResult compute(const OddsRequest& request,
                       std::mt19937& rng,
                       const std::atomic<bool>* cancel = nullptr) const;

    const EngineConfig& config() const { return config_; }

private:
    // Répartition sans calcul d'EV
    OddsResult dispatch(const OddsRequest& request,
                        std::mt19937& rng,
                        const std::atomic<bool>* cancel) const;

    EngineConfig config_;
};

} // namespace poker_odds

#endif // POKER_ODDS_ODDS_ENGINE_H
