// tests/odds_engine_tests.cpp
#include "poker_odds/odds_engine.h"
#include "poker_odds/errors.h"
#include "eval/combinations.hpp"
#include "eval/exact_enumerator.hpp"
#include "eval/hand_evaluator.hpp"
#include "eval/monte_carlo.hpp"
#include "core/deck.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/catch_approx.hpp>

#include <atomic>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <utility>

using namespace poker_odds;
using Catch::Matchers::WithinAbs;

namespace {
Card C(const std::string& s) { return card_from_string(s); }

OddsRequest make_request(std::vector<Card> hole, std::vector<std::optional<Card>> board, double pot = 100.0) {
    OddsRequest request;
    request.hole_cards = std::move(hole);
    request.community = std::move(board);
    request.community.resize(5, std::nullopt);
    request.pot_size = pot;
    return request;
}
} // namespace

TEST_CASE("OddsRequest counts missing cards", "[OddsEngine]") {
    OddsRequest request = make_request({C("As"), C("Ks")}, {C("Qs"), std::nullopt, C("2c")});
    REQUIRE(request.missing_count() == 3);
    REQUIRE(request.known_community() == std::vector<Card>{C("Qs"), C("2c")});
    REQUIRE(make_request({C("As"), C("Ks")}, {}).missing_count() == 5);
}

TEST_CASE("Full board gives a certain distribution", "[OddsEngine]") {
    OddsEngine engine;
    std::mt19937 rng(1);
    OddsRequest request = make_request({C("As"), C("Ks")}, {C("Qs"), C("Js"), C("Ts"), C("2c"), C("3d")});
    REQUIRE(request.missing_count() == 0);

    OddsResult result = engine.compute(request, rng);
    REQUIRE(result.method == ComputeMethod::CERTAIN);
    REQUIRE(result.evaluated_hands == 1);
    for (HandCategory c : ALL_HAND_CATEGORIES) {
        REQUIRE(result.distribution[c] == (c == HandCategory::ROYAL_FLUSH ? 1.0 : 0.0));
    }

    // Cohérent avec evaluate() sur toutes les cartes connues
    OddsRequest pair_board = make_request({C("7h"), C("2d")}, {C("7c"), C("Jd"), C("9s"), C("Kh"), C("4c")});
    ProbabilityDistribution d = engine.compute_distribution(pair_board, rng);
    HandCategory expected = evaluate({C("7h"), C("2d"), C("7c"), C("Jd"), C("9s"), C("Kh"), C("4c")});
    REQUIRE(expected == HandCategory::PAIR);
    REQUIRE(d == ProbabilityDistribution::certain(expected));
}

TEST_CASE("Exact enumeration with one missing card", "[OddsEngine][exact]") {
    std::vector<Card> hole = {C("As"), C("Ks")};
    std::vector<Card> board = {C("Qs"), C("Js"), C("2c"), C("3d")};

    CategoryCounts counts = enumerate_category_counts(hole, board, 1);
    REQUIRE(counts.total == 46);
    REQUIRE(counts[HandCategory::ROYAL_FLUSH] == 1);  // Ts
    REQUIRE(counts[HandCategory::STRAIGHT] == 3);     // Th Td Tc
    REQUIRE(counts[HandCategory::FLUSH] == 8);        // autres piques
    REQUIRE(counts[HandCategory::PAIR] == 16);
    REQUIRE(counts[HandCategory::HIGH_CARD] == 18);

    uint64_t sum = 0;
    for (uint64_t n : counts.counts) sum += n;
    REQUIRE(sum == counts.total);

    ProbabilityDistribution d = exact_distribution(hole, board, 1);
    REQUIRE(d[HandCategory::ROYAL_FLUSH] == Catch::Approx(1.0 / 46.0));
    REQUIRE_THAT(d.total(), WithinAbs(1.0, 1e-9));
}

TEST_CASE("Exact enumeration with two missing cards", "[OddsEngine][exact]") {
    std::vector<Card> hole = {C("8h"), C("8d")};
    std::vector<Card> board = {C("Kc"), C("5s"), C("2h")};

    CategoryCounts counts = enumerate_category_counts(hole, board, 2);
    REQUIRE(counts.total == binomial(47, 2));
    uint64_t sum = 0;
    for (uint64_t n : counts.counts) sum += n;
    REQUIRE(sum == counts.total);
    // Une paire servie ne redevient jamais carte haute
    REQUIRE(counts[HandCategory::HIGH_CARD] == 0);

    ProbabilityDistribution d = ProbabilityDistribution::from_counts(counts);
    REQUIRE_THAT(d.total(), WithinAbs(1.0, 1e-9));

    // Déterministe
    REQUIRE(exact_distribution(hole, board, 2) == d);

    // Le moteur choisit la voie exacte
    OddsEngine engine;
    std::mt19937 rng(3);
    OddsResult result = engine.compute(make_request(hole, {board[0], board[1], board[2]}), rng);
    REQUIRE(result.method == ComputeMethod::EXACT);
    REQUIRE(result.evaluated_hands == 1081);
    REQUIRE(result.distribution == d);
}

TEST_CASE("Exact enumeration rejects unsupported missing counts", "[OddsEngine][exact]") {
    std::vector<Card> hole = {C("As"), C("Ks")};
    REQUIRE_THROWS_AS(enumerate_category_counts(hole, {C("2c"), C("3d")}, 3), std::invalid_argument);
    REQUIRE_THROWS_AS(enumerate_category_counts(hole, {C("2c"), C("3d"), C("4h"), C("5s"), C("6c")}, 0),
                      std::invalid_argument);
}

TEST_CASE("Monte Carlo sampling", "[OddsEngine][monte_carlo]") {
    std::vector<Card> hole = {C("As"), C("Ks")};

    SECTION("Same seed gives bit-identical output") {
        std::mt19937 rng_a(2024);
        std::mt19937 rng_b(2024);
        ProbabilityDistribution a = sample_distribution(hole, {}, 5, 10000, rng_a);
        ProbabilityDistribution b = sample_distribution(hole, {}, 5, 10000, rng_b);
        REQUIRE(a == b);
        REQUIRE_THAT(a.total(), WithinAbs(1.0, 1e-9));
    }

    SECTION("Counts add up to the iteration count") {
        std::mt19937 rng(5);
        CategoryCounts counts = sample_category_counts(hole, {C("2c")}, 4, 2500, rng);
        REQUIRE(counts.total == 2500);
        uint64_t sum = 0;
        for (uint64_t n : counts.counts) sum += n;
        REQUIRE(sum == 2500);
    }

    SECTION("Sampler converges to the exact distribution") {
        std::vector<Card> board = {C("Qs"), C("7h"), C("2c")};
        ProbabilityDistribution exact = exact_distribution(hole, board, 2);
        std::mt19937 rng(99);
        ProbabilityDistribution sampled = sample_distribution(hole, board, 2, 10000, rng);
        for (HandCategory c : ALL_HAND_CATEGORIES) {
            if (exact[c] >= 0.05) {
                INFO(hand_category_to_string(c));
                REQUIRE_THAT(sampled[c], WithinAbs(exact[c], 0.02));
            }
        }
    }

    SECTION("Invalid parameters") {
        std::mt19937 rng(1);
        REQUIRE_THROWS_AS(sample_category_counts(hole, {}, 5, 0, rng), std::invalid_argument);
        REQUIRE_THROWS_AS(sample_category_counts(hole, {}, 0, 100, rng), std::invalid_argument);
    }

    SECTION("A raised cancel flag stops the run") {
        std::mt19937 rng(1);
        std::atomic<bool> cancel{true};
        REQUIRE_THROWS_AS(sample_category_counts(hole, {}, 5, 10000, rng, &cancel), ComputationCancelled);
    }
}

TEST_CASE("Engine dispatches to Monte Carlo with 3+ missing cards", "[OddsEngine][monte_carlo]") {
    EngineConfig config;
    config.monte_carlo_iterations = 4000;
    OddsEngine engine(config);

    std::mt19937 rng_a(11);
    std::mt19937 rng_b(11);
    OddsRequest preflop = make_request({C("As"), C("Ks")}, {});
    OddsResult a = engine.compute(preflop, rng_a);
    OddsResult b = engine.compute(preflop, rng_b);
    REQUIRE(a.method == ComputeMethod::MONTE_CARLO);
    REQUIRE(a.evaluated_hands == 4000);
    REQUIRE(a.distribution == b.distribution);
    REQUIRE_THAT(a.distribution.total(), WithinAbs(1.0, 1e-9));

    OddsRequest flop_one = make_request({C("As"), C("Ks")}, {std::nullopt, C("Qd")});
    REQUIRE(engine.compute(flop_one, rng_a).method == ComputeMethod::MONTE_CARLO);
}

TEST_CASE("Default configuration", "[OddsEngine]") {
    OddsEngine engine;
    REQUIRE(engine.config().monte_carlo_iterations == DEFAULT_MONTE_CARLO_ITERATIONS);
    REQUIRE(engine.config().call_cost == DEFAULT_CALL_COST);
    REQUIRE(engine.config().max_exact_missing_cards == MAX_EXACT_MISSING_CARDS);

    EngineConfig bad;
    bad.monte_carlo_iterations = 0;
    REQUIRE_THROWS_AS(OddsEngine(bad), std::invalid_argument);
    bad = EngineConfig{};
    bad.call_cost = -1.0;
    REQUIRE_THROWS_AS(OddsEngine(bad), std::invalid_argument);
    bad = EngineConfig{};
    bad.max_exact_missing_cards = MAX_EXACT_MISSING_CARDS + 1;
    REQUIRE_THROWS_AS(OddsEngine(bad), std::invalid_argument);
    bad.max_exact_missing_cards = -1;
    REQUIRE_THROWS_AS(OddsEngine(bad), std::invalid_argument);
}

TEST_CASE("Exact threshold is read from the configuration", "[OddsEngine]") {
    EngineConfig config;
    config.monte_carlo_iterations = 500;
    config.max_exact_missing_cards = 1;
    OddsEngine engine(config);
    std::mt19937 rng(4);

    OddsRequest turn = make_request({C("As"), C("Ks")}, {C("Qs"), C("Js"), C("2c"), C("3d")});
    OddsResult exact = engine.compute(turn, rng);
    REQUIRE(exact.method == ComputeMethod::EXACT);
    REQUIRE(exact.evaluated_hands == 46);

    OddsRequest flop = make_request({C("8h"), C("8d")}, {C("Kc"), C("5s"), C("2h")});
    OddsResult sampled = engine.compute(flop, rng);
    REQUIRE(sampled.method == ComputeMethod::MONTE_CARLO);
    REQUIRE(sampled.evaluated_hands == 500);

    // 0 : toute carte manquante passe par l'échantillonnage
    config.max_exact_missing_cards = 0;
    OddsEngine sampling_only(config);
    REQUIRE(sampling_only.compute(turn, rng).method == ComputeMethod::MONTE_CARLO);
}

TEST_CASE("Expected value", "[OddsEngine][ev]") {
    CategoryCounts half;
    half.add(HandCategory::HIGH_CARD);
    half.add(HandCategory::FLUSH);
    ProbabilityDistribution d = ProbabilityDistribution::from_counts(half);
    REQUIRE(d.pair_or_better() == 0.5);

    SECTION("p = 0.5, pot 100, cost 20 gives 40") {
        REQUIRE(compute_expected_value(d, 100.0, 20.0) == 40.0);
        REQUIRE(compute_expected_value(d, 100.0) == 40.0);
    }

    SECTION("Certain categories") {
        REQUIRE(compute_expected_value(ProbabilityDistribution::certain(HandCategory::HIGH_CARD), 100.0) == -20.0);
        REQUIRE(compute_expected_value(ProbabilityDistribution::certain(HandCategory::PAIR), 100.0) == 100.0);
        REQUIRE(compute_expected_value(ProbabilityDistribution::certain(HandCategory::HIGH_CARD), 0.0) == -20.0);
    }

    SECTION("Engine result carries the EV of its distribution") {
        OddsEngine engine;
        std::mt19937 rng(8);
        OddsRequest request = make_request({C("As"), C("Ks")}, {C("Qs"), C("Js"), C("2c"), C("3d")}, 50.0);
        OddsResult result = engine.compute(request, rng);
        const double p = 28.0 / 46.0; // tout sauf les 18 cartes hautes
        REQUIRE(result.expected_value == Catch::Approx(p * 50.0 - (1.0 - p) * 20.0));
    }

    SECTION("Negative inputs are rejected") {
        REQUIRE_THROWS_AS(compute_expected_value(d, -1.0), std::invalid_argument);
        REQUIRE_THROWS_AS(compute_expected_value(d, 10.0, -5.0), std::invalid_argument);
    }
}

TEST_CASE("Duplicate known cards raise DuplicateCardError", "[OddsEngine][errors]") {
    OddsEngine engine;
    std::mt19937 rng(1);

    REQUIRE_THROWS_AS(engine.compute_distribution(make_request({C("As"), C("As")}, {}), rng),
                      DuplicateCardError);
    REQUIRE_THROWS_AS(engine.compute_distribution(make_request({C("As"), C("Ks")}, {C("Qd"), C("As")}), rng),
                      DuplicateCardError);
    REQUIRE_THROWS_AS(engine.compute_distribution(
                          make_request({C("As"), C("Ks")}, {C("Qd"), C("Jd"), C("Td"), C("9d"), C("Qd")}), rng),
                      DuplicateCardError);
    REQUIRE_THROWS_AS(exact_distribution({C("As"), C("Ks")}, {C("Ks"), C("2c"), C("3c")}, 2), DuplicateCardError);
}

TEST_CASE("Hole card count is validated", "[OddsEngine][errors]") {
    OddsEngine engine;
    std::mt19937 rng(1);
    REQUIRE_THROWS_AS(engine.compute(make_request({C("As")}, {}), rng), std::invalid_argument);
    REQUIRE_THROWS_AS(engine.compute(make_request({C("As"), C("Ks"), C("Qs")}, {}), rng), std::invalid_argument);
}
