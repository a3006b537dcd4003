#include "poker_odds/game_utils.hpp"
#include "poker_odds/odds_engine.h"
#include "spdlog/spdlog.h"
#include "spdlog/cfg/env.h"

#include <exception>  // std::exception
#include <iostream>   // std::cerr
#include <optional>   // std::optional
#include <random>     // std::mt19937
#include <stdexcept>  // std::invalid_argument
#include <string>     // std::string
#include <vector>     // std::vector

namespace {

void print_usage() {
    std::cerr << "Usage: poker_odds <hole1> <hole2> [board1 .. board5] "
                 "[--pot TEXT] [--iterations N] [--seed S]\n"
                 "  Cartes : As, Td, 10d ... ; '--' pour un emplacement vide.\n";
}

struct CliOptions {
    poker_odds::OddsRequest request;
    poker_odds::EngineConfig config;
};

CliOptions parse_arguments(int argc, char* argv[]) {
    CliOptions options;
    std::string pot_text = "100";
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--pot" || arg == "--iterations" || arg == "--seed") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value after " + arg + ".");
            }
            const std::string value = argv[++i];
            if (arg == "--pot") {
                pot_text = value;
            } else if (arg == "--iterations") {
                options.config.monte_carlo_iterations = std::stoi(value);
            } else {
                options.config.seed = poker_odds::parse_seed(value);
            }
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2 || positional.size() > 7) {
        throw std::invalid_argument("Expected 2 hole cards and up to 5 board slots.");
    }
    options.request.hole_cards = {poker_odds::card_from_string(positional[0]),
                                  poker_odds::card_from_string(positional[1])};
    options.request.community.assign(5, std::nullopt);
    for (size_t slot = 0; slot + 2 < positional.size(); ++slot) {
        const std::string& text = positional[slot + 2];
        if (text != "--") {
            options.request.community[slot] = poker_odds::card_from_string(text);
        }
    }
    // Saisie libre : un pot invalide vaut 0
    options.request.pot_size = poker_odds::parse_pot_size(pot_text);
    return options;
}

} // namespace

int main(int argc, char* argv[])
{
    // ─────────────────────────────────────────────────────────────
    // Logging : niveau info, surchargé par SPDLOG_LEVEL
    // ─────────────────────────────────────────────────────────────
    spdlog::set_level(spdlog::level::info);
    spdlog::cfg::load_env_levels();

    if (argc < 3) {
        print_usage();
        return 1;
    }

    try
    {
        const CliOptions options = parse_arguments(argc, argv);
        poker_odds::OddsEngine engine(options.config);

        std::mt19937 rng(options.config.seed.has_value() ? *options.config.seed : std::random_device{}());

        spdlog::info("Main {}  Board {}  Pot {:.2f}",
                     poker_odds::vec_to_string(options.request.hole_cards),
                     poker_odds::slots_to_string(options.request.community),
                     options.request.pot_size);

        const poker_odds::OddsResult result = engine.compute(options.request, rng);

        spdlog::info("Méthode : {} ({} mains évaluées)",
                     poker_odds::compute_method_to_string(result.method), result.evaluated_hands);
        for (poker_odds::HandCategory c : poker_odds::ALL_HAND_CATEGORIES) {
            spdlog::info("  {:<16} {:6.2f}%", poker_odds::hand_category_to_string(c),
                         result.distribution[c] * 100.0);
        }
        spdlog::info("Catégorie la plus probable : {}",
                     poker_odds::hand_category_to_string(result.distribution.most_likely()));
        spdlog::info("Paire ou mieux : {:.2f}%", result.distribution.pair_or_better() * 100.0);
        spdlog::info("EV du call ({:.2f}) : {:.2f}", engine.config().call_cost, result.expected_value);
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur critique : {}", e.what());
        print_usage();
        return 1;
    }

    return 0;
}
