#ifndef POKER_ODDS_PROBABILITY_DISTRIBUTION_H
#define POKER_ODDS_PROBABILITY_DISTRIBUTION_H

#include "poker_odds/hand_category.h"
#include <array>
#include <cstdint>
#include <string>

namespace poker_odds {

// Compteurs par catégorie sur un ensemble de complétions évaluées.
struct CategoryCounts {
    std::array<uint64_t, NUM_HAND_CATEGORIES> counts{};
    uint64_t total = 0;

    void add(HandCategory c) {
        counts[category_index(c)]++;
        total++;
    }
    uint64_t operator[](HandCategory c) const { return counts[category_index(c)]; }
};

// Distribution de probabilité sur les dix catégories.
class ProbabilityDistribution {
public:
    ProbabilityDistribution() = default;

    // Normalise des compteurs ; lance std::invalid_argument si total == 0.
    static ProbabilityDistribution from_counts(const CategoryCounts& counts);
    // 1.0 sur une seule catégorie, 0.0 ailleurs.
    static ProbabilityDistribution certain(HandCategory category);

    double operator[](HandCategory c) const { return probabilities_[category_index(c)]; }
    const std::array<double, NUM_HAND_CATEGORIES>& probabilities() const { return probabilities_; }

    double total() const;
    // Masse de Paire à Quinte flush royale (tout ce qui bat Carte haute).
    double pair_or_better() const;
    // Catégorie la plus probable (la plus forte en cas d'égalité).
    HandCategory most_likely() const;

    bool operator==(const ProbabilityDistribution& other) const {
        return probabilities_ == other.probabilities_;
    }

private:
    std::array<double, NUM_HAND_CATEGORIES> probabilities_{};
};

std::string to_string(const ProbabilityDistribution& distribution);

} // namespace poker_odds

#endif // POKER_ODDS_PROBABILITY_DISTRIBUTION_H
