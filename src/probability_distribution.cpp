#include "poker_odds/probability_distribution.h"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace poker_odds {

ProbabilityDistribution ProbabilityDistribution::from_counts(const CategoryCounts& counts) {
    if (counts.total == 0) {
        throw std::invalid_argument("Cannot normalize an empty set of category counts.");
    }
    ProbabilityDistribution d;
    const double total = static_cast<double>(counts.total);
    for (std::size_t i = 0; i < NUM_HAND_CATEGORIES; ++i) {
        d.probabilities_[i] = static_cast<double>(counts.counts[i]) / total;
    }
    return d;
}

ProbabilityDistribution ProbabilityDistribution::certain(HandCategory category) {
    ProbabilityDistribution d;
    d.probabilities_[category_index(category)] = 1.0;
    return d;
}

double ProbabilityDistribution::total() const {
    double sum = 0.0;
    for (double p : probabilities_) sum += p;
    return sum;
}

double ProbabilityDistribution::pair_or_better() const {
    double sum = 0.0;
    for (std::size_t i = category_index(HandCategory::PAIR); i < NUM_HAND_CATEGORIES; ++i) {
        sum += probabilities_[i];
    }
    return sum;
}

HandCategory ProbabilityDistribution::most_likely() const {
    std::size_t best = 0;
    for (std::size_t i = 1; i < NUM_HAND_CATEGORIES; ++i) {
        if (probabilities_[i] >= probabilities_[best]) best = i;
    }
    return ALL_HAND_CATEGORIES[best];
}

std::string to_string(const ProbabilityDistribution& distribution) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2);
    for (std::size_t i = 0; i < NUM_HAND_CATEGORIES; ++i) {
        const HandCategory c = ALL_HAND_CATEGORIES[i];
        ss << hand_category_to_string(c) << ':' << distribution[c] * 100.0 << '%'
           << (i + 1 == NUM_HAND_CATEGORIES ? "" : " ");
    }
    return ss.str();
}

} // namespace poker_odds
