#ifndef POKER_ODDS_COMBINATIONS_HPP
#define POKER_ODDS_COMBINATIONS_HPP

#include <cstddef>
#include <cstdint>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace poker_odds {

// C(n, k), 0 si k > n
inline uint64_t binomial(std::size_t n, std::size_t k) {
    if (k > n) return 0;
    if (k > n - k) k = n - k;
    uint64_t result = 1;
    for (std::size_t i = 1; i <= k; ++i) {
        result = result * (n - k + i) / i;
    }
    return result;
}

// Parcourt tous les k-sous-ensembles d'indices {0..n-1} dans l'ordre
// lexicographique. Itératif : la profondeur ne dépend ni de n ni de k.
class CombinationGenerator {
public:
    CombinationGenerator(std::size_t n, std::size_t k)
        : n_(n), k_(k), indices_(k), done_(k > n)
    {
        std::iota(indices_.begin(), indices_.end(), std::size_t{0});
    }

    bool done() const { return done_; }
    const std::vector<std::size_t>& indices() const { return indices_; }

    // Avance à la combinaison suivante ; done() devient vrai après la dernière.
    void next() {
        if (done_) return;
        // Position la plus à droite qui peut encore avancer
        std::size_t i = k_;
        while (i > 0 && indices_[i - 1] == n_ - k_ + (i - 1)) {
            --i;
        }
        if (i == 0) {
            done_ = true;
            return;
        }
        ++indices_[i - 1];
        for (std::size_t j = i; j < k_; ++j) {
            indices_[j] = indices_[j - 1] + 1;
        }
    }

private:
    std::size_t n_;
    std::size_t k_;
    std::vector<std::size_t> indices_;
    bool done_;
};

/**
 * @brief Appelle fn(combinaison) pour chaque k-sous-ensemble de `items`.
 * @return Le nombre de combinaisons visitées.
 */
template <typename T, typename Fn>
uint64_t for_each_combination(const std::vector<T>& items, std::size_t k, Fn&& fn) {
    if (k == 0) {
        throw std::invalid_argument("Combination size must be at least 1.");
    }
    uint64_t visited = 0;
    std::vector<T> combo(k);
    for (CombinationGenerator gen(items.size(), k); !gen.done(); gen.next()) {
        const auto& idx = gen.indices();
        for (std::size_t j = 0; j < k; ++j) {
            combo[j] = items[idx[j]];
        }
        fn(combo);
        ++visited;
    }
    return visited;
}

} // namespace poker_odds

#endif // POKER_ODDS_COMBINATIONS_HPP
