#include "core/deck.hpp"
#include "core/bitboard.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace poker_odds {

std::vector<Card> full_deck() {
    std::vector<Card> cards;
    cards.reserve(NUM_CARDS);
    for (int s = 0; s < NUM_SUITS; ++s) {
        for (int r = 0; r < NUM_RANKS; ++r) {
            cards.push_back(make_card(static_cast<Rank>(r), static_cast<Suit>(s)));
        }
    }
    return cards;
}

std::vector<Card> remaining_deck(const std::vector<Card>& known) {
    const Bitboard known_mask = cards_to_board(known);
    // Le complément est parcouru par index croissant : même ordre que full_deck()
    return board_to_cards(FULL_DECK & ~known_mask);
}

Deck::Deck(std::vector<Card> cards)
    : cards_(std::move(cards))
{
}

const std::vector<Card>& Deck::draw(std::size_t k, std::mt19937& rng) {
    if (k > cards_.size()) {
        throw std::invalid_argument("Cannot draw " + std::to_string(k) + " cards from a deck of " +
                                    std::to_string(cards_.size()) + ".");
    }
    drawn_.clear();
    const std::size_t n = cards_.size();
    for (std::size_t i = 0; i < k; ++i) {
        std::uniform_int_distribution<std::size_t> dist(i, n - 1);
        std::swap(cards_[i], cards_[dist(rng)]);
        drawn_.push_back(cards_[i]);
    }
    return drawn_;
}

} // namespace poker_odds
