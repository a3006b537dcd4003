#ifndef POKER_ODDS_BITBOARD_HPP
#define POKER_ODDS_BITBOARD_HPP

#include <bit>
#include <cstdint>
#include <string>
#include <vector>

#include "core/cards.hpp"

namespace poker_odds {

// Ensemble de cartes : un bit par index 0-51
using Bitboard = uint64_t;

constexpr Bitboard EMPTY_BOARD = 0ULL;
constexpr Bitboard FULL_DECK = (1ULL << NUM_CARDS) - 1; // 52 bits set

constexpr Bitboard card_bit(Card c) {
    return 1ULL << card_index(c);
}

inline void set_card(Bitboard& board, Card c) {
    board |= card_bit(c);
}

inline void clear_card(Bitboard& board, Card c) {
    board &= ~card_bit(c);
}

inline bool test_card(Bitboard board, Card c) {
    return (board & card_bit(c)) != 0;
}

inline int count_set_bits(Bitboard board) {
    return std::popcount(board);
}

// Extrait la carte du bit le moins significatif et l'enlève. board ne doit pas être vide.
inline Card pop_lsb(Bitboard& board) {
    const int lsb_index = std::countr_zero(board);
    board &= (board - 1);
    return card_from_index(lsb_index);
}

std::string board_to_string(Bitboard board);
std::vector<Card> board_to_cards(Bitboard board);

// Lance DuplicateCardError si une carte apparaît deux fois.
Bitboard cards_to_board(const std::vector<Card>& cards);

} // namespace poker_odds

#endif // POKER_ODDS_BITBOARD_HPP
