#include "core/bitboard.hpp"
#include "poker_odds/errors.h"
#include <sstream>

namespace poker_odds {

std::string board_to_string(Bitboard board) {
    std::stringstream ss;
    // Les cartes sortent déjà triées par index
    for (const Card& c : board_to_cards(board)) {
        ss << to_string(c);
    }
    return ss.str();
}

std::vector<Card> board_to_cards(Bitboard board) {
    std::vector<Card> cards;
    cards.reserve(count_set_bits(board));
    board &= FULL_DECK;
    while (board != EMPTY_BOARD) {
        cards.push_back(pop_lsb(board));
    }
    return cards;
}

Bitboard cards_to_board(const std::vector<Card>& cards) {
    Bitboard board = EMPTY_BOARD;
    for (const Card& c : cards) {
        if (test_card(board, c)) {
            throw DuplicateCardError(to_string(c));
        }
        set_card(board, c);
    }
    return board;
}

} // namespace poker_odds
