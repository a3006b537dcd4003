#include <catch2/catch_test_macros.hpp>
#include <vector>
#include "core/bitboard.hpp"
#include "core/cards.hpp"
#include "poker_odds/errors.h"

using namespace poker_odds;

TEST_CASE("Bitboard Basic Operations", "[bitboard]") {
    Bitboard board = EMPTY_BOARD;
    Card ac = card_from_string("Ac");
    Card kd = card_from_string("Kd");

    SECTION("Set and Test Card") {
        REQUIRE_FALSE(test_card(board, ac));
        set_card(board, ac);
        REQUIRE(test_card(board, ac));
        REQUIRE_FALSE(test_card(board, kd));
        set_card(board, kd);
        REQUIRE(test_card(board, kd));
    }

    SECTION("Clear Card") {
        set_card(board, ac);
        set_card(board, kd);
        clear_card(board, ac);
        REQUIRE_FALSE(test_card(board, ac));
        REQUIRE(test_card(board, kd));
    }

    SECTION("Idempotency of Set Card") {
        set_card(board, ac);
        Bitboard board_copy = board;
        set_card(board, ac);
        REQUIRE(board == board_copy);
        REQUIRE(count_set_bits(board) == 1);
    }

    SECTION("Full deck has 52 bits") {
        REQUIRE(count_set_bits(FULL_DECK) == NUM_CARDS);
    }
}

TEST_CASE("Bitboard Conversions", "[bitboard]") {
    Card ac = card_from_string("Ac"); // 12
    Card _2d = card_from_string("2d"); // 13
    Card _ts = card_from_string("Ts"); // 47

    SECTION("cards_to_board / board_to_cards keep index order") {
        Bitboard board = cards_to_board({_ts, ac, _2d});
        REQUIRE(count_set_bits(board) == 3);
        std::vector<Card> cards = board_to_cards(board);
        REQUIRE(cards == std::vector<Card>{ac, _2d, _ts});
        REQUIRE(board_to_string(board) == "Ac2dTs");
    }

    SECTION("pop_lsb returns the lowest card first") {
        Bitboard board = cards_to_board({_ts, _2d});
        REQUIRE(pop_lsb(board) == _2d);
        REQUIRE(pop_lsb(board) == _ts);
        REQUIRE(board == EMPTY_BOARD);
    }

    SECTION("Duplicate cards are rejected") {
        REQUIRE_THROWS_AS(cards_to_board({ac, _2d, card_from_string("Ac")}), DuplicateCardError);
        try {
            cards_to_board({_ts, _ts});
            FAIL("DuplicateCardError attendue");
        } catch (const DuplicateCardError& e) {
            REQUIRE(e.card() == "Ts");
        }
    }
}
