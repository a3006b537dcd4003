#include "poker_odds/game_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace poker_odds {

std::string vec_to_string(const std::vector<Card>& cards) {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < cards.size(); ++i) {
        ss << to_string(cards[i]);
        if (i < cards.size() - 1) {
            ss << " ";
        }
    }
    ss << "]";
    return ss.str();
}

std::string slots_to_string(const std::vector<std::optional<Card>>& slots) {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < slots.size(); ++i) {
        ss << (slots[i].has_value() ? to_string(*slots[i]) : "--");
        if (i < slots.size() - 1) {
            ss << " ";
        }
    }
    ss << "]";
    return ss.str();
}

double parse_pot_size(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    if (begin == end) return 0.0;

    const std::string trimmed = text.substr(begin, end - begin);
    double value = 0.0;
    size_t consumed = 0;
    try {
        value = std::stod(trimmed, &consumed);
    } catch (const std::invalid_argument&) {
        return 0.0;
    } catch (const std::out_of_range&) {
        return 0.0;
    }
    // "12abc" est refusé en entier
    if (consumed != trimmed.size() || !std::isfinite(value) || value < 0.0) {
        return 0.0;
    }
    return value;
}

uint32_t parse_seed(const std::string& text) {
    // std::stoul accepte "-1" et renvoie ULONG_MAX : on n'admet que des chiffres
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument("Invalid seed '" + text + "': expected a non-negative integer.");
    }
    unsigned long long value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Seed out of range: '" + text + "'.");
    }
    if (value > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("Seed out of range: '" + text + "'.");
    }
    return static_cast<uint32_t>(value);
}

} // namespace poker_odds
