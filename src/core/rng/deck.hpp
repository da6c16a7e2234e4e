#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "core/rng/random_source.hpp"

namespace hogpen {

enum class Suit {
  Spades,
  Hearts,
  Diamonds,
  Clubs,
};

enum class CardColor {
  Red,
  Black,
};

inline constexpr int kRankJack = 11;
inline constexpr int kRankQueen = 12;
inline constexpr int kRankKing = 13;
inline constexpr int kRankAce = 14;
inline constexpr std::size_t kDeckSize = 52;

struct Card {
  int rank = 2;  // 2..14, ace high
  Suit suit = Suit::Spades;

  bool operator==(const Card&) const = default;
};

// Cards are drawn from the back.
using Deck = std::vector<Card>;

Deck fresh_deck();
void shuffle_deck(Deck& deck, RandomSource& rng);
Deck shuffled_deck(RandomSource& rng);
// Replaces an exhausted deck with a fresh shuffled one before drawing.
Card draw_card(Deck& deck, RandomSource& rng);

CardColor card_color(const Card& card);
std::string_view suit_symbol(Suit suit);
std::string format_card(const Card& card);

// Face cards count 10, aces 11.
int blackjack_value(const Card& card);
bool is_ten_value(const Card& card);
// Aces are demoted from 11 to 1 while the total exceeds 21.
int hand_total(std::span<const Card> cards);
bool is_soft_total(std::span<const Card> cards);

// Compact form for session snapshots, e.g. "14S,10H".
std::string encode_cards(std::span<const Card> cards);
bool decode_cards(std::string_view text, std::vector<Card>& out);

}  // namespace hogpen
