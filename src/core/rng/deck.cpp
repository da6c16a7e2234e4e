#include "core/rng/deck.hpp"

#include <array>
#include <utility>

#include "core/util/canonical.hpp"

namespace hogpen {
namespace {

constexpr std::array<Suit, 4> kSuits = {Suit::Spades, Suit::Hearts, Suit::Diamonds, Suit::Clubs};

char suit_letter(Suit suit) {
  switch (suit) {
    case Suit::Spades:
      return 'S';
    case Suit::Hearts:
      return 'H';
    case Suit::Diamonds:
      return 'D';
    case Suit::Clubs:
      return 'C';
  }
  return 'S';
}

bool suit_from_letter(char letter, Suit& out) {
  switch (letter) {
    case 'S':
      out = Suit::Spades;
      return true;
    case 'H':
      out = Suit::Hearts;
      return true;
    case 'D':
      out = Suit::Diamonds;
      return true;
    case 'C':
      out = Suit::Clubs;
      return true;
    default:
      return false;
  }
}

std::string rank_label(int rank) {
  switch (rank) {
    case kRankJack:
      return "J";
    case kRankQueen:
      return "Q";
    case kRankKing:
      return "K";
    case kRankAce:
      return "A";
    default:
      return std::to_string(rank);
  }
}

}  // namespace

Deck fresh_deck() {
  Deck deck;
  deck.reserve(kDeckSize);
  for (const Suit suit : kSuits) {
    for (int rank = 2; rank <= kRankAce; ++rank) {
      deck.push_back(Card{.rank = rank, .suit = suit});
    }
  }
  return deck;
}

void shuffle_deck(Deck& deck, RandomSource& rng) {
  for (std::size_t i = deck.size(); i > 1; --i) {
    const std::size_t j = rng.uniform(static_cast<std::uint32_t>(i));
    std::swap(deck[i - 1U], deck[j]);
  }
}

Deck shuffled_deck(RandomSource& rng) {
  Deck deck = fresh_deck();
  shuffle_deck(deck, rng);
  return deck;
}

Card draw_card(Deck& deck, RandomSource& rng) {
  if (deck.empty()) {
    deck = shuffled_deck(rng);
  }
  const Card card = deck.back();
  deck.pop_back();
  return card;
}

CardColor card_color(const Card& card) {
  return (card.suit == Suit::Hearts || card.suit == Suit::Diamonds) ? CardColor::Red : CardColor::Black;
}

std::string_view suit_symbol(Suit suit) {
  switch (suit) {
    case Suit::Spades:
      return "♠";
    case Suit::Hearts:
      return "♥";
    case Suit::Diamonds:
      return "♦";
    case Suit::Clubs:
      return "♣";
  }
  return "♠";
}

std::string format_card(const Card& card) {
  return rank_label(card.rank) + std::string{suit_symbol(card.suit)};
}

int blackjack_value(const Card& card) {
  if (card.rank == kRankAce) {
    return 11;
  }
  if (card.rank >= kRankJack) {
    return 10;
  }
  return card.rank;
}

bool is_ten_value(const Card& card) {
  return card.rank >= 10 && card.rank <= kRankKing;
}

int hand_total(std::span<const Card> cards) {
  int total = 0;
  int aces = 0;
  for (const Card& card : cards) {
    total += blackjack_value(card);
    if (card.rank == kRankAce) {
      ++aces;
    }
  }
  while (total > 21 && aces > 0) {
    total -= 10;
    --aces;
  }
  return total;
}

bool is_soft_total(std::span<const Card> cards) {
  int hard = 0;
  bool has_ace = false;
  for (const Card& card : cards) {
    hard += card.rank == kRankAce ? 1 : blackjack_value(card);
    has_ace = has_ace || card.rank == kRankAce;
  }
  return has_ace && hard + 10 <= 21;
}

std::string encode_cards(std::span<const Card> cards) {
  std::string out;
  for (const Card& card : cards) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out.append(std::to_string(card.rank));
    out.push_back(suit_letter(card.suit));
  }
  return out;
}

bool decode_cards(std::string_view text, std::vector<Card>& out) {
  out.clear();
  if (text.empty()) {
    return true;
  }
  for (const std::string_view token : util::split_fields(text, ',')) {
    if (token.size() < 2) {
      return false;
    }
    Card card;
    std::int64_t rank = 0;
    if (!util::parse_int64(token.substr(0, token.size() - 1U), rank) || rank < 2 || rank > kRankAce ||
        !suit_from_letter(token.back(), card.suit)) {
      return false;
    }
    card.rank = static_cast<int>(rank);
    out.push_back(card);
  }
  return true;
}

}  // namespace hogpen
