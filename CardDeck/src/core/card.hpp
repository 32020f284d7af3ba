#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace Cards {

// CONFIGURATION

constexpr int NUM_RANKS = 13;
constexpr int NUM_SUITS = 4;
constexpr int DECK_SIZE = NUM_RANKS * NUM_SUITS;

// face values, ordinal 0 (Two) up to 12 (Ace)
enum class Rank : uint8_t {
    Two = 0,
    Three,
    Four,
    Five,
    Six,
    Seven,
    Eight,
    Nine,
    Ten,
    Jack,
    Queen,
    King,
    Ace
};

// the order here is also the order a fresh deck is built in
enum class Suit : uint8_t {
    Hearts = 0,
    Diamonds,
    Spades,
    Clubs
};

constexpr std::array<Rank, NUM_RANKS> ALL_RANKS = {
    Rank::Two, Rank::Three, Rank::Four, Rank::Five, Rank::Six,
    Rank::Seven, Rank::Eight, Rank::Nine, Rank::Ten,
    Rank::Jack, Rank::Queen, Rank::King, Rank::Ace
};

constexpr std::array<Suit, NUM_SUITS> ALL_SUITS = {
    Suit::Hearts, Suit::Diamonds, Suit::Spades, Suit::Clubs
};

constexpr int ordinal(Rank r) { return static_cast<int>(r); }
constexpr int ordinal(Suit s) { return static_cast<int>(s); }

// "2".."10", "Jack", "Queen", "King", "Ace"
std::string toString(Rank r);

// "Hearts", "Diamonds", "Spades", "Clubs"
std::string toString(Suit s);

/**
 * One playing card: a rank and a suit, fixed for the card's lifetime.
 *
 * Equality is type-exact: a class derived from Card never compares equal
 * to a plain Card, even when rank and suit match.
 */
class Card {
public:
    Card(Rank rank, Suit suit) : rank_(rank), suit_(suit) {}
    Card(const Card&) = default;
    Card& operator=(const Card&) = default;
    virtual ~Card() = default;

    Rank getRank() const { return rank_; }
    Suit getSuit() const { return suit_; }

    bool equals(const Card& other) const;

    // (rank ordinal << 8) | suit ordinal
    std::size_t hashCode() const;

    // e.g. "Ace of Spades"
    std::string toString() const;

private:
    Rank rank_;
    Suit suit_;
};

inline bool operator==(const Card& a, const Card& b) { return a.equals(b); }
inline bool operator!=(const Card& a, const Card& b) { return !a.equals(b); }

std::ostream& operator<<(std::ostream& os, Rank r);
std::ostream& operator<<(std::ostream& os, Suit s);
std::ostream& operator<<(std::ostream& os, const Card& card);

}

namespace std {

template <>
struct hash<Cards::Card> {
    size_t operator()(const Cards::Card& card) const {
        return card.hashCode();
    }
};

}
