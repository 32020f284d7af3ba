#pragma once

#include "card.hpp"
#include "empty_deck_error.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <random>
#include <vector>

namespace Cards {

/**
 * A full 52-card deck that can be shuffled, dealt from and reset.
 *
 * Dealt cards are never removed from storage: cardsRemaining_ marks where the
 * undealt ("live") part of the sequence ends, and reset() just moves it back
 * to the end. Cards are dealt from index cardsRemaining_ - 1 downwards.
 *
 * NOT thread safe. Even with locked methods there would be a race between
 * isEmpty() and dealOneCard(), so a caller sharing a deck across threads has
 * to hold its own lock around both calls.
 */
class Deck {
public:
    // unshuffled deck, engine seeded from std::random_device
    Deck();

    // unshuffled deck with a fixed engine seed, for repeatable shuffles
    explicit Deck(uint32_t seed);

    Deck(const Deck&) = default;
    Deck& operator=(const Deck&) = default;
    virtual ~Deck() = default;

    // Knuth shuffle of the undealt cards only
    void shuffle();

    bool isEmpty() const { return cardsRemaining_ == 0; }

    // throws EmptyDeckError when no cards are left
    Card dealOneCard();

    int getCardsRemaining() const { return cardsRemaining_; }

    // every card is back, in whatever order the last shuffle left them
    void reset();

    // same type, same cardsRemaining and same undealt cards in the same order
    bool equals(const Deck& other) const;

    // only looks at the undealt cards so it agrees with equals()
    std::size_t hashCode() const;

private:
    void constructDeck();

    std::vector<Card> cards_;
    int cardsRemaining_;
    std::mt19937 generator_;
};

inline bool operator==(const Deck& a, const Deck& b) { return a.equals(b); }
inline bool operator!=(const Deck& a, const Deck& b) { return !a.equals(b); }

}

namespace std {

template <>
struct hash<Cards::Deck> {
    size_t operator()(const Cards::Deck& deck) const {
        return deck.hashCode();
    }
};

}
