#include "deck.hpp"
#include <algorithm>
#include <typeinfo>
#include <utility>

namespace Cards {

Deck::Deck() : cardsRemaining_(0), generator_(std::random_device{}()) {
    constructDeck();
}

Deck::Deck(uint32_t seed) : cardsRemaining_(0), generator_(seed) {
    constructDeck();
}

// rank-major, suit-minor: 2 of Hearts, 2 of Diamonds, 2 of Spades, 2 of Clubs, 3 of Hearts...
void Deck::constructDeck() {
    cards_.reserve(DECK_SIZE);
    for (Rank r : ALL_RANKS) {
        for (Suit s : ALL_SUITS) {
            cards_.emplace_back(r, s);
        }
    }
    cardsRemaining_ = static_cast<int>(cards_.size());
}

void Deck::shuffle() {
    // stops at 1, at 0 we would only ever swap the first card with itself
    for (int i = cardsRemaining_ - 1; i > 0; --i) {
        std::uniform_int_distribution<int> dist(0, i);
        int swapee = dist(generator_);
        std::swap(cards_[i], cards_[swapee]);
    }
}

Card Deck::dealOneCard() {
    if (cardsRemaining_ == 0) {
        throw EmptyDeckError("No cards remaining to deal!");
    }

    // take the last live card and move the boundary down past it
    return cards_[--cardsRemaining_];
}

void Deck::reset() {
    cardsRemaining_ = static_cast<int>(cards_.size());
}

bool Deck::equals(const Deck& other) const {
    if (this == &other) {
        return true;
    }

    // a derived deck is never equal to a Deck
    if (typeid(*this) != typeid(other)) {
        return false;
    }

    if (cardsRemaining_ != other.cardsRemaining_) {
        return false;
    }

    // dealt cards don't count, so two empty decks are always equal
    return std::equal(cards_.begin(), cards_.begin() + cardsRemaining_,
                      other.cards_.begin());
}

std::size_t Deck::hashCode() const {
    std::size_t h = static_cast<std::size_t>(cardsRemaining_);
    for (int i = 0; i < cardsRemaining_; ++i) {
        h = h * 31 + cards_[i].hashCode();
    }
    return h;
}

}
