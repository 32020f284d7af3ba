#include "card.hpp"
#include <typeinfo>

namespace Cards {

std::string toString(Rank r) {
    switch (r) {
        case Rank::Two:   return "2";
        case Rank::Three: return "3";
        case Rank::Four:  return "4";
        case Rank::Five:  return "5";
        case Rank::Six:   return "6";
        case Rank::Seven: return "7";
        case Rank::Eight: return "8";
        case Rank::Nine:  return "9";
        case Rank::Ten:   return "10";
        case Rank::Jack:  return "Jack";
        case Rank::Queen: return "Queen";
        case Rank::King:  return "King";
        case Rank::Ace:   return "Ace";
    }
    return "?";
}

std::string toString(Suit s) {
    switch (s) {
        case Suit::Hearts:   return "Hearts";
        case Suit::Diamonds: return "Diamonds";
        case Suit::Spades:   return "Spades";
        case Suit::Clubs:    return "Clubs";
    }
    return "?";
}

bool Card::equals(const Card& other) const {
    if (this == &other) {
        return true;
    }

    // a derived card may carry extra state, so it never matches a base card
    if (typeid(*this) != typeid(other)) {
        return false;
    }

    return rank_ == other.rank_ && suit_ == other.suit_;
}

std::size_t Card::hashCode() const {
    return (static_cast<std::size_t>(ordinal(rank_)) << 8) |
           static_cast<std::size_t>(ordinal(suit_));
}

std::string Card::toString() const {
    return Cards::toString(rank_) + " of " + Cards::toString(suit_);
}

std::ostream& operator<<(std::ostream& os, Rank r) {
    return os << toString(r);
}

std::ostream& operator<<(std::ostream& os, Suit s) {
    return os << toString(s);
}

std::ostream& operator<<(std::ostream& os, const Card& card) {
    return os << card.toString();
}

}
