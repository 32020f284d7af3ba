// small demo of the deck: shuffle, deal everything, hit the empty deck, reset
#include "core/deck.hpp"
#include "demo/seed_parser.hpp"
#include <cstdint>
#include <iostream>
#include <optional>

int main(int argc, char* argv[]) {
    using namespace Cards;

    if (argc > 2) {
        std::cerr << "usage: " << argv[0] << " [seed]\n";
        return 1;
    }

    std::optional<uint32_t> seed;
    if (argc == 2) {
        seed = Demo::parseSeed(argv[1]);
        if (!seed) {
            std::cerr << "Error: seed must be an unsigned 32-bit integer, got '" << argv[1] << "'\n";
            return 1;
        }
        std::cout << "using seed " << *seed << "\n";
    }

    // only fall back to std::random_device when no seed was given
    Deck deck = seed ? Deck(*seed) : Deck();

    deck.shuffle();

    int dealt = 0;
    while (!deck.isEmpty()) {
        Card c = deck.dealOneCard();
        std::cout << "Card " << dealt << ": " << c << "\n";
        ++dealt;
    }

    // the deck is empty now, so this one is expected to fail
    try {
        deck.dealOneCard();
        std::cerr << "Error: dealt a card from an empty deck!\n";
        return 1;
    } catch (const EmptyDeckError& e) {
        std::cout << "empty deck: " << e.what() << "\n";
    }

    deck.reset();
    std::cout << "after reset " << deck.getCardsRemaining() << " cards remaining, top card is "
              << deck.dealOneCard() << "\n";

    return 0;
}
