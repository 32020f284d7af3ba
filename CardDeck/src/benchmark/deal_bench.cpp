#include "core/deck.hpp"
#include <chrono>
#include <iostream>

using namespace Cards;

// wall time spent cycling the deck, in seconds
constexpr double BENCH_SECONDS = 1.0;

// reset, shuffle and deal out all 52 cards once
// returns the sum of dealt rank ordinals so the work can't be dropped
static long runCycle(Deck& deck) {
    deck.reset();
    deck.shuffle();
    long rankSum = 0;
    while (!deck.isEmpty()) {
        rankSum += ordinal(deck.dealOneCard().getRank());
    }
    return rankSum;
}

int main() {
    Deck deck;

    const auto started = std::chrono::steady_clock::now();
    std::chrono::duration<double> spent{0.0};

    long cycles = 0;
    long checksum = 0;
    while (spent.count() < BENCH_SECONDS) {
        checksum += runCycle(deck);
        ++cycles;
        spent = std::chrono::steady_clock::now() - started;
    }

    // every full deal sums to 4 * (0 + 1 + ... + 12) = 312
    if (checksum != cycles * 312) {
        std::cerr << "Error: deck dealt the wrong cards during the run\n";
        return 1;
    }

    double usPerCycle = std::chrono::duration<double, std::micro>(spent).count() / cycles;

    std::cout << cycles << " shuffle+deal cycles in " << spent.count() << "s\n";
    std::cout << usPerCycle << "us per cycle\n";

    return 0;
}
