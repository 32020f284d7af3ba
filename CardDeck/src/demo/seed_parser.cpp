#include "seed_parser.hpp"
#include <cctype>
#include <limits>

namespace Demo {

std::optional<uint32_t> parseSeed(const std::string& input) {
    if (input.empty()) {
        return std::nullopt;
    }

    constexpr uint64_t MAX_SEED = std::numeric_limits<uint32_t>::max();

    uint64_t value = 0;
    for (char ch : input) {
        // this also rejects a leading '-' or '+'
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return std::nullopt;
        }

        value = value * 10 + static_cast<uint64_t>(ch - '0');

        // stop before the next digit could overflow the accumulator
        if (value > MAX_SEED) {
            return std::nullopt;
        }
    }

    return static_cast<uint32_t>(value);
}

}
