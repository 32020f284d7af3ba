#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace Demo {

// turns a command line seed like "2024" into the engine seed
// only plain decimal digits are accepted, no sign, no spaces, nothing past uint32 max
std::optional<uint32_t> parseSeed(const std::string& input);

}
