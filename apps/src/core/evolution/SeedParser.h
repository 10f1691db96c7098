#pragma once

#include "core/Result.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace GeneticCars {

/**
 * Turns user-entered seed text into a 64-bit seed.
 *
 *   "\x1F2E"  hexadecimal integer
 *   "\d1234"  decimal integer
 *   "dunes"   any other text is hashed (FNV-1a, 64 bit)
 *
 * Empty text is an error; the CLI substitutes the current date and time instead.
 */
Result<uint64_t, std::string> parseSeed(std::string_view text);

uint64_t hashSeedText(std::string_view text);

} // namespace GeneticCars
