#include "SeedParser.h"

#include <charconv>

namespace GeneticCars {

namespace {

Result<uint64_t, std::string> parseInteger(std::string_view digits, int base)
{
    if (digits.empty()) {
        return Result<uint64_t, std::string>::error("Seed prefix is missing its digits");
    }

    uint64_t value = 0;
    const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
    if (ec == std::errc::result_out_of_range) {
        return Result<uint64_t, std::string>::error(
            "Seed '" + std::string(digits) + "' does not fit in 64 bits");
    }
    if (ec != std::errc() || end != digits.data() + digits.size()) {
        return Result<uint64_t, std::string>::error(
            "Seed '" + std::string(digits) + "' is not a base-" + std::to_string(base)
            + " integer");
    }
    return Result<uint64_t, std::string>::okay(value);
}

} // namespace

uint64_t hashSeedText(std::string_view text)
{
    constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ull;
    constexpr uint64_t FNV_PRIME = 1099511628211ull;

    uint64_t hash = FNV_OFFSET_BASIS;
    for (const char c : text) {
        hash ^= static_cast<uint8_t>(c);
        hash *= FNV_PRIME;
    }
    return hash;
}

Result<uint64_t, std::string> parseSeed(std::string_view text)
{
    if (text.empty()) {
        return Result<uint64_t, std::string>::error("Seed text is empty");
    }

    if (text.size() >= 2 && text[0] == '\\') {
        if (text[1] == 'x' || text[1] == 'X') {
            return parseInteger(text.substr(2), 16);
        }
        if (text[1] == 'd' || text[1] == 'D') {
            return parseInteger(text.substr(2), 10);
        }
    }

    return Result<uint64_t, std::string>::okay(hashSeedText(text));
}

} // namespace GeneticCars
