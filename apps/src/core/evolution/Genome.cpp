#include "Genome.h"

#include "core/Assert.h"

#include <bit>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <unordered_set>

namespace GeneticCars {

Genome::Genome(size_t bitCount)
    : bitCount_(static_cast<uint32_t>(bitCount)), words_(wordCountFor(bitCount), 0)
{}

Genome Genome::random(size_t bitCount, std::mt19937& rng)
{
    Genome g(bitCount);

    // Two raw 32-bit draws per word. Runs are reproducible for a given build; operators and
    // selection use std distributions, so results can differ between standard libraries.
    for (auto& word : g.words_) {
        const uint64_t low = rng();
        const uint64_t high = rng();
        word = (high << 32) | low;
    }
    if (!g.words_.empty()) {
        g.words_.back() &= g.tailMask();
    }

    return g;
}

Genome Genome::ones(size_t bitCount)
{
    Genome g(bitCount);
    for (auto& word : g.words_) {
        word = ~uint64_t{ 0 };
    }
    if (!g.words_.empty()) {
        g.words_.back() &= g.tailMask();
    }
    return g;
}

Result<Genome, std::string> Genome::fromString(std::string_view bits)
{
    Genome g(bits.size());
    for (size_t i = 0; i < bits.size(); ++i) {
        if (bits[i] == '1') {
            g.words_[i / WORD_BITS] |= uint64_t{ 1 } << (i % WORD_BITS);
        }
        else if (bits[i] != '0') {
            return Result<Genome, std::string>::error(
                "Invalid genome character '" + std::string(1, bits[i]) + "' at position "
                + std::to_string(i));
        }
    }
    return Result<Genome, std::string>::okay(std::move(g));
}

Result<Genome, std::string> Genome::fromBitValues(const std::vector<uint8_t>& values)
{
    Genome g(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i] == 1) {
            g.words_[i / WORD_BITS] |= uint64_t{ 1 } << (i % WORD_BITS);
        }
        else if (values[i] != 0) {
            return Result<Genome, std::string>::error(
                "Bit value " + std::to_string(values[i]) + " at position " + std::to_string(i)
                + " is not 0 or 1");
        }
    }
    return Result<Genome, std::string>::okay(std::move(g));
}

Result<Genome, std::string> Genome::fromBytes(const std::vector<std::byte>& bytes)
{
    Genome g;
    zpp::bits::in in(bytes);
    if (zpp::bits::failure(in(g))) {
        return Result<Genome, std::string>::error("Truncated or malformed genome data");
    }

    if (g.words_.size() != wordCountFor(g.bitCount_)) {
        return Result<Genome, std::string>::error(
            "Genome data holds " + std::to_string(g.words_.size()) + " words for "
            + std::to_string(g.bitCount_) + " bits");
    }
    if (!g.words_.empty() && (g.words_.back() & ~g.tailMask()) != 0) {
        return Result<Genome, std::string>::error("Genome data has bits set past its length");
    }

    return Result<Genome, std::string>::okay(std::move(g));
}

bool Genome::bit(size_t index) const
{
    GENETICCARS_ASSERT_INDEX(index, bitCount_, "Genome bit");
    return (words_[index / WORD_BITS] >> (index % WORD_BITS)) & 1u;
}

Genome Genome::setBit(size_t index, bool value) const
{
    GENETICCARS_ASSERT_INDEX(index, bitCount_, "Genome bit");
    Genome g = *this;
    const uint64_t mask = uint64_t{ 1 } << (index % WORD_BITS);
    if (value) {
        g.words_[index / WORD_BITS] |= mask;
    }
    else {
        g.words_[index / WORD_BITS] &= ~mask;
    }
    return g;
}

Genome Genome::withFlippedBits(const std::vector<size_t>& positions) const
{
    Genome g = *this;
    std::unordered_set<size_t> seen;
    seen.reserve(positions.size() * 2);

    for (const size_t index : positions) {
        GENETICCARS_ASSERT_INDEX(index, bitCount_, "Genome flip position");
        GENETICCARS_ASSERT(seen.insert(index).second, "Genome flip position listed twice");
        g.words_[index / WORD_BITS] ^= uint64_t{ 1 } << (index % WORD_BITS);
    }
    return g;
}

uint64_t Genome::extract(size_t offset, size_t width) const
{
    GENETICCARS_ASSERT(width <= 64, "Genome field wider than 64 bits");
    GENETICCARS_ASSERT(offset + width <= bitCount_, "Genome field extends past the genome");

    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        value = (value << 1) | (bit(offset + i) ? 1u : 0u);
    }
    return value;
}

size_t Genome::hammingDistance(const Genome& other) const
{
    GENETICCARS_ASSERT(bitCount_ == other.bitCount_, "Hamming distance needs equal lengths");

    size_t distance = 0;
    for (size_t i = 0; i < words_.size(); ++i) {
        distance += static_cast<size_t>(std::popcount(words_[i] ^ other.words_[i]));
    }
    return distance;
}

std::string Genome::toString() const
{
    std::string text(bitCount_, '0');
    for (size_t i = 0; i < bitCount_; ++i) {
        if (bit(i)) {
            text[i] = '1';
        }
    }
    return text;
}

std::vector<uint8_t> Genome::toBitValues() const
{
    std::vector<uint8_t> values(bitCount_, 0);
    for (size_t i = 0; i < bitCount_; ++i) {
        values[i] = bit(i) ? 1 : 0;
    }
    return values;
}

std::vector<std::byte> Genome::toBytes() const
{
    std::vector<std::byte> data;
    zpp::bits::out out(data);
    out(*this).or_throw();
    return data;
}

bool Genome::operator==(const Genome& other) const
{
    return bitCount_ == other.bitCount_ && words_ == other.words_;
}

uint64_t Genome::tailMask() const
{
    const size_t used = bitCount_ % WORD_BITS;
    if (used == 0) {
        return ~uint64_t{ 0 };
    }
    return (uint64_t{ 1 } << used) - 1;
}

void to_json(nlohmann::json& j, const Genome& genome)
{
    j = genome.toString();
}

void from_json(const nlohmann::json& j, Genome& genome)
{
    auto result = Genome::fromString(j.get<std::string>());
    if (result.isError()) {
        throw std::runtime_error(result.errorValue());
    }
    genome = std::move(result.value());
}

} // namespace GeneticCars
