#pragma once

#include "core/Result.h"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <random>
#include <string>
#include <string_view>
#include <vector>
#include <zpp_bits.h>

namespace GeneticCars {

/**
 * Fixed-length bit vector encoding one vehicle.
 *
 * Genomes are immutable values: every transform returns a new Genome, so parents can be
 * shared between breeding workers without locking. Bit 0 is the first character of the
 * textual form.
 */
class Genome {
public:
    Genome() = default;

    // All bits zero.
    explicit Genome(size_t bitCount);

    static Genome random(size_t bitCount, std::mt19937& rng);
    static Genome ones(size_t bitCount);

    // Parse a string of '0'/'1' characters.
    static Result<Genome, std::string> fromString(std::string_view bits);

    // One value per bit, each 0 or 1 (the operator module wire format).
    static Result<Genome, std::string> fromBitValues(const std::vector<uint8_t>& values);

    // Inverse of toBytes(). Rejects truncated data and stray bits past the length.
    static Result<Genome, std::string> fromBytes(const std::vector<std::byte>& bytes);

    size_t size() const { return bitCount_; }
    bool empty() const { return bitCount_ == 0; }

    bool bit(size_t index) const;

    [[nodiscard]] Genome setBit(size_t index, bool value) const;

    // Bulk-flip constructor. Each position must be in range and listed once.
    [[nodiscard]] Genome withFlippedBits(const std::vector<size_t>& positions) const;

    // Unsigned value of bits [offset, offset + width), bit `offset` most significant.
    uint64_t extract(size_t offset, size_t width) const;

    size_t hammingDistance(const Genome& other) const;

    std::string toString() const;
    std::vector<uint8_t> toBitValues() const;
    std::vector<std::byte> toBytes() const;

    bool operator==(const Genome& other) const;
    bool operator!=(const Genome& other) const { return !(*this == other); }

    friend zpp::bits::access;
    using serialize = zpp::bits::members<2>;

private:
    static constexpr size_t WORD_BITS = 64;

    static size_t wordCountFor(size_t bitCount) { return (bitCount + WORD_BITS - 1) / WORD_BITS; }
    uint64_t tailMask() const;

    uint32_t bitCount_ = 0;
    std::vector<uint64_t> words_;
};

void to_json(nlohmann::json& j, const Genome& genome);
void from_json(const nlohmann::json& j, Genome& genome);

} // namespace GeneticCars
