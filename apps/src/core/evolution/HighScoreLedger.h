#pragma once

#include "Individual.h"

#include <cstddef>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace GeneticCars {

struct HighScoreEntry {
    int rank = 0; // 1-based; the only field that changes after insertion.
    uint32_t generation = 0;
    IndividualId individualId = 0;
    double fitness = 0.0;

    // "3. Generation 12, 184.27 m"
    std::string toString() const;
};

/**
 * Best-ever scores, sorted descending by fitness and bounded to a fixed capacity.
 *
 * Ties keep the earlier generation ahead, then the earlier insertion.
 */
class HighScoreLedger {
public:
    static constexpr size_t DefaultCapacity = 20;

    explicit HighScoreLedger(size_t capacity = DefaultCapacity);

    // Rank of the new entry, or nullopt if it fell off the end.
    std::optional<int> record(uint32_t generation, IndividualId individualId, double fitness);

    void reset();

    const std::vector<HighScoreEntry>& entries() const { return entries_; }
    size_t capacity() const { return capacity_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    size_t capacity_;
    std::vector<HighScoreEntry> entries_;
};

void to_json(nlohmann::json& j, const HighScoreEntry& entry);

} // namespace GeneticCars
