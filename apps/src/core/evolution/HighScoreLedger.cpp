#include "HighScoreLedger.h"

#include "core/Assert.h"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

namespace GeneticCars {

std::string HighScoreEntry::toString() const
{
    return fmt::format("{}. Generation {}, {:.2f} m", rank, generation, fitness);
}

HighScoreLedger::HighScoreLedger(size_t capacity) : capacity_(capacity)
{
    GENETICCARS_ASSERT(capacity_ > 0, "HighScoreLedger capacity must be positive");
    entries_.reserve(capacity_ + 1);
}

std::optional<int> HighScoreLedger::record(
    uint32_t generation, IndividualId individualId, double fitness)
{
    // Insert after every entry that is at least as good, which is where a stable sort
    // would leave the newest entry.
    size_t position = 0;
    while (position < entries_.size()) {
        const auto& existing = entries_[position];
        const bool newIsBetter = fitness > existing.fitness
            || (fitness == existing.fitness && generation < existing.generation);
        if (newIsBetter) {
            break;
        }
        ++position;
    }

    entries_.insert(
        entries_.begin() + static_cast<std::ptrdiff_t>(position),
        HighScoreEntry{
            .rank = 0,
            .generation = generation,
            .individualId = individualId,
            .fitness = fitness,
        });

    if (entries_.size() > capacity_) {
        entries_.resize(capacity_);
    }
    for (size_t i = 0; i < entries_.size(); ++i) {
        entries_[i].rank = static_cast<int>(i + 1);
    }

    if (position >= capacity_) {
        return std::nullopt;
    }
    return static_cast<int>(position + 1);
}

void HighScoreLedger::reset()
{
    entries_.clear();
}

void to_json(nlohmann::json& j, const HighScoreEntry& entry)
{
    j = nlohmann::json{
        { "rank", entry.rank },
        { "generation", entry.generation },
        { "individualId", entry.individualId },
        { "fitness", entry.fitness },
    };
}

} // namespace GeneticCars
