#include "core/evolution/HighScoreLedger.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace GeneticCars;

TEST(HighScoreLedgerTest, KeepsOnlyTheBestCapacityEntries)
{
    HighScoreLedger ledger(20);

    for (uint32_t g = 1; g <= 25; ++g) {
        ledger.record(g, 0, static_cast<double>(g));
    }

    ASSERT_EQ(ledger.size(), 20u);
    EXPECT_DOUBLE_EQ(ledger.entries().front().fitness, 25.0);
    EXPECT_DOUBLE_EQ(ledger.entries().back().fitness, 6.0);
    for (size_t i = 0; i < ledger.size(); ++i) {
        EXPECT_EQ(ledger.entries()[i].rank, static_cast<int>(i + 1));
    }
}

TEST(HighScoreLedgerTest, EntriesStaySortedForUnorderedInserts)
{
    HighScoreLedger ledger(5);

    for (const double fitness : { 40.0, 10.0, 90.0, 55.0, 3.0, 70.0 }) {
        ledger.record(1, 0, fitness);
    }

    ASSERT_EQ(ledger.size(), 5u);
    for (size_t i = 1; i < ledger.size(); ++i) {
        EXPECT_GE(ledger.entries()[i - 1].fitness, ledger.entries()[i].fitness);
    }
    EXPECT_DOUBLE_EQ(ledger.entries().back().fitness, 10.0);
}

TEST(HighScoreLedgerTest, EqualFitnessKeepsEarlierGenerationFirst)
{
    HighScoreLedger ledger(5);

    ledger.record(4, 1, 50.0);
    ledger.record(2, 7, 50.0);
    ledger.record(6, 3, 50.0);

    ASSERT_EQ(ledger.size(), 3u);
    EXPECT_EQ(ledger.entries()[0].generation, 2u);
    EXPECT_EQ(ledger.entries()[1].generation, 4u);
    EXPECT_EQ(ledger.entries()[2].generation, 6u);
}

TEST(HighScoreLedgerTest, RecordReturnsRankOrNothing)
{
    HighScoreLedger ledger(2);

    EXPECT_EQ(ledger.record(1, 0, 10.0), 1);
    EXPECT_EQ(ledger.record(2, 0, 20.0), 1);
    EXPECT_EQ(ledger.record(3, 0, 15.0), 2);
    EXPECT_FALSE(ledger.record(4, 0, 1.0).has_value());
    EXPECT_EQ(ledger.size(), 2u);
}

TEST(HighScoreLedgerTest, EntryTextShowsRankGenerationAndDistance)
{
    HighScoreLedger ledger;
    ledger.record(3, 5, 12.346);

    EXPECT_EQ(ledger.entries().front().toString(), "1. Generation 3, 12.35 m");
}

TEST(HighScoreLedgerTest, ResetEmptiesTheLedger)
{
    HighScoreLedger ledger;
    ledger.record(1, 0, 1.0);

    ledger.reset();

    EXPECT_TRUE(ledger.empty());
    EXPECT_EQ(ledger.capacity(), HighScoreLedger::DefaultCapacity);
}

TEST(HighScoreLedgerTest, EntrySerializesAllFields)
{
    HighScoreLedger ledger;
    ledger.record(9, 4, 88.5);

    const nlohmann::json j = ledger.entries().front();

    EXPECT_EQ(j["rank"], 1);
    EXPECT_EQ(j["generation"], 9);
    EXPECT_EQ(j["individualId"], 4);
    EXPECT_DOUBLE_EQ(j["fitness"].get<double>(), 88.5);
}
