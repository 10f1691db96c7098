#pragma once

#include "spdlog/spdlog.h"
#include <cstdlib>

/**
 * Engine invariants. Both macros stay in release builds, log at critical level through
 * spdlog and then abort.
 *
 * A failed assert is a bug in the engine, never bad user input: user input (configs,
 * fitness reports, genome strings, operator modules) is rejected through Result instead.
 *
 *   GENETICCARS_ASSERT(population_.size() == populationSize, "Population size drifted");
 *   GENETICCARS_ASSERT_INDEX(index, bitCount_, "Genome bit");
 */
#define GENETICCARS_ASSERT(condition, message)                                              \
    do {                                                                                    \
        if (!(condition)) {                                                                 \
            spdlog::critical("ASSERTION FAILED: {} at {}:{}", message, __FILE__, __LINE__); \
            spdlog::critical("  Condition: {}", #condition);                                \
            std::abort();                                                                   \
        }                                                                                   \
    } while (0)

// Bounds check that reports the offending index and the size it was checked against.
#define GENETICCARS_ASSERT_INDEX(index, size, what)                                  \
    do {                                                                             \
        const auto geneticcarsIndex_ = (index);                                      \
        const auto geneticcarsSize_ = (size);                                        \
        if (!(geneticcarsIndex_ < geneticcarsSize_)) {                               \
            spdlog::critical(                                                        \
                "ASSERTION FAILED: {} index {} out of range [0, {}) at {}:{}",       \
                what,                                                                \
                geneticcarsIndex_,                                                   \
                geneticcarsSize_,                                                    \
                __FILE__,                                                            \
                __LINE__);                                                           \
            std::abort();                                                            \
        }                                                                            \
    } while (0)
