#pragma once

#include "spdlog/spdlog.h"
#include <cstdlib>

/**
 * Runtime assertion that works in both debug and release builds.
 *
 * Unlike standard assert(), GENEPOOL_ASSERT is never compiled out.
 * Use for internal invariants whose violation means a bug in the engine,
 * never for input validation (that goes through Result).
 *
 * Example:
 *   GENEPOOL_ASSERT(next.size() == size_, "Population size drifted during replacement");
 */
#define GENEPOOL_ASSERT(condition, message)                                                 \
    do {                                                                                    \
        if (!(condition)) {                                                                 \
            spdlog::critical("ASSERTION FAILED: {} at {}:{}", message, __FILE__, __LINE__); \
            spdlog::critical("  Condition: {}", #condition);                                \
            std::abort();                                                                   \
        }                                                                                   \
    } while (0)
