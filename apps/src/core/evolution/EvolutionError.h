#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace GenePool {

/**
 * Error reported by the evolution engine.
 *
 * The kind lets callers tell a bad configuration apart from a failed fitness
 * computation or a selection draw that had nothing to draw from.
 */
struct EvolutionError {
    enum class Kind : uint8_t {
        Configuration = 0,
        Provider = 1,
        DegenerateDistribution = 2,
        Persistence = 3,
    };

    Kind kind = Kind::Configuration;
    std::string message;

    static EvolutionError configuration(std::string message)
    {
        return EvolutionError{ .kind = Kind::Configuration, .message = std::move(message) };
    }

    static EvolutionError provider(std::string message)
    {
        return EvolutionError{ .kind = Kind::Provider, .message = std::move(message) };
    }

    static EvolutionError degenerateDistribution(std::string message)
    {
        return EvolutionError{ .kind = Kind::DegenerateDistribution,
                               .message = std::move(message) };
    }

    static EvolutionError persistence(std::string message)
    {
        return EvolutionError{ .kind = Kind::Persistence, .message = std::move(message) };
    }
};

inline const char* toString(EvolutionError::Kind kind)
{
    switch (kind) {
        case EvolutionError::Kind::Configuration:
            return "configuration";
        case EvolutionError::Kind::Provider:
            return "provider";
        case EvolutionError::Kind::DegenerateDistribution:
            return "degenerate-distribution";
        case EvolutionError::Kind::Persistence:
            return "persistence";
    }
    return "unknown";
}

} // namespace GenePool
