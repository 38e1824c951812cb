#pragma once

#include "EvolutionConfig.h"
#include "core/ReflectSerializer.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace GenePool {

/**
 * Everything one training run needs, as read from e.g. config/train.json.
 *
 *   {
 *     "provider": "sphere",
 *     "geneCount": 10,
 *     "evolution": { "populationSize": 64, "rngSeed": 7 },
 *     "selection": { "kind": "Tournament", "tournamentSize": 4 },
 *     "crossover": { "kind": "KPoint", "points": 2 },
 *     "mutation": { "kind": "Noisy", "rate": 0.1, "volume": 0.05 },
 *     "populationFile": "current_pop.json"
 *   }
 */
struct TrainingConfig {
    std::string provider = "sphere";
    int geneCount = 10;
    EvolutionConfig evolution;
    SelectionConfig selection;
    CrossoverConfig crossover;
    MutationConfig mutation;
    std::optional<std::string> populationFile = std::nullopt; // Loaded if present, saved at end.
    std::optional<std::string> bestOutputFile = std::nullopt;
};

inline void to_json(nlohmann::json& j, const TrainingConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, TrainingConfig& config)
{
    config = ReflectSerializer::from_json<TrainingConfig>(j);
}

} // namespace GenePool
