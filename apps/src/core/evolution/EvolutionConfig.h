#pragma once

#include "core/ReflectSerializer.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>

namespace GenePool {

enum class SelectionKind : uint8_t { Roulette, Rank, Tournament };
enum class CrossoverKind : uint8_t { OnePoint, KPoint, Uniform };
enum class MutationKind : uint8_t { Noisy, Flip, Swap };

// What roulette selection does when every candidate weight is zero.
enum class DegenerateWeightPolicy : uint8_t { Fail, Uniform };

/**
 * Configuration for the generational loop.
 */
struct EvolutionConfig {
    int populationSize = 128;
    double elitismFraction = 0.1;    // floor(elitismFraction * populationSize) survive unchanged.
    double stoppingThreshold = 0.01; // Relative mean-fitness change that counts as converged.
    int cycleBudget = -1;            // -1 = run until convergence.
    int minimumGenerations = 10;     // Convergence is not checked before this generation.
    int maxParallelEvaluations = 0;  // 0 = auto (use detected core count).
    std::optional<uint32_t> rngSeed = std::nullopt;

    // Initial genes are drawn uniformly from [initialGeneMin, initialGeneMax).
    double initialGeneMin = 0.0;
    double initialGeneMax = 5.0;
};

struct SelectionConfig {
    SelectionKind kind = SelectionKind::Roulette;
    int tournamentSize = 3;
    DegenerateWeightPolicy degenerateWeights = DegenerateWeightPolicy::Fail;
};

struct CrossoverConfig {
    CrossoverKind kind = CrossoverKind::Uniform;
    int points = 2; // Cut points for KPoint.
};

/**
 * Configuration for child mutation.
 */
struct MutationConfig {
    MutationKind kind = MutationKind::Noisy;
    double rate = 0.1;    // Per gene for Noisy and Flip; Swap fires with probability 2 * rate.
    double volume = 0.05; // Relative perturbation size (Noisy).
};

inline void to_json(nlohmann::json& j, const EvolutionConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, EvolutionConfig& config)
{
    config = ReflectSerializer::from_json<EvolutionConfig>(j);
}

inline void to_json(nlohmann::json& j, const SelectionConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, SelectionConfig& config)
{
    config = ReflectSerializer::from_json<SelectionConfig>(j);
}

inline void to_json(nlohmann::json& j, const CrossoverConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, CrossoverConfig& config)
{
    config = ReflectSerializer::from_json<CrossoverConfig>(j);
}

inline void to_json(nlohmann::json& j, const MutationConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, MutationConfig& config)
{
    config = ReflectSerializer::from_json<MutationConfig>(j);
}

} // namespace GenePool
