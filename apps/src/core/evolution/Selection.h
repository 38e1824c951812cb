#pragma once

#include "EvolutionConfig.h"
#include "EvolutionError.h"
#include "core/Result.h"

#include <cstddef>
#include <random>
#include <vector>

namespace GenePool {

class Chromosome;

// Indices into the evaluated population. first != second.
struct ParentPair {
    size_t first = 0;
    size_t second = 0;
};

/**
 * Draws parent pairs from an evaluated population.
 *
 * Pairs are drawn with replacement across calls and without replacement
 * within a pair, so a chromosome is never paired with itself.
 */
class SelectionMethod {
public:
    virtual ~SelectionMethod() = default;

    virtual Result<ParentPair, EvolutionError> selectPair(
        const std::vector<Chromosome>& population, std::mt19937& rng) const = 0;

    virtual const char* name() const = 0;

    // Repeated selectPair() until count pairs are collected or a draw fails.
    Result<std::vector<ParentPair>, EvolutionError> selectParents(
        const std::vector<Chromosome>& population, size_t count, std::mt19937& rng) const;
};

/**
 * Fitness-proportionate selection with weights max(fitness, 0)^2.
 */
class RouletteSelection : public SelectionMethod {
public:
    explicit RouletteSelection(
        DegenerateWeightPolicy degeneratePolicy = DegenerateWeightPolicy::Fail);

    Result<ParentPair, EvolutionError> selectPair(
        const std::vector<Chromosome>& population, std::mt19937& rng) const override;

    const char* name() const override { return "Roulette"; }

    static double weightFor(double fitness);

private:
    DegenerateWeightPolicy degeneratePolicy_;
};

/**
 * Linear rank selection: the i-th lowest fitness gets weight i + 1.
 */
class RankSelection : public SelectionMethod {
public:
    Result<ParentPair, EvolutionError> selectPair(
        const std::vector<Chromosome>& population, std::mt19937& rng) const override;

    const char* name() const override { return "Rank"; }
};

/**
 * Tournament selection: sample tournamentSize individuals without replacement
 * and return the two fittest. Ties go to the lower population index.
 */
class TournamentSelection : public SelectionMethod {
public:
    explicit TournamentSelection(int tournamentSize);

    Result<ParentPair, EvolutionError> selectPair(
        const std::vector<Chromosome>& population, std::mt19937& rng) const override;

    const char* name() const override { return "Tournament"; }

    int getTournamentSize() const { return tournamentSize_; }

private:
    int tournamentSize_;
};

} // namespace GenePool
