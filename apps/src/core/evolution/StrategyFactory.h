#pragma once

#include "Crossover.h"
#include "EvolutionConfig.h"
#include "EvolutionError.h"
#include "Mutation.h"
#include "Selection.h"
#include "core/Result.h"

#include <memory>

namespace GenePool {

// Strategy objects shared by reference for the whole run.
struct Strategies {
    std::shared_ptr<const SelectionMethod> selection;
    std::shared_ptr<const CrossoverMethod> crossover;
    std::shared_ptr<const MutationMethod> mutation;
};

/**
 * Builds strategy objects from configuration, rejecting parameters the
 * strategy could never run with (tournament larger than the population,
 * more cut points than genes, rates outside [0, 1]).
 */
class StrategyFactory {
public:
    static Result<std::shared_ptr<const SelectionMethod>, EvolutionError> createSelection(
        const SelectionConfig& config, int populationSize);

    static Result<std::shared_ptr<const CrossoverMethod>, EvolutionError> createCrossover(
        const CrossoverConfig& config, int geneCount);

    static Result<std::shared_ptr<const MutationMethod>, EvolutionError> createMutation(
        const MutationConfig& config);

    static Result<Strategies, EvolutionError> createAll(
        const SelectionConfig& selection,
        const CrossoverConfig& crossover,
        const MutationConfig& mutation,
        int populationSize,
        int geneCount);
};

} // namespace GenePool
