#include "StrategyFactory.h"

#include <string>

namespace GenePool {

Result<std::shared_ptr<const SelectionMethod>, EvolutionError> StrategyFactory::createSelection(
    const SelectionConfig& config, int populationSize)
{
    using SelectionResult = Result<std::shared_ptr<const SelectionMethod>, EvolutionError>;

    switch (config.kind) {
        case SelectionKind::Roulette:
            return SelectionResult::okay(
                std::make_shared<RouletteSelection>(config.degenerateWeights));
        case SelectionKind::Rank:
            return SelectionResult::okay(std::make_shared<RankSelection>());
        case SelectionKind::Tournament:
            if (config.tournamentSize < 2 || config.tournamentSize > populationSize) {
                return SelectionResult::error(EvolutionError::configuration(
                    "tournamentSize " + std::to_string(config.tournamentSize)
                    + " must be in [2, populationSize=" + std::to_string(populationSize) + "]"));
            }
            return SelectionResult::okay(
                std::make_shared<TournamentSelection>(config.tournamentSize));
    }
    return SelectionResult::error(EvolutionError::configuration("Unknown selection kind"));
}

Result<std::shared_ptr<const CrossoverMethod>, EvolutionError> StrategyFactory::createCrossover(
    const CrossoverConfig& config, int geneCount)
{
    using CrossoverResult = Result<std::shared_ptr<const CrossoverMethod>, EvolutionError>;

    switch (config.kind) {
        case CrossoverKind::OnePoint:
            return CrossoverResult::okay(std::make_shared<OnePointCrossover>());
        case CrossoverKind::KPoint:
            if (config.points < 1 || config.points > geneCount) {
                return CrossoverResult::error(EvolutionError::configuration(
                    "points " + std::to_string(config.points) + " must be in [1, geneCount="
                    + std::to_string(geneCount) + "]"));
            }
            return CrossoverResult::okay(std::make_shared<KPointCrossover>(config.points));
        case CrossoverKind::Uniform:
            return CrossoverResult::okay(std::make_shared<UniformCrossover>());
    }
    return CrossoverResult::error(EvolutionError::configuration("Unknown crossover kind"));
}

Result<std::shared_ptr<const MutationMethod>, EvolutionError> StrategyFactory::createMutation(
    const MutationConfig& config)
{
    using MutationResult = Result<std::shared_ptr<const MutationMethod>, EvolutionError>;

    if (config.rate < 0.0 || config.rate > 1.0) {
        return MutationResult::error(EvolutionError::configuration(
            "mutation rate " + std::to_string(config.rate) + " must be in [0, 1]"));
    }

    switch (config.kind) {
        case MutationKind::Noisy:
            return MutationResult::okay(
                std::make_shared<NoisyMutation>(config.rate, config.volume));
        case MutationKind::Flip:
            return MutationResult::okay(std::make_shared<FlipMutation>(config.rate));
        case MutationKind::Swap:
            return MutationResult::okay(std::make_shared<SwapMutation>(config.rate));
    }
    return MutationResult::error(EvolutionError::configuration("Unknown mutation kind"));
}

Result<Strategies, EvolutionError> StrategyFactory::createAll(
    const SelectionConfig& selection,
    const CrossoverConfig& crossover,
    const MutationConfig& mutation,
    int populationSize,
    int geneCount)
{
    auto selectionResult = createSelection(selection, populationSize);
    if (selectionResult.isError()) {
        return Result<Strategies, EvolutionError>::error(selectionResult.errorValue());
    }
    auto crossoverResult = createCrossover(crossover, geneCount);
    if (crossoverResult.isError()) {
        return Result<Strategies, EvolutionError>::error(crossoverResult.errorValue());
    }
    auto mutationResult = createMutation(mutation);
    if (mutationResult.isError()) {
        return Result<Strategies, EvolutionError>::error(mutationResult.errorValue());
    }

    return Result<Strategies, EvolutionError>::okay(Strategies{
        .selection = selectionResult.value(),
        .crossover = crossoverResult.value(),
        .mutation = mutationResult.value(),
    });
}

} // namespace GenePool
