#pragma once

#include "core/evolution/Population.h"
#include "core/evolution/TrainingConfig.h"

#include <string>
#include <vector>

namespace GenePool {
namespace Client {

/**
 * Results from a completed training run.
 */
struct TrainResults {
    std::string provider;
    int geneCount = 0;
    int populationSize = 0;
    int totalGenerations = 0;
    double durationSec = 0.0;

    double bestFitness = 0.0; // Best of the last evaluated generation.
    double bestFitnessAllTime = 0.0;
    double meanFitnessLastGen = 0.0;
    std::vector<double> bestGenes;

    bool resumed = false;
    bool completed = false;
    std::string errorMessage;
};

/**
 * Runs one in-process training session from a TrainingConfig.
 *
 * Builds the population, resumes from the population file when it exists,
 * trains, then writes the population and best-genes files. Per-generation
 * progress is reported by the engine on the evolution log channel.
 */
class TrainRunner {
public:
    TrainResults run(const TrainingConfig& config);

    static Result<std::monostate, std::string> writeBestOutput(
        const std::string& path, const Chromosome& best);
};

} // namespace Client
} // namespace GenePool
