#include "TrainRunner.h"
#include "core/LoggingChannels.h"
#include "core/evolution/BenchmarkProviders.h"
#include "core/evolution/StrategyFactory.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace GenePool {
namespace Client {

TrainResults TrainRunner::run(const TrainingConfig& config)
{
    TrainResults results;
    results.provider = config.provider;
    results.geneCount = config.geneCount;
    results.populationSize = config.evolution.populationSize;

    auto factory = createBenchmarkProviderFactory(config.provider, config.geneCount);
    if (factory.isError()) {
        results.errorMessage = factory.errorValue();
        LOG_ERROR(Cli, "{}", results.errorMessage);
        return results;
    }

    auto strategies = StrategyFactory::createAll(
        config.selection,
        config.crossover,
        config.mutation,
        config.evolution.populationSize,
        config.geneCount);
    if (strategies.isError()) {
        results.errorMessage = strategies.errorValue().message;
        LOG_ERROR(Cli, "Invalid strategy configuration: {}", results.errorMessage);
        return results;
    }

    auto created = Population::create(
        config.evolution, config.geneCount, factory.value(), strategies.value());
    if (created.isError()) {
        results.errorMessage = created.errorValue().message;
        LOG_ERROR(Cli, "Cannot create population: {}", results.errorMessage);
        return results;
    }
    Population population = std::move(created).value();

    // Resume from a previous run when the population file exists.
    if (config.populationFile.has_value()
        && std::filesystem::exists(config.populationFile.value())) {
        auto loaded = population.loadFromFile(config.populationFile.value());
        if (loaded.isError()) {
            results.errorMessage = loaded.errorValue().message;
            LOG_ERROR(
                Cli,
                "Cannot resume from {}: {}",
                config.populationFile.value(),
                results.errorMessage);
            return results;
        }
        results.resumed = true;
        LOG_INFO(Cli, "Resumed population from {}", config.populationFile.value());
    }

    bool anyGeneration = false;
    population.setGenerationCallback([&results, &anyGeneration](const GenerationStats& stats) {
        if (!anyGeneration || stats.bestFitness > results.bestFitnessAllTime) {
            results.bestFitnessAllTime = stats.bestFitness;
        }
        anyGeneration = true;
    });

    LOG_INFO(Cli, "Starting training:");
    LOG_INFO(Cli, "  Provider: {} ({} genes)", config.provider, config.geneCount);
    LOG_INFO(Cli, "  Population: {}", config.evolution.populationSize);
    LOG_INFO(
        Cli,
        "  Cycles: {}",
        config.evolution.cycleBudget < 0 ? std::string("until convergence")
                                         : std::to_string(config.evolution.cycleBudget));
    LOG_INFO(Cli, "  Elitism: {}", config.evolution.elitismFraction);
    LOG_INFO(Cli, "  Mutation rate: {}", config.mutation.rate);

    TrainOptions options = TrainOptions::fromConfig(config.evolution);
    if (config.populationFile.has_value()) {
        options.savePath = config.populationFile.value();
    }

    const auto startTime = std::chrono::steady_clock::now();
    auto best = population.train(options);
    const auto endTime = std::chrono::steady_clock::now();
    results.durationSec = std::chrono::duration<double>(endTime - startTime).count();
    results.totalGenerations = population.getGeneration();
    results.meanFitnessLastGen = population.getMeanFitness();

    if (best.isError()) {
        results.errorMessage = std::string(toString(best.errorValue().kind)) + " error: "
            + best.errorValue().message;
        LOG_ERROR(Cli, "Training failed: {}", results.errorMessage);
        return results;
    }

    results.bestFitness = best.value().getFitness();
    results.bestGenes = best.value().getGenes();

    if (config.bestOutputFile.has_value()) {
        auto written = writeBestOutput(config.bestOutputFile.value(), best.value());
        if (written.isError()) {
            results.errorMessage = written.errorValue();
            LOG_ERROR(Cli, "{}", results.errorMessage);
            return results;
        }
    }

    results.completed = true;
    LOG_INFO(
        Cli,
        "Training complete: {} generations in {:.2f}s, best fitness {:.6f}",
        results.totalGenerations,
        results.durationSec,
        results.bestFitness);
    return results;
}

Result<std::monostate, std::string> TrainRunner::writeBestOutput(
    const std::string& path, const Chromosome& best)
{
    nlohmann::json output;
    output["fitness"] = best.getFitness();
    output["genes"] = best.getGenes();

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return Result<std::monostate, std::string>::error("Cannot open " + path + " for writing");
    }
    file << output.dump(2) << std::endl;
    if (!file) {
        return Result<std::monostate, std::string>::error("Failed writing " + path);
    }

    LOG_INFO(Cli, "Wrote best chromosome to {}", path);
    return Result<std::monostate, std::string>::okay(std::monostate{});
}

} // namespace Client
} // namespace GenePool
