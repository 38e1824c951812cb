#pragma once

#include "Chromosome.h"
#include "EvaluationPool.h"
#include "EvolutionConfig.h"
#include "EvolutionError.h"
#include "FitnessProvider.h"
#include "PopulationFile.h"
#include "StrategyFactory.h"
#include "core/Result.h"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <variant>
#include <vector>

namespace GenePool {

/**
 * Statistics for one evaluated generation.
 */
struct GenerationStats {
    int generation = 0;
    size_t bestIndex = 0;
    double bestFitness = 0.0;
    double meanFitness = 0.0;
    double prevMeanFitness = 0.0;
    double improvementPercent = 0.0; // 100 * (mean - prevMean) / |prevMean|.
    int eliteCount = 0;
    int childCount = 0;
    int mutatedGenes = 0;
    std::vector<double> fitness; // Per member, in member order.
};

struct TrainOptions {
    int cycleBudget = -1; // Negative = run until convergence. 0 = evaluate only.
    double elitismFraction = 0.0;
    double stoppingThreshold = 0.01;
    std::optional<std::filesystem::path> savePath = std::nullopt;

    static TrainOptions fromConfig(const EvolutionConfig& config);
};

/**
 * Fixed-size population driving the generational loop:
 * evaluate -> elitism -> select -> breed -> mutate -> replace.
 *
 * Only evaluation runs in parallel (on the owned EvaluationPool); everything
 * else runs on the calling thread. All randomness comes from one seedable
 * std::mt19937 owned by the population.
 */
class Population {
public:
    using GeneInitializer = std::function<double(std::mt19937&)>;
    using GenerationCallback = std::function<void(const GenerationStats&)>;

    // geneInitializer defaults to uniform [initialGeneMin, initialGeneMax).
    static Result<Population, EvolutionError> create(
        const EvolutionConfig& config,
        int geneCount,
        FitnessProviderFactory providerFactory,
        Strategies strategies,
        GeneInitializer geneInitializer = nullptr);

    /**
     * Run generations until the budget is spent or the mean fitness converges,
     * then optionally save the population. Returns a copy of the best
     * chromosome of the last evaluated generation.
     */
    Result<Chromosome, EvolutionError> train(const TrainOptions& options);

    // One full generation. Fails without replacing members if any phase fails.
    Result<GenerationStats, EvolutionError> runGeneration(double elitismFraction);

    // Evaluating phase only: scores every member and updates best/mean.
    Result<GenerationStats, EvolutionError> evaluateGeneration();

    bool isConverged(double stoppingThreshold) const;

    static bool stoppingConditionMet(
        int generation,
        int minimumGenerations,
        double meanFitness,
        double prevMeanFitness,
        double stoppingThreshold);

    static int eliteCountFor(double elitismFraction, size_t populationSize);

    // Overwrite genes by index, all or nothing. Fitness is stale afterwards.
    Result<std::monostate, EvolutionError> loadGenes(const PopulationFile::GeneVectors& genes);
    Result<std::monostate, EvolutionError> loadFromFile(const std::filesystem::path& path);
    Result<std::monostate, EvolutionError> saveToFile(const std::filesystem::path& path) const;

    PopulationFile::GeneVectors geneVectors() const;

    void setGenerationCallback(GenerationCallback callback) { callback_ = std::move(callback); }

    const std::vector<Chromosome>& getMembers() const { return members_; }
    size_t getSize() const { return size_; }
    size_t getGeneCount() const { return geneCount_; }
    int getGeneration() const { return generation_; }
    double getMeanFitness() const { return meanFitness_; }
    double getPrevMeanFitness() const { return prevMeanFitness_; }
    const std::optional<Chromosome>& getBest() const { return best_; }
    const Strategies& getStrategies() const { return strategies_; }
    int getWorkerCount() const { return pool_->getWorkerCount(); }

private:
    Population(
        size_t size,
        size_t geneCount,
        int minimumGenerations,
        Strategies strategies,
        std::mt19937 rng,
        std::unique_ptr<EvaluationPool> pool);

    size_t size_;
    size_t geneCount_;
    int minimumGenerations_;
    std::vector<Chromosome> members_;
    int generation_ = 0;
    double meanFitness_ = 1.0;
    double prevMeanFitness_ = 1.0;
    std::optional<Chromosome> best_;
    Strategies strategies_;
    std::mt19937 rng_;
    std::unique_ptr<EvaluationPool> pool_;
    GenerationCallback callback_;
};

} // namespace GenePool
