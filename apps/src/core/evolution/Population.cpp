#include "Population.h"

#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <spdlog/fmt/ranges.h>
#include <string>

namespace GenePool {

TrainOptions TrainOptions::fromConfig(const EvolutionConfig& config)
{
    return TrainOptions{
        .cycleBudget = config.cycleBudget,
        .elitismFraction = config.elitismFraction,
        .stoppingThreshold = config.stoppingThreshold,
        .savePath = std::nullopt,
    };
}

Population::Population(
    size_t size,
    size_t geneCount,
    int minimumGenerations,
    Strategies strategies,
    std::mt19937 rng,
    std::unique_ptr<EvaluationPool> pool)
    : size_(size),
      geneCount_(geneCount),
      minimumGenerations_(minimumGenerations),
      strategies_(std::move(strategies)),
      rng_(rng),
      pool_(std::move(pool))
{}

Result<Population, EvolutionError> Population::create(
    const EvolutionConfig& config,
    int geneCount,
    FitnessProviderFactory providerFactory,
    Strategies strategies,
    GeneInitializer geneInitializer)
{
    using CreateResult = Result<Population, EvolutionError>;

    if (config.populationSize < 2) {
        return CreateResult::error(EvolutionError::configuration(
            "populationSize must be at least 2, got " + std::to_string(config.populationSize)));
    }
    if (geneCount < 1) {
        return CreateResult::error(EvolutionError::configuration(
            "geneCount must be at least 1, got " + std::to_string(geneCount)));
    }
    if (config.minimumGenerations < 0) {
        return CreateResult::error(
            EvolutionError::configuration("minimumGenerations must not be negative"));
    }
    if (!(config.initialGeneMin <= config.initialGeneMax)) {
        return CreateResult::error(
            EvolutionError::configuration("initialGeneMin must not exceed initialGeneMax"));
    }
    if (!providerFactory) {
        return CreateResult::error(EvolutionError::configuration("No fitness provider factory"));
    }
    if (!strategies.selection || !strategies.crossover || !strategies.mutation) {
        return CreateResult::error(
            EvolutionError::configuration("Selection, crossover and mutation are all required"));
    }

    if (!geneInitializer) {
        const double lo = config.initialGeneMin;
        const double hi = config.initialGeneMax;
        geneInitializer = [lo, hi](std::mt19937& rng) {
            std::uniform_real_distribution<double> dist(lo, hi);
            return dist(rng);
        };
    }

    const uint32_t seed =
        config.rngSeed.has_value() ? config.rngSeed.value() : std::random_device{}();
    std::mt19937 rng(seed);

    const int workerCount =
        EvaluationPool::resolveWorkerCount(config.maxParallelEvaluations, config.populationSize);

    Population population(
        static_cast<size_t>(config.populationSize),
        static_cast<size_t>(geneCount),
        config.minimumGenerations,
        std::move(strategies),
        rng,
        std::make_unique<EvaluationPool>(workerCount));

    population.members_.reserve(population.size_);
    for (size_t i = 0; i < population.size_; ++i) {
        std::vector<double> genes(population.geneCount_);
        for (auto& gene : genes) {
            gene = geneInitializer(population.rng_);
        }

        auto chromosome = Chromosome::create(std::move(genes), providerFactory());
        if (chromosome.isError()) {
            LOG_ERROR(
                Evolution,
                "Cannot create chromosome {}: {}",
                i,
                chromosome.errorValue().message);
            return CreateResult::error(chromosome.errorValue());
        }
        population.members_.push_back(std::move(chromosome).value());
    }

    LOG_INFO(
        Evolution,
        "Population created: size={}, genes={}, seed={}, workers={}, selection={}, crossover={}, "
        "mutation={}",
        population.size_,
        population.geneCount_,
        seed,
        workerCount,
        population.strategies_.selection->name(),
        population.strategies_.crossover->name(),
        population.strategies_.mutation->name());

    return CreateResult::okay(std::move(population));
}

int Population::eliteCountFor(double elitismFraction, size_t populationSize)
{
    const double raw = std::floor(elitismFraction * static_cast<double>(populationSize));
    return std::clamp(static_cast<int>(raw), 0, static_cast<int>(populationSize));
}

bool Population::stoppingConditionMet(
    int generation,
    int minimumGenerations,
    double meanFitness,
    double prevMeanFitness,
    double stoppingThreshold)
{
    if (generation < minimumGenerations) {
        return false;
    }

    double relativeChange = std::numeric_limits<double>::infinity();
    if (prevMeanFitness != 0.0) {
        relativeChange = std::abs(meanFitness - prevMeanFitness) / std::abs(prevMeanFitness);
    }
    else if (meanFitness == 0.0) {
        relativeChange = 0.0;
    }

    return relativeChange < stoppingThreshold;
}

bool Population::isConverged(double stoppingThreshold) const
{
    return stoppingConditionMet(
        generation_, minimumGenerations_, meanFitness_, prevMeanFitness_, stoppingThreshold);
}

Result<GenerationStats, EvolutionError> Population::evaluateGeneration()
{
    std::vector<EvaluationPool::WorkerTask> tasks;
    tasks.reserve(members_.size());
    for (size_t i = 0; i < members_.size(); ++i) {
        tasks.push_back(
            EvaluationPool::WorkerTask{ .index = i, .snapshot = members_[i].snapshot() });
    }

    auto fitnessResult = pool_->evaluate(std::move(tasks));
    if (fitnessResult.isError()) {
        return Result<GenerationStats, EvolutionError>::error(fitnessResult.errorValue());
    }
    const std::vector<double>& fitness = fitnessResult.value();
    GENEPOOL_ASSERT(fitness.size() == members_.size(), "Evaluation returned wrong count");

    size_t bestIndex = 0;
    for (size_t i = 0; i < members_.size(); ++i) {
        members_[i].setFitness(fitness[i]);
        if (fitness[i] > fitness[bestIndex]) {
            bestIndex = i;
        }
    }

    prevMeanFitness_ = meanFitness_;
    meanFitness_ = std::accumulate(fitness.begin(), fitness.end(), 0.0)
        / static_cast<double>(fitness.size());
    best_ = members_[bestIndex];

    GenerationStats stats;
    stats.generation = generation_;
    stats.bestIndex = bestIndex;
    stats.bestFitness = fitness[bestIndex];
    stats.meanFitness = meanFitness_;
    stats.prevMeanFitness = prevMeanFitness_;
    if (prevMeanFitness_ != 0.0) {
        stats.improvementPercent =
            100.0 * (meanFitness_ - prevMeanFitness_) / std::abs(prevMeanFitness_);
    }
    stats.fitness = fitness;
    return Result<GenerationStats, EvolutionError>::okay(std::move(stats));
}

Result<GenerationStats, EvolutionError> Population::runGeneration(double elitismFraction)
{
    using GenerationResult = Result<GenerationStats, EvolutionError>;

    if (!(elitismFraction >= 0.0 && elitismFraction <= 1.0)) {
        return GenerationResult::error(EvolutionError::configuration(
            "elitismFraction must be in [0, 1], got " + std::to_string(elitismFraction)));
    }

    auto evaluated = evaluateGeneration();
    if (evaluated.isError()) {
        return evaluated;
    }
    GenerationStats stats = std::move(evaluated).value();

    const int eliteCount = eliteCountFor(elitismFraction, size_);
    const size_t childCount = size_ - static_cast<size_t>(eliteCount);

    std::vector<ParentPair> pairs;
    if (childCount > 0) {
        auto selected = strategies_.selection->selectParents(members_, childCount, rng_);
        if (selected.isError()) {
            LOG_ERROR(
                Evolution,
                "Generation {}: parent selection failed: {}",
                generation_,
                selected.errorValue().message);
            return GenerationResult::error(selected.errorValue());
        }
        pairs = std::move(selected).value();
    }

    std::vector<Chromosome> children;
    children.reserve(childCount);
    int mutatedGenes = 0;
    for (const auto& pair : pairs) {
        Chromosome child =
            strategies_.crossover->breed(members_[pair.first], members_[pair.second], rng_);
        mutatedGenes += strategies_.mutation->mutate(child, rng_);
        children.push_back(std::move(child));
    }

    // Stable, so equal fitness keeps population order.
    std::vector<size_t> order(size_);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [this](size_t a, size_t b) {
        return members_[a].getFitness() > members_[b].getFitness();
    });

    std::vector<Chromosome> next;
    next.reserve(size_);
    for (int i = 0; i < eliteCount; ++i) {
        next.push_back(std::move(members_[order[i]]));
    }
    for (auto& child : children) {
        next.push_back(std::move(child));
    }
    GENEPOOL_ASSERT(next.size() == size_, "Replacement changed the population size");

    members_ = std::move(next);

    stats.eliteCount = eliteCount;
    stats.childCount = static_cast<int>(childCount);
    stats.mutatedGenes = mutatedGenes;

    LOG_INFO(
        Evolution,
        "Gen {}: best={:.6f} mean={:.6f} change={:+.3f}% elites={} children={}",
        stats.generation,
        stats.bestFitness,
        stats.meanFitness,
        stats.improvementPercent,
        stats.eliteCount,
        stats.childCount);
    LOG_DEBUG(
        Evolution,
        "Gen {} fitness: [{:.6f}]",
        stats.generation,
        fmt::join(stats.fitness, ", "));

    ++generation_;

    if (callback_) {
        callback_(stats);
    }

    return GenerationResult::okay(std::move(stats));
}

Result<Chromosome, EvolutionError> Population::train(const TrainOptions& options)
{
    using TrainResult = Result<Chromosome, EvolutionError>;

    if (!(options.elitismFraction >= 0.0 && options.elitismFraction <= 1.0)) {
        return TrainResult::error(EvolutionError::configuration(
            "elitismFraction must be in [0, 1], got " + std::to_string(options.elitismFraction)));
    }
    if (!(options.stoppingThreshold >= 0.0)) {
        return TrainResult::error(
            EvolutionError::configuration("stoppingThreshold must not be negative"));
    }

    LOG_INFO(
        Evolution,
        "Training: budget={}, elitism={}, threshold={}",
        options.cycleBudget < 0 ? std::string("unbounded") : std::to_string(options.cycleBudget),
        options.elitismFraction,
        options.stoppingThreshold);

    const int startGeneration = generation_;

    if (options.cycleBudget == 0) {
        auto evaluated = evaluateGeneration();
        if (evaluated.isError()) {
            return TrainResult::error(evaluated.errorValue());
        }
        if (callback_) {
            callback_(evaluated.value());
        }
    }

    int remaining = options.cycleBudget;
    while (remaining != 0) {
        auto generation = runGeneration(options.elitismFraction);
        if (generation.isError()) {
            LOG_ERROR(
                Evolution,
                "Training stopped at generation {}: {}",
                generation_,
                generation.errorValue().message);
            return TrainResult::error(generation.errorValue());
        }

        if (remaining > 0) {
            --remaining;
        }

        if (isConverged(options.stoppingThreshold)) {
            LOG_INFO(
                Evolution,
                "Converged at generation {} (mean {:.6f}, previous {:.6f})",
                generation_,
                meanFitness_,
                prevMeanFitness_);
            break;
        }
    }

    GENEPOOL_ASSERT(best_.has_value(), "Training finished without an evaluated generation");

    LOG_INFO(
        Evolution,
        "Training finished after {} generations, best fitness {:.6f}",
        generation_ - startGeneration,
        best_->getFitness());

    if (options.savePath.has_value()) {
        auto saved = saveToFile(options.savePath.value());
        if (saved.isError()) {
            return TrainResult::error(saved.errorValue());
        }
    }

    return TrainResult::okay(*best_);
}

Result<std::monostate, EvolutionError> Population::loadGenes(
    const PopulationFile::GeneVectors& genes)
{
    using LoadResult = Result<std::monostate, EvolutionError>;

    if (genes.size() != size_) {
        return LoadResult::error(EvolutionError::configuration(
            "Loaded population has " + std::to_string(genes.size())
            + " chromosomes, expected " + std::to_string(size_)));
    }
    for (size_t i = 0; i < genes.size(); ++i) {
        if (genes[i].size() != geneCount_) {
            return LoadResult::error(EvolutionError::configuration(
                "Loaded chromosome " + std::to_string(i) + " has " + std::to_string(genes[i].size())
                + " genes, expected " + std::to_string(geneCount_)));
        }
    }

    // Stage on copies so a provider rejecting genes leaves the population untouched.
    std::vector<Chromosome> staged = members_;
    for (size_t i = 0; i < staged.size(); ++i) {
        auto configured = staged[i].configure(genes[i]);
        if (configured.isError()) {
            return LoadResult::error(configured.errorValue());
        }
        staged[i].setFitness(0.0);
    }

    members_ = std::move(staged);
    best_.reset();
    return LoadResult::okay(std::monostate{});
}

Result<std::monostate, EvolutionError> Population::loadFromFile(const std::filesystem::path& path)
{
    auto genes = PopulationFile::load(path);
    if (genes.isError()) {
        return Result<std::monostate, EvolutionError>::error(genes.errorValue());
    }
    return loadGenes(genes.value());
}

Result<std::monostate, EvolutionError> Population::saveToFile(
    const std::filesystem::path& path) const
{
    return PopulationFile::save(path, geneVectors());
}

PopulationFile::GeneVectors Population::geneVectors() const
{
    PopulationFile::GeneVectors genes;
    genes.reserve(members_.size());
    for (const auto& member : members_) {
        genes.push_back(member.getGenes());
    }
    return genes;
}

} // namespace GenePool
