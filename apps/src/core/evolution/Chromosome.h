#pragma once

#include "EvolutionError.h"
#include "FitnessProvider.h"
#include "core/Result.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace GenePool {

/**
 * Self-contained copy of a chromosome for evaluation on a worker thread.
 * The provider is an independent clone already configured with the genes.
 */
struct EvaluationSnapshot {
    std::vector<double> genes;
    std::unique_ptr<FitnessProvider> provider;
};

/**
 * One candidate solution: a fixed-length gene vector plus the fitness
 * provider configured from it.
 *
 * Gene writes mark the provider stale; it is re-configured with the current
 * genes before fitness is read or a snapshot is taken.
 */
class Chromosome {
public:
    static Result<Chromosome, EvolutionError> create(
        std::vector<double> genes, std::unique_ptr<FitnessProvider> provider);

    Chromosome(const Chromosome& other);
    Chromosome& operator=(const Chromosome& other);
    Chromosome(Chromosome&&) noexcept = default;
    Chromosome& operator=(Chromosome&&) noexcept = default;
    ~Chromosome() = default;

    // Replace all genes. Fails without changes if the length differs.
    Result<std::monostate, EvolutionError> configure(const std::vector<double>& genes);

    // Bounds-checked point accessors. Throw std::out_of_range.
    double getGene(size_t index) const;
    void setGene(size_t index, double value);

    const std::vector<double>& getGenes() const { return genes_; }
    size_t size() const { return genes_.size(); }

    // Runs the provider on the calling thread.
    double computeFitness();

    double getFitness() const { return fitness_; }
    void setFitness(double fitness) { fitness_ = fitness; }

    EvaluationSnapshot snapshot() const;

    // Fresh provider of the same kind for a child chromosome.
    std::unique_ptr<FitnessProvider> cloneProvider() const;

private:
    Chromosome(std::vector<double> genes, std::unique_ptr<FitnessProvider> provider);

    void syncProvider();

    std::vector<double> genes_;
    double fitness_ = 0.0;
    std::unique_ptr<FitnessProvider> provider_;
    bool providerStale_ = false;
};

} // namespace GenePool
