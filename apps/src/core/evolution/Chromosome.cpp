#include "Chromosome.h"

#include "core/Assert.h"

#include <stdexcept>
#include <string>

namespace GenePool {

Result<Chromosome, EvolutionError> Chromosome::create(
    std::vector<double> genes, std::unique_ptr<FitnessProvider> provider)
{
    if (!provider) {
        return Result<Chromosome, EvolutionError>::error(
            EvolutionError::configuration("Chromosome requires a fitness provider"));
    }
    if (genes.size() != provider->parameterCount()) {
        return Result<Chromosome, EvolutionError>::error(EvolutionError::configuration(
            "Gene count " + std::to_string(genes.size()) + " does not match provider parameter "
            "count " + std::to_string(provider->parameterCount())));
    }

    auto configured = provider->configure(genes);
    if (configured.isError()) {
        return Result<Chromosome, EvolutionError>::error(
            EvolutionError::configuration(configured.errorValue()));
    }

    return Result<Chromosome, EvolutionError>::okay(
        Chromosome(std::move(genes), std::move(provider)));
}

Chromosome::Chromosome(std::vector<double> genes, std::unique_ptr<FitnessProvider> provider)
    : genes_(std::move(genes)), provider_(std::move(provider))
{}

Chromosome::Chromosome(const Chromosome& other)
    : genes_(other.genes_),
      fitness_(other.fitness_),
      provider_(other.provider_->clone()),
      providerStale_(other.providerStale_)
{}

Chromosome& Chromosome::operator=(const Chromosome& other)
{
    if (this != &other) {
        genes_ = other.genes_;
        fitness_ = other.fitness_;
        provider_ = other.provider_->clone();
        providerStale_ = other.providerStale_;
    }
    return *this;
}

Result<std::monostate, EvolutionError> Chromosome::configure(const std::vector<double>& genes)
{
    if (genes.size() != genes_.size()) {
        return Result<std::monostate, EvolutionError>::error(EvolutionError::configuration(
            "Expected " + std::to_string(genes_.size()) + " genes, got "
            + std::to_string(genes.size())));
    }

    auto configured = provider_->configure(genes);
    if (configured.isError()) {
        return Result<std::monostate, EvolutionError>::error(
            EvolutionError::configuration(configured.errorValue()));
    }

    genes_ = genes;
    providerStale_ = false;
    return Result<std::monostate, EvolutionError>::okay(std::monostate{});
}

double Chromosome::getGene(size_t index) const
{
    if (index >= genes_.size()) {
        throw std::out_of_range(
            "Gene index " + std::to_string(index) + " out of range (size "
            + std::to_string(genes_.size()) + ")");
    }
    return genes_[index];
}

void Chromosome::setGene(size_t index, double value)
{
    if (index >= genes_.size()) {
        throw std::out_of_range(
            "Gene index " + std::to_string(index) + " out of range (size "
            + std::to_string(genes_.size()) + ")");
    }
    genes_[index] = value;
    providerStale_ = true;
}

double Chromosome::computeFitness()
{
    syncProvider();
    return provider_->evaluate();
}

EvaluationSnapshot Chromosome::snapshot() const
{
    EvaluationSnapshot snapshot{ .genes = genes_, .provider = provider_->clone() };
    const auto configured = snapshot.provider->configure(snapshot.genes);
    GENEPOOL_ASSERT(configured.isValue(), "Provider rejected genes of its own chromosome");
    return snapshot;
}

std::unique_ptr<FitnessProvider> Chromosome::cloneProvider() const
{
    return provider_->clone();
}

void Chromosome::syncProvider()
{
    if (!providerStale_) {
        return;
    }

    const auto configured = provider_->configure(genes_);
    GENEPOOL_ASSERT(configured.isValue(), "Provider rejected genes of its own chromosome");
    providerStale_ = false;
}

} // namespace GenePool
