#include "Crossover.h"

#include "Chromosome.h"
#include "core/Assert.h"

#include <algorithm>
#include <iterator>
#include <numeric>

namespace GenePool {

Chromosome CrossoverMethod::breed(
    const Chromosome& parent1, const Chromosome& parent2, std::mt19937& rng) const
{
    GENEPOOL_ASSERT(parent1.size() == parent2.size(), "Crossover parents differ in gene count");
    return breedWithRule(parent1, parent2, inheritanceRule(parent1.size(), rng));
}

Chromosome CrossoverMethod::breedWithRule(
    const Chromosome& parent1, const Chromosome& parent2, const std::vector<bool>& rule)
{
    GENEPOOL_ASSERT(parent1.size() == parent2.size(), "Crossover parents differ in gene count");
    GENEPOOL_ASSERT(rule.size() == parent1.size(), "Inheritance rule length mismatch");

    std::vector<double> genes(rule.size());
    for (size_t i = 0; i < rule.size(); ++i) {
        genes[i] = rule[i] ? parent1.getGene(i) : parent2.getGene(i);
    }

    auto child = Chromosome::create(std::move(genes), parent1.cloneProvider());
    GENEPOOL_ASSERT(child.isValue(), "Provider rejected a child of matching gene count");
    return std::move(child).value();
}

std::vector<bool> OnePointCrossover::inheritanceRule(size_t geneCount, std::mt19937& rng) const
{
    GENEPOOL_ASSERT(geneCount > 0, "Crossover needs at least one gene");
    std::uniform_int_distribution<size_t> dist(0, geneCount - 1);
    return ruleFromCutPoint(geneCount, dist(rng));
}

std::vector<bool> OnePointCrossover::ruleFromCutPoint(size_t geneCount, size_t cut)
{
    std::vector<bool> rule(geneCount);
    for (size_t i = 0; i < geneCount; ++i) {
        rule[i] = i < cut;
    }
    return rule;
}

KPointCrossover::KPointCrossover(int points) : points_(points)
{
    GENEPOOL_ASSERT(points_ > 0, "KPointCrossover needs at least one cut point");
}

std::vector<bool> KPointCrossover::inheritanceRule(size_t geneCount, std::mt19937& rng) const
{
    GENEPOOL_ASSERT(
        static_cast<size_t>(points_) <= geneCount, "More cut points than genes to cut");

    std::vector<size_t> positions(geneCount);
    std::iota(positions.begin(), positions.end(), 0);

    // std::sample keeps input order, so the cuts come out sorted.
    std::vector<size_t> cuts;
    cuts.reserve(points_);
    std::sample(
        positions.begin(),
        positions.end(),
        std::back_inserter(cuts),
        static_cast<size_t>(points_),
        rng);

    return ruleFromCutPoints(geneCount, cuts);
}

std::vector<bool> KPointCrossover::ruleFromCutPoints(
    size_t geneCount, const std::vector<size_t>& cuts)
{
    std::vector<bool> rule(geneCount);
    bool fromFirst = true;
    size_t nextCut = 0;
    for (size_t i = 0; i < geneCount; ++i) {
        while (nextCut < cuts.size() && cuts[nextCut] == i) {
            fromFirst = !fromFirst;
            ++nextCut;
        }
        rule[i] = fromFirst;
    }
    return rule;
}

std::vector<bool> UniformCrossover::inheritanceRule(size_t geneCount, std::mt19937& rng) const
{
    std::bernoulli_distribution coin(0.5);
    std::vector<bool> rule(geneCount);
    for (size_t i = 0; i < geneCount; ++i) {
        rule[i] = coin(rng);
    }
    return rule;
}

} // namespace GenePool
