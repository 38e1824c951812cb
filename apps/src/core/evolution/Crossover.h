#pragma once

#include <cstddef>
#include <random>
#include <vector>

namespace GenePool {

class Chromosome;

/**
 * Combines two parents into one child.
 *
 * Each variant only decides the inheritance rule: a per-gene flag that is true
 * where the child takes parent1's gene and false where it takes parent2's.
 * The child owns its own gene storage and a fresh provider cloned from parent1.
 */
class CrossoverMethod {
public:
    virtual ~CrossoverMethod() = default;

    Chromosome breed(const Chromosome& parent1, const Chromosome& parent2, std::mt19937& rng) const;

    virtual std::vector<bool> inheritanceRule(size_t geneCount, std::mt19937& rng) const = 0;

    virtual const char* name() const = 0;

    static Chromosome breedWithRule(
        const Chromosome& parent1, const Chromosome& parent2, const std::vector<bool>& rule);
};

class OnePointCrossover : public CrossoverMethod {
public:
    std::vector<bool> inheritanceRule(size_t geneCount, std::mt19937& rng) const override;
    const char* name() const override { return "OnePoint"; }

    // True for indices below the cut.
    static std::vector<bool> ruleFromCutPoint(size_t geneCount, size_t cut);
};

class KPointCrossover : public CrossoverMethod {
public:
    explicit KPointCrossover(int points);

    std::vector<bool> inheritanceRule(size_t geneCount, std::mt19937& rng) const override;
    const char* name() const override { return "KPoint"; }

    int getPoints() const { return points_; }

    // Starts true and toggles at every cut. Cuts must be sorted and distinct.
    static std::vector<bool> ruleFromCutPoints(size_t geneCount, const std::vector<size_t>& cuts);

private:
    int points_;
};

class UniformCrossover : public CrossoverMethod {
public:
    std::vector<bool> inheritanceRule(size_t geneCount, std::mt19937& rng) const override;
    const char* name() const override { return "Uniform"; }
};

} // namespace GenePool
