#pragma once

#include <random>

namespace GenePool {

class Chromosome;

/**
 * Perturbs a child's genes in place. Never changes the gene count.
 * Implementations keep no state between calls.
 */
class MutationMethod {
public:
    virtual ~MutationMethod() = default;

    // Returns the number of genes written.
    virtual int mutate(Chromosome& chromosome, std::mt19937& rng) const = 0;

    virtual const char* name() const = 0;
};

/**
 * Per gene, with probability rate: gene *= (1 + volume) or (1 - volume),
 * sign chosen uniformly. Relative perturbation, so zero genes stay zero.
 */
class NoisyMutation : public MutationMethod {
public:
    NoisyMutation(double rate, double volume);

    int mutate(Chromosome& chromosome, std::mt19937& rng) const override;
    const char* name() const override { return "Noisy"; }

private:
    double rate_;
    double volume_;
};

// Per gene, with probability rate: negate.
class FlipMutation : public MutationMethod {
public:
    explicit FlipMutation(double rate);

    int mutate(Chromosome& chromosome, std::mt19937& rng) const override;
    const char* name() const override { return "Flip"; }

private:
    double rate_;
};

/**
 * One trial per call with probability 2 * rate: exchange two distinct genes.
 * Unlike Noisy and Flip, the rate does not apply per gene.
 */
class SwapMutation : public MutationMethod {
public:
    explicit SwapMutation(double rate);

    int mutate(Chromosome& chromosome, std::mt19937& rng) const override;
    const char* name() const override { return "Swap"; }

private:
    double rate_;
};

} // namespace GenePool
