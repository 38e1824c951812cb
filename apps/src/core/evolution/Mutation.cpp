#include "Mutation.h"

#include "Chromosome.h"

namespace GenePool {

NoisyMutation::NoisyMutation(double rate, double volume) : rate_(rate), volume_(volume)
{}

int NoisyMutation::mutate(Chromosome& chromosome, std::mt19937& rng) const
{
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::bernoulli_distribution positive(0.5);

    int changes = 0;
    for (size_t i = 0; i < chromosome.size(); ++i) {
        if (coin(rng) < rate_) {
            const double sign = positive(rng) ? 1.0 : -1.0;
            chromosome.setGene(i, chromosome.getGene(i) * (1.0 + sign * volume_));
            changes++;
        }
    }
    return changes;
}

FlipMutation::FlipMutation(double rate) : rate_(rate)
{}

int FlipMutation::mutate(Chromosome& chromosome, std::mt19937& rng) const
{
    std::uniform_real_distribution<double> coin(0.0, 1.0);

    int changes = 0;
    for (size_t i = 0; i < chromosome.size(); ++i) {
        if (coin(rng) < rate_) {
            chromosome.setGene(i, -chromosome.getGene(i));
            changes++;
        }
    }
    return changes;
}

SwapMutation::SwapMutation(double rate) : rate_(rate)
{}

int SwapMutation::mutate(Chromosome& chromosome, std::mt19937& rng) const
{
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    if (coin(rng) >= 2.0 * rate_ || chromosome.size() < 2) {
        return 0;
    }

    std::uniform_int_distribution<size_t> firstDist(0, chromosome.size() - 1);
    std::uniform_int_distribution<size_t> secondDist(0, chromosome.size() - 2);
    const size_t first = firstDist(rng);
    size_t second = secondDist(rng);
    if (second >= first) {
        ++second;
    }

    const double firstGene = chromosome.getGene(first);
    chromosome.setGene(first, chromosome.getGene(second));
    chromosome.setGene(second, firstGene);
    return 2;
}

} // namespace GenePool
