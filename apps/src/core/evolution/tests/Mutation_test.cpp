#include "TestFitnessProviders.h"
#include "core/evolution/Mutation.h"

#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>

using namespace GenePool;
using namespace GenePool::Test;

class MutationTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };

    Chromosome chromosome = makeSumChromosome({ 1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0 });
    const std::vector<double> original = chromosome.getGenes();
};

TEST_F(MutationTest, ZeroRateLeavesGenesUnchanged)
{
    const NoisyMutation noisy(0.0, 0.5);
    const FlipMutation flip(0.0);
    const SwapMutation swap(0.0);

    EXPECT_EQ(noisy.mutate(chromosome, rng), 0);
    EXPECT_EQ(flip.mutate(chromosome, rng), 0);
    EXPECT_EQ(swap.mutate(chromosome, rng), 0);
    EXPECT_EQ(chromosome.getGenes(), original);
}

TEST_F(MutationTest, MutationPreservesGeneCount)
{
    const NoisyMutation noisy(0.5, 0.1);
    const FlipMutation flip(0.5);
    const SwapMutation swap(0.5);

    for (int trial = 0; trial < 10; ++trial) {
        noisy.mutate(chromosome, rng);
        flip.mutate(chromosome, rng);
        swap.mutate(chromosome, rng);
        ASSERT_EQ(chromosome.size(), original.size());
    }
}

TEST_F(MutationTest, NoisyScalesByVolume)
{
    const NoisyMutation noisy(1.0, 0.1);

    EXPECT_EQ(noisy.mutate(chromosome, rng), 8);

    for (size_t i = 0; i < original.size(); ++i) {
        const double ratio = chromosome.getGene(i) / original[i];
        EXPECT_TRUE(std::abs(ratio - 1.1) < 1e-12 || std::abs(ratio - 0.9) < 1e-12)
            << "gene " << i << " ratio " << ratio;
    }
}

TEST_F(MutationTest, NoisyLeavesZeroGenesAtZero)
{
    Chromosome zeros = makeSumChromosome({ 0.0, 0.0, 0.0 });
    const NoisyMutation noisy(1.0, 0.5);

    noisy.mutate(zeros, rng);

    EXPECT_EQ(zeros.getGenes(), (std::vector<double>{ 0.0, 0.0, 0.0 }));
}

TEST_F(MutationTest, FullRateFlipNegatesEveryGene)
{
    const FlipMutation flip(1.0);

    EXPECT_EQ(flip.mutate(chromosome, rng), 8);

    for (size_t i = 0; i < original.size(); ++i) {
        EXPECT_EQ(chromosome.getGene(i), -original[i]);
    }
}

TEST_F(MutationTest, SwapExchangesExactlyTwoGenes)
{
    // 2 * rate >= 1, so the swap always happens.
    const SwapMutation swap(0.5);

    EXPECT_EQ(swap.mutate(chromosome, rng), 2);

    std::vector<size_t> moved;
    for (size_t i = 0; i < original.size(); ++i) {
        if (chromosome.getGene(i) != original[i]) {
            moved.push_back(i);
        }
    }
    ASSERT_EQ(moved.size(), 2u);
    EXPECT_EQ(chromosome.getGene(moved[0]), original[moved[1]]);
    EXPECT_EQ(chromosome.getGene(moved[1]), original[moved[0]]);

    std::vector<double> sortedAfter = chromosome.getGenes();
    std::sort(sortedAfter.begin(), sortedAfter.end());
    EXPECT_EQ(sortedAfter, original);
}

TEST_F(MutationTest, SwapFiresOncePerCallWithTwiceTheRate)
{
    Chromosome tenGenes =
        makeSumChromosome({ 1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 9.0, 10.0 });
    const SwapMutation swap(0.1);
    const FlipMutation flip(0.1);
    constexpr int calls = 5000;

    int swapFired = 0;
    int flipTotal = 0;
    int flipCallsWithChange = 0;
    for (int i = 0; i < calls; ++i) {
        const int swapped = swap.mutate(tenGenes, rng);
        ASSERT_TRUE(swapped == 0 || swapped == 2) << "swap returned " << swapped;
        if (swapped == 2) {
            swapFired++;
        }

        const int flipped = flip.mutate(tenGenes, rng);
        flipTotal += flipped;
        if (flipped > 0) {
            flipCallsWithChange++;
        }
    }

    // One trial per call at 2 * rate, regardless of the ten genes.
    const double swapShare = static_cast<double>(swapFired) / calls;
    EXPECT_NEAR(swapShare, 0.2, 0.03);

    // Flip trials every gene: about one flip per call, and 1 - 0.9^10 of calls change something.
    const double flipsPerCall = static_cast<double>(flipTotal) / calls;
    EXPECT_NEAR(flipsPerCall, 1.0, 0.1);
    const double flipShare = static_cast<double>(flipCallsWithChange) / calls;
    EXPECT_NEAR(flipShare, 1.0 - std::pow(0.9, 10), 0.03);
}

TEST_F(MutationTest, SwapOnSingleGeneIsNoOp)
{
    Chromosome single = makeSumChromosome({ 3.0 });
    const SwapMutation swap(0.5);

    EXPECT_EQ(swap.mutate(single, rng), 0);
    EXPECT_EQ(single.getGene(0), 3.0);
}

TEST_F(MutationTest, MutatedGenesReachTheProvider)
{
    const FlipMutation flip(1.0);

    flip.mutate(chromosome, rng);

    EXPECT_DOUBLE_EQ(chromosome.computeFitness(), -36.0);
}
