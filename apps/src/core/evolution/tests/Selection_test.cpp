#include "TestFitnessProviders.h"
#include "core/evolution/Selection.h"

#include <cmath>
#include <gtest/gtest.h>
#include <map>

using namespace GenePool;
using namespace GenePool::Test;

class SelectionTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };
};

TEST_F(SelectionTest, PairsNeverRepeatAChromosome)
{
    const auto population = makeScoredPopulation({ 1, 2, 3, 4, 5, 6 });
    const RouletteSelection roulette;
    const RankSelection rank;
    const TournamentSelection tournament(3);
    const std::vector<const SelectionMethod*> methods = { &roulette, &rank, &tournament };

    for (const SelectionMethod* method : methods) {
        auto pairs = method->selectParents(population, 200, rng);
        ASSERT_TRUE(pairs.isValue()) << method->name();
        ASSERT_EQ(pairs.value().size(), 200u);
        for (const auto& pair : pairs.value()) {
            EXPECT_NE(pair.first, pair.second) << method->name();
            EXPECT_LT(pair.first, population.size());
            EXPECT_LT(pair.second, population.size());
        }
    }
}

TEST_F(SelectionTest, RouletteWeightIsSquaredPositiveFitness)
{
    EXPECT_DOUBLE_EQ(RouletteSelection::weightFor(3.0), 9.0);
    EXPECT_EQ(RouletteSelection::weightFor(0.0), 0.0);
    EXPECT_EQ(RouletteSelection::weightFor(-2.0), 0.0);
    EXPECT_EQ(RouletteSelection::weightFor(std::nan("")), 0.0);
}

TEST_F(SelectionTest, RouletteNeverPicksNonPositiveWhileTwoPositiveRemain)
{
    const auto population = makeScoredPopulation({ -5, 0, 2, 3 });
    const RouletteSelection roulette;

    for (int trial = 0; trial < 100; ++trial) {
        auto pair = roulette.selectPair(population, rng);
        ASSERT_TRUE(pair.isValue());
        EXPECT_GE(pair.value().first, 2u);
        EXPECT_GE(pair.value().second, 2u);
    }
}

TEST_F(SelectionTest, RouletteAllNonPositiveIsDegenerate)
{
    const auto population = makeScoredPopulation({ 0, -1, -2 });
    const RouletteSelection roulette(DegenerateWeightPolicy::Fail);

    auto pair = roulette.selectPair(population, rng);

    ASSERT_TRUE(pair.isError());
    EXPECT_EQ(pair.errorValue().kind, EvolutionError::Kind::DegenerateDistribution);
}

TEST_F(SelectionTest, RouletteSinglePositiveIsDegenerateOnSecondDraw)
{
    const auto population = makeScoredPopulation({ 0, 4, 0 });
    const RouletteSelection roulette(DegenerateWeightPolicy::Fail);

    auto pair = roulette.selectPair(population, rng);

    ASSERT_TRUE(pair.isError());
    EXPECT_EQ(pair.errorValue().kind, EvolutionError::Kind::DegenerateDistribution);
}

TEST_F(SelectionTest, RouletteUniformFallbackStillReturnsDistinctPair)
{
    const auto population = makeScoredPopulation({ 0, 4, 0 });
    const RouletteSelection roulette(DegenerateWeightPolicy::Uniform);

    for (int trial = 0; trial < 50; ++trial) {
        auto pair = roulette.selectPair(population, rng);
        ASSERT_TRUE(pair.isValue());
        EXPECT_EQ(pair.value().first, 1u);
        EXPECT_NE(pair.value().second, 1u);
    }
}

TEST_F(SelectionTest, RankFavorsHigherFitness)
{
    const auto population = makeScoredPopulation({ 50, 10, 30, 20, 40 });
    const RankSelection rank;

    std::map<size_t, int> firstPicks;
    for (int trial = 0; trial < 2000; ++trial) {
        auto pair = rank.selectPair(population, rng);
        ASSERT_TRUE(pair.isValue());
        firstPicks[pair.value().first]++;
    }

    // Weights 5 (index 0) vs 1 (index 1).
    EXPECT_GT(firstPicks[0], firstPicks[1]);
}

TEST_F(SelectionTest, RankWorksWithNegativeFitness)
{
    const auto population = makeScoredPopulation({ -3, -2, -1 });
    const RankSelection rank;

    auto pair = rank.selectPair(population, rng);

    ASSERT_TRUE(pair.isValue());
    EXPECT_NE(pair.value().first, pair.value().second);
}

TEST_F(SelectionTest, TournamentOfWholePopulationReturnsTopTwo)
{
    const auto population = makeScoredPopulation({ 1, 5, 2, 4, 3 });
    const TournamentSelection tournament(5);

    auto pair = tournament.selectPair(population, rng);

    ASSERT_TRUE(pair.isValue());
    EXPECT_EQ(pair.value().first, 1u);
    EXPECT_EQ(pair.value().second, 3u);
}

TEST_F(SelectionTest, TournamentTiesGoToLowerIndex)
{
    const auto population = makeScoredPopulation({ 7, 7, 7, 7 });
    const TournamentSelection tournament(4);

    auto pair = tournament.selectPair(population, rng);

    ASSERT_TRUE(pair.isValue());
    EXPECT_EQ(pair.value().first, 0u);
    EXPECT_EQ(pair.value().second, 1u);
}

TEST_F(SelectionTest, TournamentLargerThanPopulationIsConfigurationError)
{
    const auto population = makeScoredPopulation({ 1, 2, 3 });
    const TournamentSelection tournament(4);

    auto pair = tournament.selectPair(population, rng);

    ASSERT_TRUE(pair.isError());
    EXPECT_EQ(pair.errorValue().kind, EvolutionError::Kind::Configuration);
}

TEST_F(SelectionTest, PopulationOfOneCannotBePaired)
{
    const auto population = makeScoredPopulation({ 1 });
    const RankSelection rank;

    auto pairs = rank.selectParents(population, 1, rng);

    ASSERT_TRUE(pairs.isError());
    EXPECT_EQ(pairs.errorValue().kind, EvolutionError::Kind::Configuration);
}
