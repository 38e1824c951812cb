#include "core/evolution/StrategyFactory.h"

#include <gtest/gtest.h>
#include <string>

using namespace GenePool;

TEST(StrategyFactoryTest, CreatesConfiguredVariants)
{
    auto strategies = StrategyFactory::createAll(
        SelectionConfig{ .kind = SelectionKind::Rank },
        CrossoverConfig{ .kind = CrossoverKind::KPoint, .points = 2 },
        MutationConfig{ .kind = MutationKind::Swap, .rate = 0.1 },
        10,
        5);

    ASSERT_TRUE(strategies.isValue());
    EXPECT_EQ(std::string(strategies.value().selection->name()), "Rank");
    EXPECT_EQ(std::string(strategies.value().crossover->name()), "KPoint");
    EXPECT_EQ(std::string(strategies.value().mutation->name()), "Swap");
}

TEST(StrategyFactoryTest, TournamentSizeMustFitPopulation)
{
    SelectionConfig config{ .kind = SelectionKind::Tournament, .tournamentSize = 5 };

    EXPECT_TRUE(StrategyFactory::createSelection(config, 5).isValue());
    EXPECT_TRUE(StrategyFactory::createSelection(config, 4).isError());

    config.tournamentSize = 1;
    auto tooSmall = StrategyFactory::createSelection(config, 4);
    ASSERT_TRUE(tooSmall.isError());
    EXPECT_EQ(tooSmall.errorValue().kind, EvolutionError::Kind::Configuration);
}

TEST(StrategyFactoryTest, KPointNeedsBetweenOneAndGeneCountCuts)
{
    CrossoverConfig config{ .kind = CrossoverKind::KPoint, .points = 0 };
    EXPECT_TRUE(StrategyFactory::createCrossover(config, 4).isError());

    config.points = 4;
    EXPECT_TRUE(StrategyFactory::createCrossover(config, 4).isValue());

    config.points = 5;
    EXPECT_TRUE(StrategyFactory::createCrossover(config, 4).isError());
}

TEST(StrategyFactoryTest, MutationRateMustBeAProbability)
{
    EXPECT_TRUE(StrategyFactory::createMutation(MutationConfig{ .rate = -0.1 }).isError());
    EXPECT_TRUE(StrategyFactory::createMutation(MutationConfig{ .rate = 1.5 }).isError());
    EXPECT_TRUE(StrategyFactory::createMutation(MutationConfig{ .rate = 1.0 }).isValue());
}

TEST(StrategyFactoryTest, CreateAllReportsFirstInvalidStrategy)
{
    auto strategies = StrategyFactory::createAll(
        SelectionConfig{},
        CrossoverConfig{ .kind = CrossoverKind::KPoint, .points = 9 },
        MutationConfig{ .rate = 2.0 },
        10,
        3);

    ASSERT_TRUE(strategies.isError());
    EXPECT_NE(strategies.errorValue().message.find("points"), std::string::npos);
}
