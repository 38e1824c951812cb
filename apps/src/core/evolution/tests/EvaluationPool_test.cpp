#include "TestFitnessProviders.h"
#include "core/evolution/EvaluationPool.h"

#include <gtest/gtest.h>

using namespace GenePool;
using namespace GenePool::Test;

namespace {
std::vector<EvaluationPool::WorkerTask> makeTasks(const std::vector<Chromosome>& members)
{
    std::vector<EvaluationPool::WorkerTask> tasks;
    for (size_t i = 0; i < members.size(); ++i) {
        tasks.push_back(
            EvaluationPool::WorkerTask{ .index = i, .snapshot = members[i].snapshot() });
    }
    return tasks;
}
} // namespace

TEST(EvaluationPoolTest, ResultsComeBackInIndexOrder)
{
    std::vector<Chromosome> members;
    for (int i = 0; i < 32; ++i) {
        members.push_back(makeSumChromosome({ static_cast<double>(i), 0.5 }));
    }
    EvaluationPool pool(4);

    auto fitness = pool.evaluate(makeTasks(members));

    ASSERT_TRUE(fitness.isValue());
    ASSERT_EQ(fitness.value().size(), members.size());
    for (size_t i = 0; i < members.size(); ++i) {
        EXPECT_DOUBLE_EQ(fitness.value()[i], static_cast<double>(i) + 0.5);
    }
}

TEST(EvaluationPoolTest, PoolIsReusableAcrossBatches)
{
    std::vector<Chromosome> members = { makeSumChromosome({ 1.0 }), makeSumChromosome({ 2.0 }) };
    EvaluationPool pool(2);

    auto first = pool.evaluate(makeTasks(members));
    members[0].setGene(0, 10.0);
    auto second = pool.evaluate(makeTasks(members));

    ASSERT_TRUE(first.isValue());
    ASSERT_TRUE(second.isValue());
    EXPECT_DOUBLE_EQ(first.value()[0], 1.0);
    EXPECT_DOUBLE_EQ(second.value()[0], 10.0);
}

TEST(EvaluationPoolTest, ProviderExceptionBecomesProviderError)
{
    std::vector<Chromosome> members;
    for (int i = 0; i < 6; ++i) {
        members.push_back(
            Chromosome::create(
                { static_cast<double>(i) }, std::make_unique<ThrowingFitnessProvider>(1, 3.0))
                .value());
    }
    EvaluationPool pool(3);

    auto fitness = pool.evaluate(makeTasks(members));

    ASSERT_TRUE(fitness.isError());
    EXPECT_EQ(fitness.errorValue().kind, EvolutionError::Kind::Provider);
    EXPECT_NE(fitness.errorValue().message.find("chromosome 3"), std::string::npos);
    EXPECT_NE(fitness.errorValue().message.find("simulation diverged"), std::string::npos);
}

TEST(EvaluationPoolTest, NonStandardThrowBecomesProviderError)
{
    std::vector<Chromosome> members;
    for (int i = 0; i < 3; ++i) {
        members.push_back(
            Chromosome::create(
                { static_cast<double>(i * 10) },
                std::make_unique<UnrulyFitnessProvider>(
                    1, 0.0, UnrulyFitnessProvider::Fault::ThrowInt))
                .value());
    }
    EvaluationPool pool(2);

    auto fitness = pool.evaluate(makeTasks(members));

    ASSERT_TRUE(fitness.isError());
    EXPECT_EQ(fitness.errorValue().kind, EvolutionError::Kind::Provider);
    EXPECT_NE(fitness.errorValue().message.find("chromosome 0"), std::string::npos);
    EXPECT_NE(fitness.errorValue().message.find("non-standard"), std::string::npos);
}

TEST(EvaluationPoolTest, NaNFitnessBecomesProviderError)
{
    std::vector<Chromosome> members;
    for (int i = 0; i < 3; ++i) {
        members.push_back(
            Chromosome::create(
                { static_cast<double>(i * 10) },
                std::make_unique<UnrulyFitnessProvider>(
                    1, 0.0, UnrulyFitnessProvider::Fault::NotANumber))
                .value());
    }
    EvaluationPool pool(2);

    auto fitness = pool.evaluate(makeTasks(members));

    ASSERT_TRUE(fitness.isError());
    EXPECT_EQ(fitness.errorValue().kind, EvolutionError::Kind::Provider);
    EXPECT_NE(fitness.errorValue().message.find("chromosome 0"), std::string::npos);
    EXPECT_NE(fitness.errorValue().message.find("non-finite"), std::string::npos);

    // The pool keeps working once the provider behaves again.
    members[0].setGene(0, 5.0);
    auto retry = pool.evaluate(makeTasks(members));
    ASSERT_TRUE(retry.isValue());
    EXPECT_DOUBLE_EQ(retry.value()[0], 5.0);
    EXPECT_DOUBLE_EQ(retry.value()[2], 20.0);
}

TEST(EvaluationPoolTest, FailedBatchDoesNotPoisonTheNextOne)
{
    std::vector<Chromosome> members;
    members.push_back(
        Chromosome::create({ 3.0 }, std::make_unique<ThrowingFitnessProvider>(1, 3.0)).value());
    members.push_back(
        Chromosome::create({ 1.0 }, std::make_unique<ThrowingFitnessProvider>(1, 3.0)).value());
    EvaluationPool pool(2);

    ASSERT_TRUE(pool.evaluate(makeTasks(members)).isError());

    members[0].setGene(0, 2.0);
    auto retry = pool.evaluate(makeTasks(members));

    ASSERT_TRUE(retry.isValue());
    EXPECT_DOUBLE_EQ(retry.value()[0], 2.0);
    EXPECT_DOUBLE_EQ(retry.value()[1], 1.0);
}

TEST(EvaluationPoolTest, EmptyBatchReturnsImmediately)
{
    EvaluationPool pool(2);

    auto fitness = pool.evaluate({});

    ASSERT_TRUE(fitness.isValue());
    EXPECT_TRUE(fitness.value().empty());
}

TEST(EvaluationPoolTest, ResolveWorkerCountClampsToPopulation)
{
    EXPECT_EQ(EvaluationPool::resolveWorkerCount(8, 4), 4);
    EXPECT_EQ(EvaluationPool::resolveWorkerCount(2, 10), 2);
    EXPECT_GE(EvaluationPool::resolveWorkerCount(0, 10), 1);
    EXPECT_LE(EvaluationPool::resolveWorkerCount(0, 10), 10);
    EXPECT_GE(EvaluationPool::resolveWorkerCount(-3, 1), 1);
}
