#pragma once

#include "core/evolution/BenchmarkProviders.h"
#include "core/evolution/Chromosome.h"
#include "core/evolution/FitnessProvider.h"

#include <atomic>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace GenePool {
namespace Test {

// Throws from evaluate() when the first gene equals the trigger value.
class ThrowingFitnessProvider : public FitnessProvider {
public:
    ThrowingFitnessProvider(size_t parameterCount, double trigger)
        : parameterCount_(parameterCount), trigger_(trigger), params_(parameterCount, 0.0)
    {}

    size_t parameterCount() const override { return parameterCount_; }

    Result<std::monostate, std::string> configure(const std::vector<double>& params) override
    {
        if (params.size() != parameterCount_) {
            return Result<std::monostate, std::string>::error("length mismatch");
        }
        params_ = params;
        return Result<std::monostate, std::string>::okay(std::monostate{});
    }

    double evaluate() override
    {
        if (!params_.empty() && params_[0] == trigger_) {
            throw std::runtime_error("simulation diverged");
        }
        return params_.empty() ? 0.0 : params_[0];
    }

    std::unique_ptr<FitnessProvider> clone() const override
    {
        return std::make_unique<ThrowingFitnessProvider>(*this);
    }

private:
    size_t parameterCount_;
    double trigger_;
    std::vector<double> params_;
};

// Misbehaves in evaluate() when the first gene equals the trigger value, either by
// returning NaN or by throwing something that is not a std::exception.
class UnrulyFitnessProvider : public FitnessProvider {
public:
    enum class Fault { NotANumber, ThrowInt };

    UnrulyFitnessProvider(size_t parameterCount, double trigger, Fault fault)
        : inner_(parameterCount), trigger_(trigger), fault_(fault)
    {}

    size_t parameterCount() const override { return inner_.parameterCount(); }

    Result<std::monostate, std::string> configure(const std::vector<double>& params) override
    {
        first_ = params.empty() ? 0.0 : params[0];
        return inner_.configure(params);
    }

    double evaluate() override
    {
        if (first_ == trigger_) {
            if (fault_ == Fault::ThrowInt) {
                throw 42;
            }
            return std::numeric_limits<double>::quiet_NaN();
        }
        return inner_.evaluate();
    }

    std::unique_ptr<FitnessProvider> clone() const override
    {
        return std::make_unique<UnrulyFitnessProvider>(*this);
    }

private:
    SumFitnessProvider inner_;
    double trigger_;
    Fault fault_;
    double first_ = 0.0;
};

// Sum provider that counts evaluate() calls across all clones.
class CountingFitnessProvider : public FitnessProvider {
public:
    CountingFitnessProvider(size_t parameterCount, std::shared_ptr<std::atomic<int>> counter)
        : inner_(parameterCount), counter_(std::move(counter))
    {}

    size_t parameterCount() const override { return inner_.parameterCount(); }

    Result<std::monostate, std::string> configure(const std::vector<double>& params) override
    {
        return inner_.configure(params);
    }

    double evaluate() override
    {
        counter_->fetch_add(1);
        return inner_.evaluate();
    }

    std::unique_ptr<FitnessProvider> clone() const override
    {
        return std::make_unique<CountingFitnessProvider>(*this);
    }

private:
    SumFitnessProvider inner_;
    std::shared_ptr<std::atomic<int>> counter_;
};

// Rejects any gene vector containing a negative value.
class PickyFitnessProvider : public FitnessProvider {
public:
    explicit PickyFitnessProvider(size_t parameterCount) : inner_(parameterCount) {}

    size_t parameterCount() const override { return inner_.parameterCount(); }

    Result<std::monostate, std::string> configure(const std::vector<double>& params) override
    {
        for (const double param : params) {
            if (param < 0.0) {
                return Result<std::monostate, std::string>::error("negative parameter");
            }
        }
        return inner_.configure(params);
    }

    double evaluate() override { return inner_.evaluate(); }

    std::unique_ptr<FitnessProvider> clone() const override
    {
        return std::make_unique<PickyFitnessProvider>(*this);
    }

private:
    SumFitnessProvider inner_;
};

inline Chromosome makeSumChromosome(std::vector<double> genes)
{
    const size_t count = genes.size();
    return Chromosome::create(std::move(genes), std::make_unique<SumFitnessProvider>(count))
        .value();
}

inline std::vector<Chromosome> makeScoredPopulation(const std::vector<double>& fitness)
{
    std::vector<Chromosome> population;
    for (const double value : fitness) {
        Chromosome chromosome = makeSumChromosome({ value });
        chromosome.setFitness(value);
        population.push_back(std::move(chromosome));
    }
    return population;
}

} // namespace Test
} // namespace GenePool
