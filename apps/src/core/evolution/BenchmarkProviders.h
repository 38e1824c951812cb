#pragma once

#include "FitnessProvider.h"
#include "core/Result.h"

#include <string>
#include <vector>

namespace GenePool {

/**
 * fitness = sum(genes). Unbounded; mainly for exercising the engine.
 */
class SumFitnessProvider : public FitnessProvider {
public:
    explicit SumFitnessProvider(size_t parameterCount);

    size_t parameterCount() const override { return parameterCount_; }
    Result<std::monostate, std::string> configure(const std::vector<double>& params) override;
    double evaluate() override;
    std::unique_ptr<FitnessProvider> clone() const override;

private:
    size_t parameterCount_;
    std::vector<double> params_;
};

/**
 * fitness = 1 / (1 + sum((gene - target)^2)). Peaks at 1 when every gene
 * equals target.
 */
class SphereFitnessProvider : public FitnessProvider {
public:
    explicit SphereFitnessProvider(size_t parameterCount, double target = 1.0);

    size_t parameterCount() const override { return parameterCount_; }
    Result<std::monostate, std::string> configure(const std::vector<double>& params) override;
    double evaluate() override;
    std::unique_ptr<FitnessProvider> clone() const override;

private:
    size_t parameterCount_;
    double target_;
    std::vector<double> params_;
};

// "sum" or "sphere".
Result<FitnessProviderFactory, std::string> createBenchmarkProviderFactory(
    const std::string& name, int geneCount);

} // namespace GenePool
