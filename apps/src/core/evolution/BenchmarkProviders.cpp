#include "BenchmarkProviders.h"

#include <numeric>

namespace GenePool {

namespace {
Result<std::monostate, std::string> checkLength(size_t expected, size_t actual)
{
    if (expected != actual) {
        return Result<std::monostate, std::string>::error(
            "Expected " + std::to_string(expected) + " parameters, got " + std::to_string(actual));
    }
    return Result<std::monostate, std::string>::okay(std::monostate{});
}
} // namespace

SumFitnessProvider::SumFitnessProvider(size_t parameterCount)
    : parameterCount_(parameterCount), params_(parameterCount, 0.0)
{}

Result<std::monostate, std::string> SumFitnessProvider::configure(const std::vector<double>& params)
{
    auto check = checkLength(parameterCount_, params.size());
    if (check.isValue()) {
        params_ = params;
    }
    return check;
}

double SumFitnessProvider::evaluate()
{
    return std::accumulate(params_.begin(), params_.end(), 0.0);
}

std::unique_ptr<FitnessProvider> SumFitnessProvider::clone() const
{
    return std::make_unique<SumFitnessProvider>(*this);
}

SphereFitnessProvider::SphereFitnessProvider(size_t parameterCount, double target)
    : parameterCount_(parameterCount), target_(target), params_(parameterCount, 0.0)
{}

Result<std::monostate, std::string> SphereFitnessProvider::configure(
    const std::vector<double>& params)
{
    auto check = checkLength(parameterCount_, params.size());
    if (check.isValue()) {
        params_ = params;
    }
    return check;
}

double SphereFitnessProvider::evaluate()
{
    double distanceSquared = 0.0;
    for (const double param : params_) {
        const double delta = param - target_;
        distanceSquared += delta * delta;
    }
    return 1.0 / (1.0 + distanceSquared);
}

std::unique_ptr<FitnessProvider> SphereFitnessProvider::clone() const
{
    return std::make_unique<SphereFitnessProvider>(*this);
}

Result<FitnessProviderFactory, std::string> createBenchmarkProviderFactory(
    const std::string& name, int geneCount)
{
    using FactoryResult = Result<FitnessProviderFactory, std::string>;

    if (geneCount < 1) {
        return FactoryResult::error("geneCount must be at least 1");
    }
    const size_t count = static_cast<size_t>(geneCount);

    if (name == "sum") {
        return FactoryResult::okay(
            [count]() -> std::unique_ptr<FitnessProvider> {
                return std::make_unique<SumFitnessProvider>(count);
            });
    }
    if (name == "sphere") {
        return FactoryResult::okay(
            [count]() -> std::unique_ptr<FitnessProvider> {
                return std::make_unique<SphereFitnessProvider>(count);
            });
    }
    return FactoryResult::error("Unknown fitness provider '" + name + "' (expected sum or sphere)");
}

} // namespace GenePool
