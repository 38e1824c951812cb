#pragma once

#include "core/Result.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace GenePool {

/**
 * Abstract interface for the task being optimized.
 *
 * A provider maps a flat parameter vector into whatever internal structure it
 * scores with, then reports a scalar fitness (higher is better). evaluate()
 * may be expensive and non-deterministic, and may throw; the engine treats an
 * exception as a failed evaluation of the current generation.
 *
 * Instances are only ever used from one thread at a time. clone() must return
 * an independent copy that shares no mutable state with the original, since
 * clones are handed to evaluation workers.
 */
class FitnessProvider {
public:
    virtual ~FitnessProvider() = default;

    // Number of parameters configure() expects.
    virtual size_t parameterCount() const = 0;

    // Bind a parameter vector. Fails if params.size() != parameterCount().
    virtual Result<std::monostate, std::string> configure(const std::vector<double>& params) = 0;

    virtual double evaluate() = 0;

    virtual std::unique_ptr<FitnessProvider> clone() const = 0;
};

using FitnessProviderFactory = std::function<std::unique_ptr<FitnessProvider>()>;

} // namespace GenePool
