#pragma once

#include "EvolutionError.h"
#include "core/Result.h"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <variant>
#include <vector>

namespace GenePool {

/**
 * Population persistence document: a JSON object mapping each chromosome's
 * index (as a decimal string) to its gene vector.
 *
 *   { "0": [1.5, -0.25], "1": [3.0, 0.5] }
 *
 * Doubles are written with round-trip precision, so save then load
 * reproduces the genes bit for bit.
 */
class PopulationFile {
public:
    using GeneVectors = std::vector<std::vector<double>>;

    // Fails without touching the filesystem if any gene is non-finite.
    // Writes to a temporary file first; a failed write leaves no file behind.
    static Result<std::monostate, EvolutionError> save(
        const std::filesystem::path& path, const GeneVectors& genes);

    static Result<GeneVectors, EvolutionError> load(const std::filesystem::path& path);

    static Result<nlohmann::json, EvolutionError> toJson(const GeneVectors& genes);
    static Result<GeneVectors, EvolutionError> fromJson(const nlohmann::json& document);
};

} // namespace GenePool
