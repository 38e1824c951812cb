#include "PopulationFile.h"

#include "core/LoggingChannels.h"

#include <cmath>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>

namespace GenePool {

namespace {

// Accepts only the canonical decimal form that toJson writes: digits, no sign,
// no whitespace and no leading zero.
std::optional<size_t> parseIndexKey(const std::string& key)
{
    if (key.empty() || key.size() > 18) {
        return std::nullopt;
    }
    if (key.size() > 1 && key[0] == '0') {
        return std::nullopt;
    }
    size_t index = 0;
    for (const char c : key) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        index = index * 10 + static_cast<size_t>(c - '0');
    }
    return index;
}

} // namespace

Result<nlohmann::json, EvolutionError> PopulationFile::toJson(const GeneVectors& genes)
{
    nlohmann::json document = nlohmann::json::object();
    for (size_t i = 0; i < genes.size(); ++i) {
        for (size_t g = 0; g < genes[i].size(); ++g) {
            if (!std::isfinite(genes[i][g])) {
                return Result<nlohmann::json, EvolutionError>::error(EvolutionError::configuration(
                    "Chromosome " + std::to_string(i) + " gene " + std::to_string(g)
                    + " is not finite and cannot be saved"));
            }
        }
        document[std::to_string(i)] = genes[i];
    }
    return Result<nlohmann::json, EvolutionError>::okay(std::move(document));
}

Result<PopulationFile::GeneVectors, EvolutionError> PopulationFile::fromJson(
    const nlohmann::json& document)
{
    using LoadResult = Result<GeneVectors, EvolutionError>;

    if (!document.is_object()) {
        return LoadResult::error(
            EvolutionError::persistence("Population document must be a JSON object"));
    }

    GeneVectors genes(document.size());
    std::vector<bool> seen(document.size(), false);

    for (const auto& [key, value] : document.items()) {
        const auto index = parseIndexKey(key);
        if (!index || *index >= genes.size()) {
            return LoadResult::error(EvolutionError::persistence(
                "Population document key '" + key + "' is not an index in [0, "
                + std::to_string(genes.size()) + ")"));
        }
        if (seen[*index]) {
            return LoadResult::error(
                EvolutionError::persistence("Duplicate population index " + key));
        }

        if (!value.is_array()) {
            return LoadResult::error(
                EvolutionError::persistence("Entry " + key + " is not an array of numbers"));
        }
        std::vector<double> entry;
        entry.reserve(value.size());
        for (const auto& gene : value) {
            if (!gene.is_number()) {
                return LoadResult::error(
                    EvolutionError::persistence("Entry " + key + " contains a non-number"));
            }
            entry.push_back(gene.get<double>());
        }

        genes[*index] = std::move(entry);
        seen[*index] = true;
    }

    return LoadResult::okay(std::move(genes));
}

Result<std::monostate, EvolutionError> PopulationFile::save(
    const std::filesystem::path& path, const GeneVectors& genes)
{
    namespace fs = std::filesystem;
    using SaveResult = Result<std::monostate, EvolutionError>;

    auto document = toJson(genes);
    if (document.isError()) {
        LOG_ERROR(
            Persistence,
            "Refusing to save {}: {}",
            path.string(),
            document.errorValue().message);
        return SaveResult::error(document.errorValue());
    }

    const fs::path tmpPath = path.string() + ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::trunc);
        if (!file.is_open()) {
            return SaveResult::error(
                EvolutionError::persistence("Cannot open " + tmpPath.string() + " for writing"));
        }
        file << document.value().dump();
        file.flush();
        if (!file) {
            file.close();
            std::error_code ignored;
            fs::remove(tmpPath, ignored);
            return SaveResult::error(
                EvolutionError::persistence("Failed writing " + tmpPath.string()));
        }
    }

    std::error_code ec;
    fs::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmpPath, ignored);
        return SaveResult::error(EvolutionError::persistence(
            "Cannot move " + tmpPath.string() + " to " + path.string() + ": " + ec.message()));
    }

    LOG_INFO(Persistence, "Saved {} gene vectors to {}", genes.size(), path.string());
    return SaveResult::okay(std::monostate{});
}

Result<PopulationFile::GeneVectors, EvolutionError> PopulationFile::load(
    const std::filesystem::path& path)
{
    using LoadResult = Result<GeneVectors, EvolutionError>;

    std::ifstream file(path);
    if (!file.is_open()) {
        return LoadResult::error(
            EvolutionError::persistence("Cannot open population file " + path.string()));
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(file);
    }
    catch (const nlohmann::json::parse_error& e) {
        return LoadResult::error(EvolutionError::persistence(
            "Parse error in " + path.string() + ": " + std::string(e.what())));
    }

    auto genes = fromJson(document);
    if (genes.isValue()) {
        LOG_INFO(
            Persistence, "Loaded {} gene vectors from {}", genes.value().size(), path.string());
    }
    return genes;
}

} // namespace GenePool
