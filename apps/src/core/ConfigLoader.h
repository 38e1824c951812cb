#pragma once

#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace GenePool {

/**
 * @brief Loads configuration files with multi-path search and .local override support.
 *
 * Search order (first match wins):
 * 1. Explicit config directory (if set via setConfigDir)
 * 2. ./config/ (CWD - for development)
 * 3. ~/.config/genepool/ (user overrides)
 * 4. /etc/genepool/ (system defaults)
 *
 * At each location, checks for .local version first (e.g., train.json.local),
 * then falls back to base file (e.g., train.json). The .local file is a complete
 * replacement, not a merge.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    // Load by filename through the search paths.
    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    // Load a specific file, bypassing the search paths.
    template <typename T>
    static Result<T, std::string> loadFile(const std::filesystem::path& path);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    static std::optional<std::string> explicitConfigDir_;
    static Result<nlohmann::json, std::string> loadJson(const std::string& filename);
    static Result<nlohmann::json, std::string> tryLoadJson(const std::filesystem::path& path);

    template <typename T>
    static Result<T, std::string> parse(const nlohmann::json& json, const std::string& source);
};

// Template implementation.
template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    auto jsonResult = loadJson(filename);
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }
    return parse<T>(jsonResult.value(), filename);
}

template <typename T>
Result<T, std::string> ConfigLoader::loadFile(const std::filesystem::path& path)
{
    auto jsonResult = tryLoadJson(path);
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }
    return parse<T>(jsonResult.value(), path.string());
}

template <typename T>
Result<T, std::string> ConfigLoader::parse(const nlohmann::json& json, const std::string& source)
{
    try {
        T config;
        // Use unqualified call to enable ADL (argument-dependent lookup).
        from_json(json, config);
        return Result<T, std::string>::okay(config);
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + source + ": " + e.what());
    }
}

} // namespace GenePool
