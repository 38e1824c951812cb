#include "TrainRunner.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/ReflectSerializer.h"
#include "core/evolution/TrainingConfig.h"
#include <args.hxx>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

using namespace GenePool;

namespace {

constexpr const char* kDefaultTrainConfig = "train.json";

std::string getExamplesHelp()
{
    return "Examples:\n"
           "  genepool-cli train\n"
           "  genepool-cli train -c config/train.json --cycles 100 --seed 7\n"
           "  genepool-cli train --population-file current_pop.json --best-output best.json\n"
           "  genepool-cli train --log-channels \"*:warn,evolution:debug\" -v\n"
           "  genepool-cli example\n\n"
           "Built-in fitness providers: sum, sphere.\n";
}

// -c accepts a direct path or a filename looked up through ConfigLoader's search paths.
Result<TrainingConfig, std::string> loadTrainingConfig(const std::string& configArg)
{
    if (!configArg.empty()) {
        if (std::filesystem::exists(configArg)) {
            return ConfigLoader::loadFile<TrainingConfig>(configArg);
        }
        return ConfigLoader::load<TrainingConfig>(configArg);
    }

    if (ConfigLoader::findConfigFile(kDefaultTrainConfig).has_value()) {
        return ConfigLoader::load<TrainingConfig>(kDefaultTrainConfig);
    }

    LOG_INFO(Cli, "No {} found, using built-in defaults", kDefaultTrainConfig);
    return Result<TrainingConfig, std::string>::okay(TrainingConfig{});
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "GenePool CLI",
        "Train a population of gene vectors with a genetic algorithm.\n\n" + getExamplesHelp());

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(
        parser,
        "verbose",
        "Enable debug logging, including per-generation fitness lists",
        { 'v', "verbose" });
    args::ValueFlag<std::string> configFile(
        parser,
        "config",
        "Training config JSON (path or name in config search paths)",
        { 'c', "config" });
    args::ValueFlag<int> cycles(
        parser,
        "cycles",
        "Generation budget (-1 = until convergence, 0 = evaluate only)",
        { "cycles" });
    args::ValueFlag<double> elitism(
        parser, "elitism", "Fraction of each generation carried over unchanged", { "elitism" });
    args::ValueFlag<double> threshold(
        parser,
        "threshold",
        "Relative mean-fitness change that counts as converged",
        { "threshold" });
    args::ValueFlag<uint32_t> seed(parser, "seed", "RNG seed for a reproducible run", { "seed" });
    args::ValueFlag<std::string> populationFile(
        parser,
        "population-file",
        "Population document: loaded at start if it exists, written at the end",
        { "population-file" });
    args::ValueFlag<std::string> bestOutput(
        parser, "best-output", "Write the best genes and fitness as JSON", { "best-output" });
    args::ValueFlag<std::string> logConfig(
        parser, "log-config", "Logging config JSON (default: built-in levels)", { "log-config" });
    args::ValueFlag<std::string> logChannels(
        parser,
        "log-channels",
        "Channel levels, e.g. \"evolution:debug,pool:trace\" or \"*:warn\"",
        { "log-channels" });

    args::Positional<std::string> command(parser, "command", "Command: 'train' or 'example'");

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }
    catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    // Initialize logging channels.
    if (logConfig) {
        auto logResult = LoggingChannels::initializeFromConfig(args::get(logConfig), "cli");
        if (logResult.isError()) {
            std::cerr << "Error: " << logResult.errorValue() << std::endl;
            return 1;
        }
    }
    else {
        LoggingChannels::initialize(
            verbose ? spdlog::level::debug : spdlog::level::info, spdlog::level::debug, "cli");
    }
    if (verbose) {
        LoggingChannels::setChannelLevel(LogChannel::Evolution, spdlog::level::debug);
    }
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
    }

    if (!command) {
        std::cerr << "Error: command is required ('train' or 'example')\n\n";
        std::cerr << parser;
        return 1;
    }

    const std::string commandName = args::get(command);

    if (commandName == "example") {
        nlohmann::json example = TrainingConfig{};
        std::cout << example.dump(2) << std::endl;
        return 0;
    }

    if (commandName != "train") {
        std::cerr << "Error: unknown command '" << commandName << "'\n\n";
        std::cerr << parser;
        return 1;
    }

    auto configResult = loadTrainingConfig(configFile ? args::get(configFile) : "");
    if (configResult.isError()) {
        std::cerr << "Error loading training config: " << configResult.errorValue() << std::endl;
        return 1;
    }
    TrainingConfig config = configResult.value();

    // Command line overrides.
    if (cycles) {
        config.evolution.cycleBudget = args::get(cycles);
    }
    if (elitism) {
        config.evolution.elitismFraction = args::get(elitism);
    }
    if (threshold) {
        config.evolution.stoppingThreshold = args::get(threshold);
    }
    if (seed) {
        config.evolution.rngSeed = args::get(seed);
    }
    if (populationFile) {
        config.populationFile = args::get(populationFile);
    }
    if (bestOutput) {
        config.bestOutputFile = args::get(bestOutput);
    }

    Client::TrainRunner runner;
    auto results = runner.run(config);

    // Output results as JSON to stdout.
    nlohmann::json output = ReflectSerializer::to_json(results);
    std::cout << output.dump(2) << std::endl;

    return results.completed ? 0 : 1;
}
