#include "Selection.h"

#include "Chromosome.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>
#include <optional>
#include <string>

namespace GenePool {

namespace {
std::optional<size_t> drawWeighted(const std::vector<double>& weights, std::mt19937& rng)
{
    const double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (!(total > 0.0)) {
        return std::nullopt;
    }

    std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
    return dist(rng);
}

size_t drawUniformExcluding(size_t domainSize, std::optional<size_t> excluded, std::mt19937& rng)
{
    if (!excluded.has_value()) {
        std::uniform_int_distribution<size_t> dist(0, domainSize - 1);
        return dist(rng);
    }

    std::uniform_int_distribution<size_t> dist(0, domainSize - 2);
    size_t idx = dist(rng);
    if (idx >= excluded.value()) {
        ++idx;
    }
    return idx;
}

Result<ParentPair, EvolutionError> requirePairable(const std::vector<Chromosome>& population)
{
    if (population.size() < 2) {
        return Result<ParentPair, EvolutionError>::error(EvolutionError::configuration(
            "Selection needs at least 2 chromosomes, population has "
            + std::to_string(population.size())));
    }
    return Result<ParentPair, EvolutionError>::okay(ParentPair{});
}
} // namespace

Result<std::vector<ParentPair>, EvolutionError> SelectionMethod::selectParents(
    const std::vector<Chromosome>& population, size_t count, std::mt19937& rng) const
{
    std::vector<ParentPair> pairs;
    pairs.reserve(count);

    while (pairs.size() < count) {
        auto pair = selectPair(population, rng);
        if (pair.isError()) {
            LOG_WARN(
                Selection,
                "{} selection failed after {} of {} pairs: {}",
                name(),
                pairs.size(),
                count,
                pair.errorValue().message);
            return Result<std::vector<ParentPair>, EvolutionError>::error(pair.errorValue());
        }
        LOG_TRACE(Selection, "{} pair: ({}, {})", name(), pair.value().first, pair.value().second);
        pairs.push_back(pair.value());
    }

    return Result<std::vector<ParentPair>, EvolutionError>::okay(std::move(pairs));
}

RouletteSelection::RouletteSelection(DegenerateWeightPolicy degeneratePolicy)
    : degeneratePolicy_(degeneratePolicy)
{}

double RouletteSelection::weightFor(double fitness)
{
    if (!std::isfinite(fitness) || fitness <= 0.0) {
        return 0.0;
    }
    return fitness * fitness;
}

Result<ParentPair, EvolutionError> RouletteSelection::selectPair(
    const std::vector<Chromosome>& population, std::mt19937& rng) const
{
    if (auto check = requirePairable(population); check.isError()) {
        return check;
    }

    std::vector<double> weights;
    weights.reserve(population.size());
    for (const auto& chromosome : population) {
        weights.push_back(weightFor(chromosome.getFitness()));
    }

    std::optional<size_t> first;
    std::optional<size_t> second;
    for (std::optional<size_t>* slot : { &first, &second }) {
        *slot = drawWeighted(weights, rng);
        if (!slot->has_value()) {
            if (degeneratePolicy_ == DegenerateWeightPolicy::Fail) {
                return Result<ParentPair, EvolutionError>::error(
                    EvolutionError::degenerateDistribution(
                        "Roulette selection: every remaining candidate has zero weight "
                        "(no positive fitness)"));
            }
            LOG_DEBUG(Selection, "Roulette weights all zero, falling back to uniform draw");
            *slot = drawUniformExcluding(population.size(), first, rng);
        }
        // Remove the drawn chromosome from the wheel.
        weights[slot->value()] = 0.0;
    }

    return Result<ParentPair, EvolutionError>::okay(
        ParentPair{ .first = first.value(), .second = second.value() });
}

Result<ParentPair, EvolutionError> RankSelection::selectPair(
    const std::vector<Chromosome>& population, std::mt19937& rng) const
{
    if (auto check = requirePairable(population); check.isError()) {
        return check;
    }

    // Ascending by fitness; equal fitness keeps population order.
    std::vector<size_t> order(population.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&population](size_t a, size_t b) {
        return population[a].getFitness() < population[b].getFitness();
    });

    std::vector<double> weights(order.size());
    std::iota(weights.begin(), weights.end(), 1.0);

    // Rank weights are strictly positive, so neither draw can be degenerate.
    const size_t firstRank = drawWeighted(weights, rng).value();
    weights[firstRank] = 0.0;
    const size_t secondRank = drawWeighted(weights, rng).value();

    return Result<ParentPair, EvolutionError>::okay(
        ParentPair{ .first = order[firstRank], .second = order[secondRank] });
}

TournamentSelection::TournamentSelection(int tournamentSize) : tournamentSize_(tournamentSize)
{}

Result<ParentPair, EvolutionError> TournamentSelection::selectPair(
    const std::vector<Chromosome>& population, std::mt19937& rng) const
{
    if (auto check = requirePairable(population); check.isError()) {
        return check;
    }
    if (tournamentSize_ < 2 || static_cast<size_t>(tournamentSize_) > population.size()) {
        return Result<ParentPair, EvolutionError>::error(EvolutionError::configuration(
            "Tournament size " + std::to_string(tournamentSize_) + " must be in [2, "
            + std::to_string(population.size()) + "]"));
    }

    std::vector<size_t> all(population.size());
    std::iota(all.begin(), all.end(), 0);

    // std::sample keeps the relative order of the input, so ties resolve to the lower index.
    std::vector<size_t> contestants;
    contestants.reserve(tournamentSize_);
    std::sample(
        all.begin(),
        all.end(),
        std::back_inserter(contestants),
        static_cast<size_t>(tournamentSize_),
        rng);

    std::stable_sort(
        contestants.begin(), contestants.end(), [&population](size_t a, size_t b) {
            return population[a].getFitness() > population[b].getFitness();
        });

    return Result<ParentPair, EvolutionError>::okay(
        ParentPair{ .first = contestants[0], .second = contestants[1] });
}

} // namespace GenePool
