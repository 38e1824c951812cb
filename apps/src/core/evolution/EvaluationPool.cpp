#include "EvaluationPool.h"

#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <string>

namespace GenePool {

EvaluationPool::EvaluationPool(int workerCount) : workerState_(std::make_unique<WorkerState>())
{
    GENEPOOL_ASSERT(workerCount > 0, "EvaluationPool needs at least one worker");
    startWorkers(workerCount);
}

EvaluationPool::~EvaluationPool()
{
    stopWorkers();
}

int EvaluationPool::resolveWorkerCount(int requested, int populationSize)
{
    int resolved = requested;
    if (resolved <= 0) {
        const unsigned int cores = std::thread::hardware_concurrency();
        resolved = cores > 0 ? static_cast<int>(cores) : 1;
    }

    if (resolved < 1) {
        resolved = 1;
    }
    if (populationSize > 0 && resolved > populationSize) {
        resolved = populationSize;
    }
    return resolved;
}

int EvaluationPool::getWorkerCount() const
{
    return static_cast<int>(workerState_->workers.size());
}

void EvaluationPool::startWorkers(int workerCount)
{
    workerState_->workers.reserve(workerCount);
    WorkerState* state = workerState_.get();
    for (int i = 0; i < workerCount; ++i) {
        workerState_->workers.emplace_back([state]() {
            while (true) {
                WorkerTask task;
                {
                    std::unique_lock<std::mutex> lock(state->taskMutex);
                    state->taskCv.wait(lock, [state]() {
                        return state->stopRequested || !state->taskQueue.empty();
                    });
                    if (state->stopRequested) {
                        return;
                    }
                    task = std::move(state->taskQueue.front());
                    state->taskQueue.pop_front();
                }

                WorkerResult result = runEvaluationTask(task);

                {
                    std::lock_guard<std::mutex> lock(state->resultMutex);
                    state->resultQueue.push_back(std::move(result));
                }
                state->resultCv.notify_one();
            }
        });
    }

    LOG_DEBUG(Pool, "Started {} evaluation workers", workerCount);
}

void EvaluationPool::stopWorkers()
{
    if (!workerState_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(workerState_->taskMutex);
        workerState_->stopRequested = true;
    }
    workerState_->taskCv.notify_all();

    for (auto& worker : workerState_->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workerState_->workers.clear();

    {
        std::lock_guard<std::mutex> lock(workerState_->taskMutex);
        workerState_->taskQueue.clear();
    }
    {
        std::lock_guard<std::mutex> lock(workerState_->resultMutex);
        workerState_->resultQueue.clear();
    }
}

EvaluationPool::WorkerResult EvaluationPool::runEvaluationTask(WorkerTask& task)
{
    WorkerResult result;
    result.index = task.index;

    try {
        result.fitness = task.snapshot.provider->evaluate();
    }
    catch (const std::exception& e) {
        result.error = e.what();
        if (result.error.empty()) {
            result.error = "fitness provider threw an exception without a message";
        }
        return result;
    }
    catch (...) {
        result.error = "fitness provider threw a non-standard exception";
        return result;
    }

    // NaN or infinity would poison best-of and the sort comparators downstream.
    if (!std::isfinite(result.fitness)) {
        result.error =
            "fitness provider returned non-finite value " + std::to_string(result.fitness);
        result.fitness = 0.0;
    }

    return result;
}

Result<std::vector<double>, EvolutionError> EvaluationPool::evaluate(std::vector<WorkerTask> tasks)
{
    const size_t taskCount = tasks.size();
    const auto start = std::chrono::steady_clock::now();

    {
        std::lock_guard<std::mutex> lock(workerState_->taskMutex);
        for (auto& task : tasks) {
            GENEPOOL_ASSERT(task.index < taskCount, "Task index outside the submitted batch");
            workerState_->taskQueue.push_back(std::move(task));
        }
    }
    workerState_->taskCv.notify_all();

    // Block until every task has reported; there is no partial-result path.
    std::deque<WorkerResult> results;
    {
        std::unique_lock<std::mutex> lock(workerState_->resultMutex);
        workerState_->resultCv.wait(
            lock, [this, taskCount]() { return workerState_->resultQueue.size() >= taskCount; });
        results.swap(workerState_->resultQueue);
    }

    std::vector<double> fitness(taskCount, 0.0);
    std::vector<bool> seen(taskCount, false);
    const WorkerResult* firstFailure = nullptr;
    for (const auto& result : results) {
        GENEPOOL_ASSERT(!seen[result.index], "Duplicate evaluation result for one index");
        seen[result.index] = true;
        if (!result.error.empty()) {
            if (!firstFailure || result.index < firstFailure->index) {
                firstFailure = &result;
            }
            continue;
        }
        fitness[result.index] = result.fitness;
    }

    const auto elapsedMs = std::chrono::duration<double, std::milli>(
                               std::chrono::steady_clock::now() - start)
                               .count();
    LOG_DEBUG(
        Pool,
        "Evaluated {} chromosomes on {} workers in {:.1f}ms",
        taskCount,
        getWorkerCount(),
        elapsedMs);

    if (firstFailure) {
        LOG_ERROR(
            Pool,
            "Fitness evaluation failed for index {}: {}",
            firstFailure->index,
            firstFailure->error);
        return Result<std::vector<double>, EvolutionError>::error(EvolutionError::provider(
            "Fitness evaluation failed for chromosome " + std::to_string(firstFailure->index)
            + ": " + firstFailure->error));
    }

    return Result<std::vector<double>, EvolutionError>::okay(std::move(fitness));
}

} // namespace GenePool
