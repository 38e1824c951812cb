#pragma once

#include "Chromosome.h"
#include "EvolutionError.h"
#include "core/Result.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace GenePool {

/**
 * Fixed-size worker pool for one generation's fitness evaluations.
 *
 * Each task carries an independent snapshot tagged with its population index;
 * only (index, fitness) comes back. evaluate() blocks until every task has
 * reported, then returns fitness values ordered by index.
 *
 * Not reentrant: one evaluate() call at a time.
 */
class EvaluationPool {
public:
    struct WorkerTask {
        size_t index = 0;
        EvaluationSnapshot snapshot;
    };

    struct WorkerResult {
        size_t index = 0;
        double fitness = 0.0;
        std::string error; // Non-empty if the provider threw.
    };

    explicit EvaluationPool(int workerCount);
    ~EvaluationPool();

    EvaluationPool(const EvaluationPool&) = delete;
    EvaluationPool& operator=(const EvaluationPool&) = delete;

    Result<std::vector<double>, EvolutionError> evaluate(std::vector<WorkerTask> tasks);

    int getWorkerCount() const;

    // 0 or negative = detected core count. Clamped to [1, populationSize].
    static int resolveWorkerCount(int requested, int populationSize);

private:
    struct WorkerState {
        std::vector<std::thread> workers;
        std::deque<WorkerTask> taskQueue;
        std::mutex taskMutex;
        std::condition_variable taskCv;
        std::deque<WorkerResult> resultQueue;
        std::mutex resultMutex;
        std::condition_variable resultCv;
        std::atomic<bool> stopRequested{ false };
    };

    std::unique_ptr<WorkerState> workerState_;

    void startWorkers(int workerCount);
    void stopWorkers();
    static WorkerResult runEvaluationTask(WorkerTask& task);
};

} // namespace GenePool
