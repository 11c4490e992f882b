#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace starkcomp::parallel {

enum class ExecutorKind {
    Sequential,
    Tbb,
    OpenMp,
    Taskflow
};

ExecutorKind parse_executor_kind(const std::string& name);
const char* to_string(ExecutorKind kind);

/**
 * Executor - runs independent closures, possibly concurrently
 *
 * The evaluation table and the accumulation kernels never talk to a threading
 * runtime directly; they hand a set of tasks that touch disjoint memory to an
 * Executor. parallel_for returns once every task has finished. If a task
 * throws, the first exception is rethrown on the calling thread.
 */
class Executor {
public:
    virtual ~Executor() = default;

    virtual void parallel_for(size_t num_tasks, const std::function<void(size_t)>& task) = 0;

    // Number of tasks worth creating to keep every worker busy
    virtual size_t concurrency() const = 0;

    virtual const char* name() const = 0;
};

class SequentialExecutor : public Executor {
public:
    void parallel_for(size_t num_tasks, const std::function<void(size_t)>& task) override;
    size_t concurrency() const override { return 1; }
    const char* name() const override { return "sequential"; }
};

class TbbExecutor : public Executor {
public:
    void parallel_for(size_t num_tasks, const std::function<void(size_t)>& task) override;
    size_t concurrency() const override;
    const char* name() const override { return "tbb"; }
};

class OpenMpExecutor : public Executor {
public:
    void parallel_for(size_t num_tasks, const std::function<void(size_t)>& task) override;
    size_t concurrency() const override;
    const char* name() const override { return "openmp"; }
};

#ifdef STARKCOMP_USE_TASKFLOW
class TaskflowExecutor : public Executor {
public:
    TaskflowExecutor();
    ~TaskflowExecutor() override;

    void parallel_for(size_t num_tasks, const std::function<void(size_t)>& task) override;
    size_t concurrency() const override;
    const char* name() const override { return "taskflow"; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
#endif

/**
 * Creates an executor of the given kind. Requesting Taskflow from a build
 * without it throws std::invalid_argument.
 */
std::unique_ptr<Executor> make_executor(ExecutorKind kind);

/**
 * Splits [0, length) into contiguous, disjoint batches of at least min_batch
 * elements (the last one may be shorter) and runs fn(begin, end) for each
 * through the executor.
 */
void for_each_batch(
    Executor& executor,
    size_t length,
    size_t min_batch,
    const std::function<void(size_t, size_t)>& fn);

} // namespace starkcomp::parallel
