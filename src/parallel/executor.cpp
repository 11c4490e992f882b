#include "parallel/executor.hpp"
#include "parallel/thread_coordination.h"
#include <algorithm>
#include <exception>
#include <mutex>
#include <stdexcept>

#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#ifdef STARKCOMP_USE_TASKFLOW
#include <taskflow/taskflow.hpp>
#include <taskflow/algorithm/for_each.hpp>
#endif

namespace starkcomp::parallel {

namespace {

// First exception thrown by any task; runtimes that cannot propagate
// exceptions out of a worker record it here and rethrow after the join.
class FirstException {
public:
    void capture() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!error_) {
            error_ = std::current_exception();
        }
    }

    void rethrow_if_any() {
        if (error_) {
            std::rethrow_exception(error_);
        }
    }

private:
    std::mutex mutex_;
    std::exception_ptr error_;
};

} // namespace

ExecutorKind parse_executor_kind(const std::string& name) {
    if (name == "sequential") return ExecutorKind::Sequential;
    if (name == "tbb") return ExecutorKind::Tbb;
    if (name == "openmp") return ExecutorKind::OpenMp;
    if (name == "taskflow") return ExecutorKind::Taskflow;
    throw std::invalid_argument("Unknown executor: " + name);
}

const char* to_string(ExecutorKind kind) {
    switch (kind) {
        case ExecutorKind::Sequential: return "sequential";
        case ExecutorKind::Tbb: return "tbb";
        case ExecutorKind::OpenMp: return "openmp";
        case ExecutorKind::Taskflow: return "taskflow";
    }
    return "unknown";
}

void SequentialExecutor::parallel_for(size_t num_tasks, const std::function<void(size_t)>& task) {
    for (size_t i = 0; i < num_tasks; ++i) {
        task(i);
    }
}

void TbbExecutor::parallel_for(size_t num_tasks, const std::function<void(size_t)>& task) {
    // TBB rethrows the first task exception on the calling thread
    tbb::parallel_for(size_t(0), num_tasks, [&](size_t i) { task(i); });
}

size_t TbbExecutor::concurrency() const {
    return static_cast<size_t>(std::max(1, tbb::this_task_arena::max_concurrency()));
}

void OpenMpExecutor::parallel_for(size_t num_tasks, const std::function<void(size_t)>& task) {
    FirstException first_error;
    const long long n = static_cast<long long>(num_tasks);

    #pragma omp parallel for schedule(dynamic, 1)
    for (long long i = 0; i < n; ++i) {
        try {
            task(static_cast<size_t>(i));
        } catch (...) {
            first_error.capture();
        }
    }

    first_error.rethrow_if_any();
}

size_t OpenMpExecutor::concurrency() const {
    return static_cast<size_t>(std::max(1, get_current_thread_count()));
}

#ifdef STARKCOMP_USE_TASKFLOW
struct TaskflowExecutor::Impl {
    tf::Executor executor{static_cast<size_t>(get_optimal_thread_count())};
};

TaskflowExecutor::TaskflowExecutor() : impl_(std::make_unique<Impl>()) {}

TaskflowExecutor::~TaskflowExecutor() = default;

void TaskflowExecutor::parallel_for(size_t num_tasks, const std::function<void(size_t)>& task) {
    FirstException first_error;
    tf::Taskflow taskflow;
    taskflow.for_each_index(size_t(0), num_tasks, size_t(1), [&](size_t i) {
        try {
            task(i);
        } catch (...) {
            first_error.capture();
        }
    });
    impl_->executor.run(taskflow).wait();
    first_error.rethrow_if_any();
}

size_t TaskflowExecutor::concurrency() const {
    return impl_->executor.num_workers();
}
#endif

std::unique_ptr<Executor> make_executor(ExecutorKind kind) {
    switch (kind) {
        case ExecutorKind::Sequential:
            return std::make_unique<SequentialExecutor>();
        case ExecutorKind::Tbb:
            return std::make_unique<TbbExecutor>();
        case ExecutorKind::OpenMp:
            return std::make_unique<OpenMpExecutor>();
        case ExecutorKind::Taskflow:
#ifdef STARKCOMP_USE_TASKFLOW
            return std::make_unique<TaskflowExecutor>();
#else
            throw std::invalid_argument("Taskflow executor requested but starkcomp was built without Taskflow");
#endif
    }
    throw std::invalid_argument("Unknown executor kind");
}

void for_each_batch(
    Executor& executor,
    size_t length,
    size_t min_batch,
    const std::function<void(size_t, size_t)>& fn
) {
    if (length == 0) {
        return;
    }

    const size_t workers = std::max<size_t>(1, executor.concurrency());
    const size_t batch_size = std::max<size_t>(std::max<size_t>(1, min_batch),
                                               (length + workers - 1) / workers);
    const size_t num_batches = (length + batch_size - 1) / batch_size;

    executor.parallel_for(num_batches, [&](size_t batch) {
        const size_t begin = batch * batch_size;
        const size_t end = std::min(length, begin + batch_size);
        fn(begin, end);
    });
}

} // namespace starkcomp::parallel
