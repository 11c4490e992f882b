#pragma once

/**
 * Thread Coordination Utility
 *
 * Coordinates thread counts between OpenMP, TBB and (when built with it)
 * Taskflow so that the executors never oversubscribe the machine.
 *
 * Thread allocation:
 * - If OMP_NUM_THREADS is set, use that as the base
 * - Otherwise, use physical core count (not logical threads)
 */

#include <cstdlib>
#include <thread>
#include <algorithm>

#ifdef _OPENMP
#include <omp.h>
#endif

#include <tbb/global_control.h>

namespace starkcomp::parallel {

/**
 * Optimal thread count: OMP_NUM_THREADS if set, otherwise physical cores
 */
inline int get_optimal_thread_count() {
    const char* omp_threads = std::getenv("OMP_NUM_THREADS");
    if (omp_threads) {
        int count = std::atoi(omp_threads);
        if (count > 0) {
            return count;
        }
    }

    // Assume 2-way SMT
    unsigned int hw_threads = std::thread::hardware_concurrency();
    return std::max(1, static_cast<int>(hw_threads / 2));
}

/**
 * Apply the thread count to every parallel runtime. Call once at startup.
 */
inline void initialize_thread_coordination() {
    int thread_count = get_optimal_thread_count();

#ifdef _OPENMP
    omp_set_num_threads(thread_count);
#endif

    static tbb::global_control tbb_control(
        tbb::global_control::max_allowed_parallelism,
        static_cast<size_t>(thread_count));
}

inline int get_current_thread_count() {
#ifdef _OPENMP
    return omp_get_max_threads();
#else
    return get_optimal_thread_count();
#endif
}

} // namespace starkcomp::parallel
