#pragma once

/**
 * Thread Coordination Utility
 *
 * Coordinates thread counts between OpenMP and TBB to avoid oversubscription.
 *
 * Strategy:
 * - OpenMP: loop-level parallelism (fill, batch inversion, Lagrange vectors)
 * - TBB: one task per region while a batch of regions is materialized
 *
 * Thread allocation:
 * - PLONKISH_NUM_THREADS, then OMP_NUM_THREADS, if set
 * - Otherwise, physical core count (not logical threads)
 */

#include <algorithm>
#include <cstdlib>
#include <thread>

#include <tbb/global_control.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace plonkish::parallel {

inline int thread_count_from_env(const char* name) {
    const char* value = std::getenv(name);
    if (value) {
        int count = std::atoi(value);
        if (count > 0) {
            return count;
        }
    }
    return 0;
}

/**
 * Get the optimal thread count for parallel execution
 */
inline int get_optimal_thread_count() {
    if (int count = thread_count_from_env("PLONKISH_NUM_THREADS")) {
        return count;
    }
    if (int count = thread_count_from_env("OMP_NUM_THREADS")) {
        return count;
    }
    // Physical cores; SMT siblings do not help field arithmetic
    unsigned int hw_threads = std::thread::hardware_concurrency();
    return std::max(1, static_cast<int>(hw_threads / 2));
}

/**
 * Initialize thread coordination for OpenMP and TBB.
 * Call this once at program startup; 0 selects get_optimal_thread_count().
 */
inline void initialize_thread_coordination(int thread_count = 0) {
    if (thread_count <= 0) {
        thread_count = get_optimal_thread_count();
    }

#ifdef _OPENMP
    omp_set_num_threads(thread_count);
#endif

    static tbb::global_control tbb_control(
        tbb::global_control::max_allowed_parallelism,
        static_cast<size_t>(thread_count)
    );
}

/**
 * Run body(i) for every i in [0, count) inside an arena of num_threads
 * workers (0 = automatic). Returns once every call has finished.
 */
template<typename Body>
void run_in_arena(int num_threads, size_t count, Body&& body) {
    tbb::task_arena arena(num_threads > 0 ? num_threads : tbb::task_arena::automatic);
    arena.execute([&] {
        tbb::parallel_for(size_t(0), count, [&](size_t i) {
            body(i);
        });
    });
}

} // namespace plonkish::parallel
