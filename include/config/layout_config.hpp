#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace plonkish {

/**
 * LayoutConfig - Tunables of the floor planner
 */
struct LayoutConfig {
    // Materialize assign_regions() batches concurrently when the assignment supports fork
    bool parallel_synthesis = true;

    // Worker threads for region batches; 0 = automatic
    int num_threads = 0;

    // Regions at least this tall have their placement logged
    size_t large_region_threshold = 40;

    /**
     * Defaults overridden by PLONKISH_PARALLEL_SYN ("0"/"false" disables),
     * PLONKISH_NUM_THREADS and OMP_NUM_THREADS.
     */
    static LayoutConfig from_env();

    // Missing keys keep their defaults
    static LayoutConfig from_json(const nlohmann::json& json);

    // @throws std::runtime_error if the file cannot be opened
    static LayoutConfig load(const std::string& path);

    nlohmann::json to_json() const;
};

} // namespace plonkish
