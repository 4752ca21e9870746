#include "config/layout_config.hpp"
#include "parallel/thread_coordination.h"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace plonkish {

LayoutConfig LayoutConfig::from_env() {
    LayoutConfig config;
    if (const char* env = std::getenv("PLONKISH_PARALLEL_SYN")) {
        config.parallel_synthesis = !(strcmp(env, "0") == 0 || strcmp(env, "false") == 0);
    }
    if (int count = parallel::thread_count_from_env("PLONKISH_NUM_THREADS")) {
        config.num_threads = count;
    } else if (int omp_count = parallel::thread_count_from_env("OMP_NUM_THREADS")) {
        config.num_threads = omp_count;
    }
    return config;
}

LayoutConfig LayoutConfig::from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("layout config must be a JSON object");
    }
    LayoutConfig config;
    if (json.contains("parallel_synthesis")) {
        config.parallel_synthesis = json["parallel_synthesis"].get<bool>();
    }
    if (json.contains("num_threads")) {
        int threads = json["num_threads"].get<int>();
        if (threads < 0) {
            throw std::invalid_argument("num_threads must be >= 0, got " + std::to_string(threads));
        }
        config.num_threads = threads;
    }
    if (json.contains("large_region_threshold")) {
        config.large_region_threshold = json["large_region_threshold"].get<size_t>();
    }
    return config;
}

LayoutConfig LayoutConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[config] cannot open " << path << std::endl;
        throw std::runtime_error("Failed to open file: " + path);
    }
    return from_json(nlohmann::json::parse(file));
}

nlohmann::json LayoutConfig::to_json() const {
    nlohmann::json json;
    json["parallel_synthesis"] = parallel_synthesis;
    json["num_threads"] = num_threads;
    json["large_region_threshold"] = large_region_threshold;
    return json;
}

} // namespace plonkish
