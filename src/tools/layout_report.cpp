#include <chrono>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/debug_control.hpp"
#include "common/error.hpp"
#include "config/layout_config.hpp"
#include "dev/mock_prover.hpp"
#include "floor_planner/single_pass.hpp"
#include "parallel/thread_coordination.h"

using namespace plonkish;

namespace {

/**
 * Running-sum circuit: a constant seed, a batch of independent step regions
 * that each copy the seed and add their index, a small range table, and the
 * last step exposed as public input.
 */
struct RunningSumCircuit {
    struct Config {
        AdviceColumn a;
        AdviceColumn b;
        FixedColumn constants;
        InstanceColumn instance;
        Selector step;
        TableColumn range;
    };

    size_t steps = 16;

    static Config configure(ConstraintSystem& cs) {
        Config config;
        config.a = cs.advice_column();
        config.b = cs.advice_column();
        config.constants = cs.fixed_column();
        config.instance = cs.instance_column();
        config.step = cs.selector();
        config.range = cs.lookup_table_column();

        cs.enable_equality(config.a);
        cs.enable_equality(config.b);
        cs.enable_equality(config.instance);
        cs.enable_constant(config.constants);
        cs.query_advice(config.a, 0);
        cs.query_advice(config.b, 0);
        return config;
    }

    void synthesize(const Config& config, SingleChipLayouter& layouter) const {
        layouter.assign_table("range", [&config](Table& table) {
            for (size_t i = 0; i < 8; ++i) {
                table.assign_cell("range", config.range, i, [i]() {
                    return Value<Assigned>::known(Fp(i));
                });
            }
        });

        AssignedCell seed = layouter.assign_region("seed", [&config](Region& region) {
            region.name_column("seed", config.a);
            return region.assign_advice_from_constant("seed", config.a, 0, Fp::one());
        });

        std::vector<std::function<AssignedCell(Region&)>> step_regions;
        for (size_t i = 0; i < steps; ++i) {
            step_regions.push_back([&config, &seed, i](Region& region) {
                region.enable_selector("step", config.step, 0);
                AssignedCell prev = seed.copy_advice("prev", region, config.a, 0);
                return region.assign_advice("next", config.b, 0, [&prev, i]() {
                    return prev.value().map([i](const Assigned& v) { return Assigned(v.evaluate() + Fp(i)); });
                });
            });
        }
        std::vector<AssignedCell> outputs = layouter.assign_regions("step", step_regions);

        if (!outputs.empty()) {
            layouter.constrain_instance(outputs.back().cell(), config.instance, 0);
        }
    }
};

void print_usage(const char* program) {
    std::cerr << "Usage:\n";
    std::cerr << "  " << program << " [--k N] [--regions N] [--serial] [--config FILE] [--output FILE]\n";
    std::cerr << "    --k        log2 of the grid height (default 8)\n";
    std::cerr << "    --regions  number of step regions laid out as one batch (default 16)\n";
    std::cerr << "    --serial   materialize batches without forking\n";
    std::cerr << "    --config   JSON layout configuration\n";
    std::cerr << "    --output   write the layout JSON here instead of stdout\n";
}

} // namespace

int main(int argc, char* argv[]) {
    unsigned long k = 8;
    unsigned long regions = 16;
    bool serial = false;
    std::string config_path;
    std::string output_path;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if ((arg == "--k" || arg == "--regions") && has_value) {
            const std::string value = argv[++i];
            try {
                (arg == "--k" ? k : regions) = std::stoul(value);
            } catch (const std::exception&) {
                std::cerr << "Invalid value for " << arg << ": " << value << "\n";
                return 1;
            }
        } else if (arg == "--serial") {
            serial = true;
        } else if (arg == "--config" && has_value) {
            config_path = argv[++i];
        } else if (arg == "--output" && has_value) {
            output_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (k < 1 || k > MAX_K) {
        std::cerr << "--k must be between 1 and " << MAX_K << ", got " << k << "\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        LayoutConfig config = config_path.empty() ? LayoutConfig::from_env() : LayoutConfig::load(config_path);
        if (serial) {
            config.parallel_synthesis = false;
        }
        parallel::initialize_thread_coordination(config.num_threads);

        RunningSumCircuit circuit;
        circuit.steps = regions;

        // seed + sum of step indices
        Fp expected = Fp::one();
        if (regions > 0) {
            expected += Fp(regions - 1);
        }

        auto start = std::chrono::high_resolution_clock::now();
        std::vector<std::vector<Fp>> instances = {{expected}};
        dev::MockProver prover = dev::MockProver::run(static_cast<uint32_t>(k), circuit, instances, config);
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::high_resolution_clock::now() - start).count() / 1000.0;
        PLONKISH_PROFILE_COUT("[layout_report] synthesis took " << elapsed << " ms" << std::endl);

        std::vector<dev::VerifyFailure> failures = prover.verify();
        for (const auto& failure : failures) {
            std::cerr << "[layout_report] " << failure.to_string() << std::endl;
        }

        nlohmann::json report = prover.layout_json();
        report["config"] = config.to_json();
        report["verified"] = failures.empty();

        if (output_path.empty()) {
            std::cout << report.dump(2) << std::endl;
        } else {
            std::ofstream out(output_path);
            if (!out.is_open()) {
                std::cerr << "Could not open output: " << output_path << std::endl;
                return 1;
            }
            out << report.dump(2) << std::endl;
            std::cerr << "Layout of " << prover.regions().size() << " regions written to "
                      << output_path << std::endl;
        }
        return failures.empty() ? 0 : 2;
    } catch (const Error& e) {
        std::cerr << "[layout_report] " << e.what() << std::endl;
        if (e.kind() == ErrorKind::NotEnoughRowsAvailable) {
            std::cerr << "  try --k " << e.current_k() + 1 << std::endl;
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[layout_report] " << e.what() << std::endl;
        return 1;
    }
}
