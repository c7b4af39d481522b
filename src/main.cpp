#include "config/config_loader.hpp"
#include "sim/simulation_runner.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    std::string config_path = "data/config.json";
    long long steps = -1;
    long long seed = -1;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--steps" && i + 1 < argc) {
            steps = std::stoll(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = std::stoll(argv[++i]);
        } else if (arg == "--help") {
            std::cout << "Usage: dnmm_sim [options]\n"
                      << "  --config <path>  Config file (default: data/config.json)\n"
                      << "  --steps <n>      Number of simulated blocks (overrides config)\n"
                      << "  --seed <n>       Random seed (overrides config)\n"
                      << "  --help           Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return 2;
        }
    }

    std::cout << "Loading config from: " << config_path << "\n";
    auto config = dnmm::load_simulation_config(config_path);
    if (!config) {
        const auto& err = config.error();
        std::cerr << "Config error (" << dnmm::to_string(err.code) << "): " << err.detail << "\n";
        return 1;
    }

    dnmm::SimulationConfig sim = *config;
    if (steps >= 0) sim.steps = static_cast<size_t>(steps);
    if (seed >= 0) sim.seed = static_cast<uint64_t>(seed);

    dnmm::SimulationRunner runner(sim);

    std::cout << "Running simulation with " << sim.steps << " blocks, seed " << sim.seed
              << ", reserves " << sim.reserves.base_reserve << "/" << sim.reserves.quote_reserve
              << "...\n";
    runner.run();

    runner.write_report(sim.report_path);
    runner.write_csv(sim.csv_path);

    std::cout << "\n" << runner.report();
    std::cout << "\nResults written to " << sim.report_path << " and " << sim.csv_path << "\n";

    return 0;
}
