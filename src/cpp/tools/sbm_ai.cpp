#include "runs/run_driver.hpp"
#include "config/cli_options.hpp"
#include "common.hpp"
#include <boost/program_options.hpp>
#include <iostream>
#include <filesystem>
#include <iomanip>

namespace po = boost::program_options;
using namespace sbm;

int main(int argc, char** argv) {
    Timer timer;
    timer.start();

    auto print_performance = [&timer]() {
        timer.stop();
        double runtime = timer.elapsed_seconds();
        double memory_mb = get_peak_memory_mb();
        std::cerr << "[Performance] Runtime: " << std::fixed << std::setprecision(2) << runtime << "s";
        if (memory_mb > 0.0) {
            std::cerr << " | Peak Memory: " << std::fixed << std::setprecision(1) << memory_mb << " MB";
        }
        std::cerr << "\n";
    };

    try {
        StreamCliArgs args;

        po::options_description desc("Monitor a state stream for alphabet growth and regime fractures");
        desc.add_options()
            ("help,h", "Show help message");
        add_stream_options(desc, args);

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << desc << "\n";
            std::cout << "\nExample usage:\n";
            std::cout << "  sbm_ai --N 200000 --shift-n 100000 --pre-mode plateau --post-mode lcg\n";
            std::cout << "  sbm_ai --N 10000 --H 12 --obs popcnt_parity --out OUT_POPCNT\n";
            print_performance();
            return 0;
        }

        po::notify(vm);

        const StreamConfig config = to_stream_config(args);

        std::cerr << "Running stream N=" << config.N << ", H=" << config.H
                  << ", shift_n=" << config.shift_n << " (" << args.pre_mode << " -> " << args.post_mode << ")\n";
        StreamRun run = run_stream(config, args.out_dir);
        if (run.metrics.stability.fracture_candidate_count > 0) {
            std::cerr << "Warning: " << run.metrics.stability.fracture_candidate_count
                      << " fracture candidate(s), first at n=" << run.metrics.stability.fracture_first_at_n << "\n";
        }

        std::cout << "DONE\n";
        std::cout << "OUT DIR: " << run.artifacts.out_dir.string() << "\n";
        std::cout << "FILES:\n";
        for (const auto& f : run.artifacts.files) {
            std::cout << " - " << f.filename().string() << "\n";
        }
        std::cout << " - " << run.artifacts.manifest.filename().string() << "\n";

        print_performance();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_performance();
        return 1;
    }
}
