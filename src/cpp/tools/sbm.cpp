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
        OperatorCliArgs args;

        po::options_description desc("Sweep an index operator over n = 2..N and record alphabet growth");
        desc.add_options()
            ("help,h", "Show help message");
        add_operator_options(desc, args);

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << desc << "\n";
            std::cout << "\nExample usage:\n";
            std::cout << "  sbm --op digitsum_mod9 --N 100000 --H 10 --out OUT_DIGITSUM\n";
            std::cout << "  sbm --op ssnt_closure --N 20000 --t1 5 --t2 13 --t3 41 --t4 131\n";
            print_performance();
            return 0;
        }

        po::notify(vm);

        const OperatorConfig config = to_operator_config(args);

        std::cerr << "Running " << to_string(config.op) << " for N=" << config.N << ", H=" << config.H << "\n";
        OperatorRun run = run_operator(config, args.out_dir);
        std::cerr << "Distinct signatures: " << run.metrics.alpha_N << "\n";

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
