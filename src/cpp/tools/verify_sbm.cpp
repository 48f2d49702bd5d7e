#include "formats/bundle_verifier.hpp"
#include "common.hpp"
#include <boost/program_options.hpp>
#include <iostream>
#include <fstream>
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

    auto finish = [&print_performance](ErrorCode code) {
        print_performance();
        return static_cast<int>(code);
    };

    try {
        VerifierOptions options;
        std::filesystem::path report_path;

        po::options_description desc("Verify stream artifact bundles against their SHA-256 manifests");
        desc.add_options()
            ("help,h", "Show help message")
            ("outputs", po::value<std::filesystem::path>(&options.outputs_dir)->default_value("outputs"),
             "Directory holding the bundles (and optionally an operator registry)")
            ("use-registry", po::bool_switch(&options.use_registry),
             "Check the primary/replay folders named in OPERATOR_REGISTRY[_PHASEC].txt")
            ("phasec-only", po::bool_switch(&options.phasec_only),
             "With --use-registry, only check AI_FRACTURE operators")
            ("report", po::value<std::filesystem::path>(&report_path),
             "Also write the report to this file");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << desc << "\n";
            std::cout << "\nExit status: 0 pass, 1 fail, 2 outputs directory missing, 3 report write failure\n";
            return finish(ErrorCode::SUCCESS);
        }

        po::notify(vm);

        VerifierReport report = run_verifier(options);
        const std::string text = report.text();
        std::cout << text << "\n";

        if (!report.outputs_found) {
            return finish(ErrorCode::OUTPUTS_NOT_FOUND);
        }

        if (!report_path.empty()) {
            std::error_code ec;
            if (report_path.has_parent_path()) {
                std::filesystem::create_directories(report_path.parent_path(), ec);
            }
            std::ofstream ofs(report_path, std::ios::out | std::ios::binary);
            if (ec || !ofs.is_open() || !(ofs << text) || !ofs.flush()) {
                std::cout << "REPORT_WRITE_FAIL: " << report_path.string()
                          << (ec ? ": " + ec.message() : std::string()) << "\n";
                return finish(ErrorCode::REPORT_WRITE_FAILED);
            }
        }

        return finish(report.overall_ok ? ErrorCode::SUCCESS : ErrorCode::VERIFY_FAILED);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return finish(ErrorCode::VERIFY_FAILED);
    }
}
