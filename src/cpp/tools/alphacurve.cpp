#include "formats/growth_curve.hpp"
#include "common.hpp"
#include <boost/program_options.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace po = boost::program_options;
using namespace sbm;

namespace {
    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    // alpha_curve.csv -> alpha_curve_<mode>[_xcap<k>].csv; other names are kept
    std::string auto_outfile(const std::string& name, const std::string& mode, std::optional<int64_t> xcap) {
        if (lower(name) != "alpha_curve.csv") {
            return name;
        }
        std::string suffix = mode;
        if (xcap) {
            suffix += "_xcap" + std::to_string(*xcap);
        }
        return "alpha_curve_" + suffix + ".csv";
    }

    std::vector<std::string> split_selects(const std::string& select) {
        std::vector<std::string> out;
        std::istringstream iss(select);
        std::string token;
        while (std::getline(iss, token, ',')) {
            token.erase(0, token.find_first_not_of(" \t"));
            token.erase(token.find_last_not_of(" \t") + 1);
            if (!token.empty()) {
                out.push_back(lower(token));
            }
        }
        return out;
    }
}

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
        std::filesystem::path ref_root;
        std::string select;
        std::filesystem::path outdir;
        std::string outfile;
        std::string mode;
        std::optional<int64_t> xcap;
        bool collapse_identical;
        bool short_labels;

        po::options_description desc("Extract alpha(n) growth curves from sbm_results.csv files");
        desc.add_options()
            ("help,h", "Show help message")
            ("ref-root", po::value<std::filesystem::path>(&ref_root)->default_value("reference_outputs"),
             "Root folder searched for sbm_results.csv")
            ("select", po::value<std::string>(&select)->default_value(""),
             "Comma-separated substrings selecting bundles")
            ("outdir", po::value<std::filesystem::path>(&outdir)->default_value("curves"),
             "Output folder")
            ("outfile", po::value<std::string>(&outfile)->default_value("alpha_curve.csv"),
             "Output CSV filename (the default gains a mode/xcap suffix)")
            ("mode", po::value<std::string>(&mode)->default_value("step"),
             "step, line, emergence, delta or diff")
            ("xcap", po::value<int64_t>(), "Keep only points with n <= xcap")
            ("collapse-identical", po::value<bool>(&collapse_identical)->default_value(true),
             "Collapse an identical primary/replay pair into one series")
            ("short-labels", po::bool_switch(&short_labels), "Label series by bundle folder only");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << desc << "\n";
            std::cout << "\nExample usage:\n";
            std::cout << "  alphacurve --ref-root reference_outputs --select DIGITSUM --mode emergence\n";
            std::cout << "  alphacurve --mode diff --xcap 500\n";
            print_performance();
            return 0;
        }

        po::notify(vm);

        if (vm.count("xcap")) {
            xcap = vm["xcap"].as<int64_t>();
        }
        if (mode != "step" && mode != "line" && mode != "emergence" && mode != "delta" && mode != "diff") {
            std::cerr << "Error: Unknown mode: '" << mode << "'\n";
            print_performance();
            return 1;
        }
        if (!std::filesystem::is_directory(ref_root)) {
            throw std::runtime_error("Reference root not found: " + ref_root.string());
        }

        std::vector<std::filesystem::path> files = find_results_files(ref_root);
        if (files.empty()) {
            throw std::runtime_error("No sbm_results.csv found under: " + ref_root.string());
        }

        const std::vector<std::string> selects = split_selects(select);
        if (!selects.empty()) {
            std::vector<std::filesystem::path> kept;
            for (const auto& f : files) {
                const std::string lp = lower(f.string());
                if (std::any_of(selects.begin(), selects.end(),
                                [&lp](const std::string& s) { return lp.find(s) != std::string::npos; })) {
                    kept.push_back(f);
                }
            }
            if (kept.empty()) {
                throw std::runtime_error("No sbm_results.csv matched selects=" + select);
            }
            files = kept;
        }

        std::vector<CurveSeries> raw;
        std::vector<int64_t> finals;
        for (const auto& f : files) {
            ResultsCurve curve = read_results_curve(f);
            CurveSeries s = curve.alpha;
            if (mode == "emergence") {
                s = emergence_points(s);
            } else if (mode == "delta") {
                s = delta_series(s);
            }
            s = cap_by_n(s, xcap);
            s.label = label_from_path(f, short_labels);
            raw.push_back(s);
            finals.push_back(curve.alpha_final);
        }

        std::filesystem::create_directories(outdir);
        const std::filesystem::path out_path = outdir / auto_outfile(outfile, mode, xcap);
        std::ofstream ofs(out_path, std::ios::out | std::ios::binary);
        if (!ofs.is_open()) {
            throw std::runtime_error("Cannot open output file: " + out_path.string());
        }

        if (mode == "diff") {
            std::optional<size_t> prim;
            std::optional<size_t> rep;
            for (size_t i = 0; i < raw.size(); ++i) {
                const std::string l = lower(raw[i].label);
                if (l.find("primary") != std::string::npos) {
                    prim = i;
                }
                if (l.find("replay") != std::string::npos) {
                    rep = i;
                }
            }
            if (!prim || !rep) {
                if (raw.size() != 2) {
                    throw std::runtime_error(
                        "diff mode requires exactly one PRIMARY and one REPLAY series (or exactly two series)");
                }
                prim = 0;
                rep = 1;
            }

            CurveDiff diff = diff_series(raw[*prim], raw[*rep], xcap);
            write_curve_csv(ofs, {diff.diff});

            std::cout << "DONE\n";
            std::cout << "CSV: " << out_path.string() << "\n";
            std::cout << "MODE: " << mode << "\n";
            if (xcap) {
                std::cout << "XCAP: " << *xcap << "\n";
            }
            std::cout << "PAIR: " << raw[*prim].label << " vs " << raw[*rep].label << "\n";
            std::cout << "MAX_ABS_DIFF: " << diff.max_abs_diff << "\n";
            print_performance();
            return 0;
        }

        std::vector<CurveSeries> out;
        for (size_t i = 0; i < raw.size(); ++i) {
            CurveSeries s = raw[i];
            s.label += " (alpha_final=" + std::to_string(finals[i]) + ")";
            out.push_back(s);
        }

        if (collapse_identical && out.size() >= 2 && is_primary_replay_pair(out[0].label, out[1].label) &&
            out[0].values == out[1].values) {
            CurveSeries merged = out[0];
            size_t pos = merged.label.find(" (alpha_final=");
            merged.label.replace(pos, 1, "(replay_identical) ");
            out = {merged};
        }

        write_curve_csv(ofs, out);

        std::cout << "DONE\n";
        std::cout << "CSV: " << out_path.string() << "\n";
        std::cout << "MODE: " << mode << "\n";
        if (xcap) {
            std::cout << "XCAP: " << *xcap << "\n";
        }
        std::cout << "SERIES:\n";
        for (const auto& s : out) {
            std::cout << " - " << s.label << "\n";
        }

        print_performance();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_performance();
        return 1;
    }
}
