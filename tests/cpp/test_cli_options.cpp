// Command-line option tests - parsing and range checks of the run tools
#include "config/cli_options.hpp"
#include <boost/program_options.hpp>
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

using namespace sbm;
namespace po = boost::program_options;

template <typename F>
bool throws_config_error(F&& f) {
    try {
        f();
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

// Same store/notify sequence as the tools
template <typename Args>
void parse_args(const std::vector<std::string>& tokens,
                void (*add_options)(po::options_description&, Args&),
                Args& args) {
    std::vector<const char*> argv;
    for (const auto& t : tokens) {
        argv.push_back(t.c_str());
    }
    po::options_description desc("test");
    add_options(desc, args);
    po::variables_map vm;
    po::store(po::parse_command_line(static_cast<int>(argv.size()), argv.data(), desc), vm);
    po::notify(vm);
}

OperatorConfig operator_config(const std::vector<std::string>& tokens) {
    OperatorCliArgs args;
    parse_args(tokens, add_operator_options, args);
    return to_operator_config(args);
}

StreamConfig stream_config(const std::vector<std::string>& tokens) {
    StreamCliArgs args;
    parse_args(tokens, add_stream_options, args);
    return to_stream_config(args);
}

void test_operator_defaults() {
    std::cout << "Test 1: Operator options and defaults... ";

    OperatorConfig config = operator_config({"sbm", "--op", "digitsum_mod9", "--N", "100"});
    assert(config.op == OperatorKind::DIGITSUM_MOD9);
    assert(config.N == 100);
    assert(config.H == 10);
    assert(config.bands.t1 == 3);
    assert(config.bands.t4 == 101);

    config = operator_config({"sbm", "--op", "ssnt_closure", "--N", "50", "--H", "4",
                              "--t1", "5", "--t2", "13", "--t3", "41", "--t4", "131"});
    assert(config.H == 4);
    assert(config.bands.t2 == 13);
    assert(config.bands.t3 == 41);

    std::cout << "PASSED\n";
}

void test_operator_rejects_negative_sizes() {
    std::cout << "Test 2: Negative operator sizes are configuration errors... ";

    assert(throws_config_error([] { operator_config({"sbm", "--op", "digitsum_mod9", "--N", "-5"}); }));
    assert(throws_config_error([] { operator_config({"sbm", "--op", "digitsum_mod9", "--N=-5"}); }));
    assert(throws_config_error([] { operator_config({"sbm", "--op", "digitsum_mod9", "--N", "0"}); }));
    assert(throws_config_error([] { operator_config({"sbm", "--op", "digitsum_mod9", "--N", "10", "--H=-1"}); }));
    assert(throws_config_error([] { operator_config({"sbm", "--op", "digitsum_mod9", "--N", "10", "--H", "4294967296"}); }));
    assert(throws_config_error([] { operator_config({"sbm", "--op", "ssnt_closure", "--N", "10", "--t1=-3"}); }));
    assert(throws_config_error([] { operator_config({"sbm", "--op", "bogus", "--N", "10"}); }));

    std::cout << "PASSED\n";
}

void test_stream_defaults() {
    std::cout << "Test 3: Stream options and defaults... ";

    StreamConfig config = stream_config({"sbm_ai", "--N", "1000"});
    assert(config.N == 1000);
    assert(config.H == 18);
    assert(config.M == 4294967296ULL);
    assert(config.seed == 123456789);
    assert(config.shift_n == 500);
    assert(config.long_stable_L == 2000);
    assert(config.pre_mode == TransitionMode::LCG);
    assert(config.obs == ObservationMode::XOR_PARITY);

    config = stream_config({"sbm_ai", "--N", "10", "--shift-n", "99", "--seed=-7",
                            "--pre-mode", "plateau", "--obs", "popcnt_parity"});
    assert(config.shift_n == 9);
    assert(config.seed == -7);
    assert(config.pre_mode == TransitionMode::PLATEAU);
    assert(config.obs == ObservationMode::POPCNT_PARITY);

    std::cout << "PASSED\n";
}

void test_stream_rejects_negative_sizes() {
    std::cout << "Test 4: Negative stream sizes are configuration errors... ";

    assert(throws_config_error([] { stream_config({"sbm_ai", "--N", "-5"}); }));
    assert(throws_config_error([] { stream_config({"sbm_ai", "--N", "10", "--H=-1"}); }));
    assert(throws_config_error([] { stream_config({"sbm_ai", "--N", "10", "--M=-1"}); }));
    assert(throws_config_error([] { stream_config({"sbm_ai", "--N", "10", "--M", "0"}); }));
    assert(throws_config_error([] { stream_config({"sbm_ai", "--N", "10", "--long-stable-L=-1"}); }));
    assert(throws_config_error([] { stream_config({"sbm_ai", "--N", "10", "--obs", "parity"}); }));

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "===========================================\n";
    std::cout << "Running Command-Line Option Tests\n";
    std::cout << "===========================================\n\n";

    try {
        test_operator_defaults();
        test_operator_rejects_negative_sizes();
        test_stream_defaults();
        test_stream_rejects_negative_sizes();

        std::cout << "\n===========================================\n";
        std::cout << "All command-line option tests PASSED!\n";
        std::cout << "===========================================\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n\nFATAL ERROR: " << e.what() << "\n";
        return 1;
    }
}
