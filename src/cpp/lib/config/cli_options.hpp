#ifndef SBM_CONFIG_CLI_OPTIONS_HPP
#define SBM_CONFIG_CLI_OPTIONS_HPP

#include "run_config.hpp"
#include <boost/program_options.hpp>
#include <filesystem>
#include <string>

namespace sbm {

/**
 * Command-line options of the run tools
 *
 * Sizes are parsed as signed integers so that negative text reaches the
 * range checks instead of wrapping around. The to_*_config functions throw
 * ConfigError for any out-of-range value.
 */

struct OperatorCliArgs {
    std::string op;
    int64_t N = 0;
    int64_t H = 10;
    int64_t t1 = 3;
    int64_t t2 = 11;
    int64_t t3 = 31;
    int64_t t4 = 101;
    std::filesystem::path out_dir;
};

struct StreamCliArgs {
    int64_t N = 0;
    int64_t H = 18;
    int64_t M = 4294967296LL;
    int64_t seed = 123456789;
    int64_t a1 = 1664525;
    int64_t c1 = 1013904223;
    int64_t a2 = 22695477;
    int64_t c2 = 1;
    int64_t shift_n = -1;   // Negative means N / 2
    int64_t long_stable_L = 2000;
    std::string pre_mode;
    std::string post_mode;
    std::string obs;
    std::filesystem::path out_dir;
};

void add_operator_options(boost::program_options::options_description& desc, OperatorCliArgs& args);
void add_stream_options(boost::program_options::options_description& desc, StreamCliArgs& args);

OperatorConfig to_operator_config(const OperatorCliArgs& args);
StreamConfig to_stream_config(const StreamCliArgs& args);

} // namespace sbm

#endif // SBM_CONFIG_CLI_OPTIONS_HPP
