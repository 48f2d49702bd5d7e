#include "cli_options.hpp"
#include <limits>

namespace sbm {

namespace po = boost::program_options;

namespace {
    std::string join_names(const std::vector<std::string>& names) {
        std::string out;
        for (size_t i = 0; i < names.size(); ++i) {
            out += (i > 0 ? ", " : "") + names[i];
        }
        return out;
    }

    uint64_t positive(int64_t value, const char* name) {
        if (value <= 0) {
            throw ConfigError(std::string(name) + " must be greater than 0 (got " +
                              std::to_string(value) + ")");
        }
        return static_cast<uint64_t>(value);
    }

    uint64_t non_negative(int64_t value, const char* name) {
        if (value < 0) {
            throw ConfigError(std::string(name) + " must not be negative (got " +
                              std::to_string(value) + ")");
        }
        return static_cast<uint64_t>(value);
    }

    Length width(int64_t value) {
        const uint64_t H = positive(value, "H");
        if (H > std::numeric_limits<Length>::max()) {
            throw ConfigError("H is too large (got " + std::to_string(value) + ")");
        }
        return static_cast<Length>(H);
    }
}

void add_operator_options(po::options_description& desc, OperatorCliArgs& args) {
    desc.add_options()
        ("op", po::value<std::string>(&args.op)->required(),
         ("Operator (" + join_names(operator_kind_names()) + ")").c_str())
        ("N", po::value<int64_t>(&args.N)->required(), "Last index of the sweep")
        ("H", po::value<int64_t>(&args.H)->default_value(args.H), "Signature width")
        ("out", po::value<std::filesystem::path>(&args.out_dir)->default_value("OUT_SBM"),
         "Output directory (files are overwritten)")
        ("t1", po::value<int64_t>(&args.t1)->default_value(args.t1), "Band threshold A")
        ("t2", po::value<int64_t>(&args.t2)->default_value(args.t2), "Band threshold B")
        ("t3", po::value<int64_t>(&args.t3)->default_value(args.t3), "Band threshold C")
        ("t4", po::value<int64_t>(&args.t4)->default_value(args.t4), "Band threshold D");
}

void add_stream_options(po::options_description& desc, StreamCliArgs& args) {
    desc.add_options()
        ("N", po::value<int64_t>(&args.N)->required(), "Number of windows")
        ("H", po::value<int64_t>(&args.H)->default_value(args.H), "Window width")
        ("M", po::value<int64_t>(&args.M)->default_value(args.M), "State modulus")
        ("seed", po::value<int64_t>(&args.seed)->default_value(args.seed), "Initial state")
        ("a1", po::value<int64_t>(&args.a1)->default_value(args.a1), "Pre-shift multiplier")
        ("c1", po::value<int64_t>(&args.c1)->default_value(args.c1), "Pre-shift increment")
        ("a2", po::value<int64_t>(&args.a2)->default_value(args.a2), "Post-shift multiplier")
        ("c2", po::value<int64_t>(&args.c2)->default_value(args.c2), "Post-shift increment")
        ("shift-n", po::value<int64_t>(&args.shift_n)->default_value(args.shift_n),
         "First step of the post regime (negative means N/2)")
        ("long-stable-L", po::value<int64_t>(&args.long_stable_L)->default_value(args.long_stable_L),
         "Stable-run length that qualifies a fracture")
        ("pre-mode", po::value<std::string>(&args.pre_mode)->default_value("lcg"),
         ("Pre-shift transition (" + join_names(transition_mode_names()) + ")").c_str())
        ("post-mode", po::value<std::string>(&args.post_mode)->default_value("lcg"),
         ("Post-shift transition (" + join_names(transition_mode_names()) + ")").c_str())
        ("obs", po::value<std::string>(&args.obs)->default_value("xor_parity"),
         ("Observation (" + join_names(observation_mode_names()) + ")").c_str())
        ("out", po::value<std::filesystem::path>(&args.out_dir)->default_value("OUT_SBM_AI"),
         "Output directory (a fresh _R<k> sibling is used if it is not empty)");
}

OperatorConfig to_operator_config(const OperatorCliArgs& args) {
    OperatorConfig config;
    config.op = parse_operator_kind(args.op);
    config.N = positive(args.N, "N");
    config.H = width(args.H);
    config.bands.t1 = non_negative(args.t1, "t1");
    config.bands.t2 = non_negative(args.t2, "t2");
    config.bands.t3 = non_negative(args.t3, "t3");
    config.bands.t4 = non_negative(args.t4, "t4");
    config.validate();
    return config;
}

StreamConfig to_stream_config(const StreamCliArgs& args) {
    StreamConfig config;
    config.N = positive(args.N, "N");
    config.H = width(args.H);
    config.M = positive(args.M, "M");
    config.seed = args.seed;
    config.a1 = args.a1;
    config.c1 = args.c1;
    config.a2 = args.a2;
    config.c2 = args.c2;
    config.shift_n = resolve_shift_n(args.shift_n, config.N);
    config.long_stable_L = positive(args.long_stable_L, "long_stable_L");
    config.pre_mode = parse_transition_mode(args.pre_mode);
    config.post_mode = parse_transition_mode(args.post_mode);
    config.obs = parse_observation_mode(args.obs);
    config.validate();
    return config;
}

} // namespace sbm
