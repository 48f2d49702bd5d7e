#include "run_config.hpp"
#include <array>
#include <utility>

namespace sbm {

namespace {
    const std::array<std::pair<const char*, TransitionMode>, 3> TRANSITION_NAMES = {{
        {"lcg", TransitionMode::LCG},
        {"plateau", TransitionMode::PLATEAU},
        {"ramp", TransitionMode::RAMP},
    }};

    const std::array<std::pair<const char*, ObservationMode>, 4> OBSERVATION_NAMES = {{
        {"delta_parity", ObservationMode::DELTA_PARITY},
        {"xor_parity", ObservationMode::XOR_PARITY},
        {"x_lsb", ObservationMode::X_LSB},
        {"popcnt_parity", ObservationMode::POPCNT_PARITY},
    }};

    const std::array<std::pair<const char*, OperatorKind>, 5> OPERATOR_NAMES = {{
        {"ssnt_closure", OperatorKind::SSNT_CLOSURE},
        {"collatz_parity", OperatorKind::COLLATZ_PARITY},
        {"xorshift_parity", OperatorKind::XORSHIFT_PARITY},
        {"digitsum_mod9", OperatorKind::DIGITSUM_MOD9},
        {"sha1_parity", OperatorKind::SHA1_PARITY},
    }};

    template <typename Tag, size_t K>
    Tag lookup_tag(const std::array<std::pair<const char*, Tag>, K>& table,
                   const std::string& name,
                   const char* what) {
        for (const auto& entry : table) {
            if (name == entry.first) {
                return entry.second;
            }
        }
        throw ConfigError(std::string("Unknown ") + what + ": '" + name + "'");
    }

    template <typename Tag, size_t K>
    std::string lookup_name(const std::array<std::pair<const char*, Tag>, K>& table, Tag tag) {
        for (const auto& entry : table) {
            if (entry.second == tag) {
                return entry.first;
            }
        }
        return "unknown";
    }

    template <typename Tag, size_t K>
    std::vector<std::string> all_names(const std::array<std::pair<const char*, Tag>, K>& table) {
        std::vector<std::string> names;
        for (const auto& entry : table) {
            names.emplace_back(entry.first);
        }
        return names;
    }
}

TransitionMode parse_transition_mode(const std::string& name) {
    return lookup_tag(TRANSITION_NAMES, name, "transition mode");
}

ObservationMode parse_observation_mode(const std::string& name) {
    return lookup_tag(OBSERVATION_NAMES, name, "observation mode");
}

OperatorKind parse_operator_kind(const std::string& name) {
    return lookup_tag(OPERATOR_NAMES, name, "operator");
}

std::string to_string(TransitionMode mode) {
    return lookup_name(TRANSITION_NAMES, mode);
}

std::string to_string(ObservationMode mode) {
    return lookup_name(OBSERVATION_NAMES, mode);
}

std::string to_string(OperatorKind op) {
    return lookup_name(OPERATOR_NAMES, op);
}

std::vector<std::string> transition_mode_names() {
    return all_names(TRANSITION_NAMES);
}

std::vector<std::string> observation_mode_names() {
    return all_names(OBSERVATION_NAMES);
}

std::vector<std::string> operator_kind_names() {
    return all_names(OPERATOR_NAMES);
}

void StreamConfig::validate() const {
    if (N == 0) {
        throw ConfigError("N must be greater than 0");
    }
    if (H == 0) {
        throw ConfigError("H must be greater than 0");
    }
    if (M < 1) {
        throw ConfigError("Modulus M must be at least 1");
    }
    if (shift_n > N) {
        throw ConfigError("shift_n (" + std::to_string(shift_n) +
                          ") must lie in [0, N] with N = " + std::to_string(N));
    }
    if (long_stable_L == 0) {
        throw ConfigError("long_stable_L must be greater than 0");
    }
}

void OperatorConfig::validate() const {
    if (N == 0) {
        throw ConfigError("N must be greater than 0");
    }
    if (H == 0) {
        throw ConfigError("H must be greater than 0");
    }
    if (bands.t1 > bands.t2 || bands.t2 > bands.t3 || bands.t3 > bands.t4) {
        throw ConfigError("Band thresholds must be ascending (t1 <= t2 <= t3 <= t4)");
    }
}

Index resolve_shift_n(int64_t requested, Index N) {
    Index shift = requested < 0 ? N / 2 : static_cast<Index>(requested);
    if (N > 0 && shift > N - 1) {
        shift = N - 1;
    }
    return N == 0 ? 0 : shift;
}

} // namespace sbm
