#include "profile_json.hpp"
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace sbm {

namespace json = boost::json;

namespace {
    json::object growth_fields(const GrowthMetrics& m) {
        json::object profile;
        profile["alpha_N"] = static_cast<uint64_t>(m.alpha_N);
        profile["E_N"] = round_fixed12(m.E_N);
        profile["Hs_N"] = round_fixed12(m.Hs_N);
        profile["C_N"] = round_fixed12(m.C_N);
        profile["emergence_count"] = static_cast<uint64_t>(m.emergence_count);
        profile["last_emergence_n"] = static_cast<uint64_t>(m.last_emergence_n);
        profile["mean_gap"] = round_fixed12(m.mean_gap);
        profile["var_gap"] = round_fixed12(m.var_gap);
        return profile;
    }
}

json::object operator_profile(const OperatorConfig& config, const GrowthMetrics& metrics) {
    json::object doc;
    doc["sbm_version"] = SBM_PROFILE_VERSION;
    doc["op"] = to_string(config.op);
    doc["N"] = static_cast<uint64_t>(config.N);
    doc["H"] = static_cast<uint64_t>(config.H);
    doc["bands"] = json::object{
        {"t1", config.bands.t1},
        {"t2", config.bands.t2},
        {"t3", config.bands.t3},
        {"t4", config.bands.t4},
    };
    doc["profile"] = growth_fields(metrics);
    return doc;
}

json::object stream_profile(const StreamConfig& config, const FractureMetrics& metrics) {
    json::object doc;
    doc["sbm_ai_version"] = SBM_AI_PROFILE_VERSION;
    doc["N"] = static_cast<uint64_t>(config.N);
    doc["H"] = static_cast<uint64_t>(config.H);
    doc["M"] = config.M;
    doc["seed"] = config.seed;
    doc["shift_n"] = static_cast<uint64_t>(config.shift_n);
    doc["obs"] = to_string(config.obs);
    doc["pre_mode"] = to_string(config.pre_mode);
    doc["post_mode"] = to_string(config.post_mode);
    doc["params_pre"] = json::object{{"a", config.a1}, {"c", config.c1}};
    doc["params_post"] = json::object{{"a", config.a2}, {"c", config.c2}};

    json::object profile = growth_fields(metrics.growth);
    profile["alpha_before_shift"] = static_cast<uint64_t>(metrics.regime.alpha_before_shift);
    profile["alpha_at_shift"] = static_cast<uint64_t>(metrics.regime.alpha_at_shift);
    profile["alpha_after"] = static_cast<uint64_t>(metrics.regime.alpha_after);
    profile["max_stable_run"] = static_cast<uint64_t>(metrics.stability.max_stable_run);
    profile["max_spike"] = metrics.stability.max_spike;
    profile["spike_at_n"] = static_cast<uint64_t>(metrics.stability.spike_at_n);
    profile["fracture_candidate_count"] = static_cast<uint64_t>(metrics.stability.fracture_candidate_count);
    profile["fracture_first_at_n"] = static_cast<uint64_t>(metrics.stability.fracture_first_at_n);
    profile["long_stable_L"] = static_cast<uint64_t>(config.long_stable_L);
    doc["profile"] = std::move(profile);
    return doc;
}

void pretty_print(std::ostream& os, const json::value& jv, size_t indent) {
    const std::string pad(indent, ' ');
    const std::string inner(indent + 2, ' ');

    switch (jv.kind()) {
        case json::kind::object: {
            const auto& obj = jv.get_object();
            if (obj.empty()) {
                os << "{}";
                break;
            }
            os << "{\n";
            bool first = true;
            for (const auto& member : obj) {
                if (!first) {
                    os << ",\n";
                }
                first = false;
                os << inner << json::serialize(json::string(member.key())) << ": ";
                pretty_print(os, member.value(), indent + 2);
            }
            os << "\n" << pad << "}";
            break;
        }
        case json::kind::array: {
            const auto& arr = jv.get_array();
            if (arr.empty()) {
                os << "[]";
                break;
            }
            os << "[\n";
            bool first = true;
            for (const auto& element : arr) {
                if (!first) {
                    os << ",\n";
                }
                first = false;
                os << inner;
                pretty_print(os, element, indent + 2);
            }
            os << "\n" << pad << "]";
            break;
        }
        case json::kind::string:
            os << json::serialize(jv.get_string());
            break;
        case json::kind::uint64:
            os << jv.get_uint64();
            break;
        case json::kind::int64:
            os << jv.get_int64();
            break;
        case json::kind::double_:
            os << format_shortest(jv.get_double());
            break;
        case json::kind::bool_:
            os << (jv.get_bool() ? "true" : "false");
            break;
        case json::kind::null:
            os << "null";
            break;
    }
}

void write_profile_json(const std::filesystem::path& path, const json::object& profile) {
    std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }
    pretty_print(ofs, profile);
    ofs << "\n";
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed to write file: " + path.string());
    }
}

} // namespace sbm
