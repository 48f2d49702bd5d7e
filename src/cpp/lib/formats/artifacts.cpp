#include "artifacts.hpp"
#include <stdexcept>

namespace sbm {

namespace {
    std::ofstream open_output(const std::filesystem::path& path) {
        // Binary mode: line endings are written exactly as given
        std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw std::runtime_error("Failed to open file for writing: " + path.string());
        }
        return ofs;
    }

    void finish(std::ofstream& ofs, const std::filesystem::path& path) {
        ofs.flush();
        if (!ofs) {
            throw std::runtime_error("Failed to write file: " + path.string());
        }
        ofs.close();
    }

    template <typename T>
    std::string str(T value) {
        return std::to_string(value);
    }
}

ResultsCsvWriter::ResultsCsvWriter(const std::filesystem::path& path)
    : path_(path), stream_(open_output(path)), csv_(stream_) {
    csv_.write_row({"n", "signature", "new_signature_at_n", "first_seen_n"});
}

void ResultsCsvWriter::write(const ResultRecord& record) {
    csv_.write_row({
        str(record.index),
        record.signature.to_string(),
        record.is_new ? "1" : "0",
        str(record.first_seen),
    });
}

void ResultsCsvWriter::close() {
    if (stream_.is_open()) {
        finish(stream_, path_);
    }
}

void write_checkpoints_csv(const std::filesystem::path& path,
                           const std::vector<Checkpoint>& checkpoints) {
    std::ofstream ofs = open_output(path);
    CsvWriter csv(ofs);
    csv.write_row({"n", "distinct_signatures_alpha(n)"});
    for (const auto& cp : checkpoints) {
        csv.write_row({str(cp.first), str(cp.second)});
    }
    finish(ofs, path);
}

std::vector<MetricRow> operator_metric_rows(const OperatorConfig& config,
                                            const GrowthMetrics& m) {
    return {
        {"op", to_string(config.op)},
        {"N", str(config.N)},
        {"H", str(config.H)},
        {"alpha_N", str(m.alpha_N)},
        {"E_N", format_fixed12(m.E_N)},
        {"Hs_N", format_fixed12(m.Hs_N)},
        {"C_N", format_fixed12(m.C_N)},
        {"emergence_count", str(m.emergence_count)},
        {"last_emergence_n", str(m.last_emergence_n)},
        {"mean_gap", format_fixed12(m.mean_gap)},
        {"var_gap", format_fixed12(m.var_gap)},
    };
}

std::vector<MetricRow> stream_metric_rows(const StreamConfig& config,
                                          const FractureMetrics& m) {
    return {
        {"N", str(config.N)},
        {"H", str(config.H)},
        {"M", str(config.M)},
        {"seed", str(config.seed)},
        {"shift_n", str(config.shift_n)},
        {"obs", to_string(config.obs)},
        {"pre_mode", to_string(config.pre_mode)},
        {"post_mode", to_string(config.post_mode)},
        {"a1", str(config.a1)},
        {"c1", str(config.c1)},
        {"a2", str(config.a2)},
        {"c2", str(config.c2)},
        {"alpha_N", str(m.growth.alpha_N)},
        {"E_N", format_fixed12(m.growth.E_N)},
        {"Hs_N", format_fixed12(m.growth.Hs_N)},
        {"C_N", format_fixed12(m.growth.C_N)},
        {"emergence_count", str(m.growth.emergence_count)},
        {"last_emergence_n", str(m.growth.last_emergence_n)},
        {"mean_gap", format_fixed12(m.growth.mean_gap)},
        {"var_gap", format_fixed12(m.growth.var_gap)},
        {"alpha_before_shift", str(m.regime.alpha_before_shift)},
        {"alpha_at_shift", str(m.regime.alpha_at_shift)},
        {"alpha_after", str(m.regime.alpha_after)},
        {"max_stable_run", str(m.stability.max_stable_run)},
        {"max_spike", str(m.stability.max_spike)},
        {"spike_at_n", str(m.stability.spike_at_n)},
        {"fracture_candidate_count", str(m.stability.fracture_candidate_count)},
        {"fracture_first_at_n", str(m.stability.fracture_first_at_n)},
        {"long_stable_L", str(config.long_stable_L)},
    };
}

void write_metrics_csv(const std::filesystem::path& path, const std::vector<MetricRow>& rows) {
    std::ofstream ofs = open_output(path);
    CsvWriter csv(ofs);
    csv.write_row({"metric", "value"});
    for (const auto& row : rows) {
        csv.write_row({row.first, row.second});
    }
    finish(ofs, path);
}

} // namespace sbm
