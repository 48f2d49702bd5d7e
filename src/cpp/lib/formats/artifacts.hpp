#ifndef SBM_FORMATS_ARTIFACTS_HPP
#define SBM_FORMATS_ARTIFACTS_HPP

#include "../common.hpp"
#include "../config/run_config.hpp"
#include "../engine/alphabet.hpp"
#include "../engine/metrics.hpp"
#include "csv.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace sbm {

/**
 * CSV artifacts of a run
 *
 * results:     n,signature,new_signature_at_n,first_seen_n  (one row per index)
 * checkpoints: n,distinct_signatures_alpha(n)
 * metrics:     metric,value  (floats with 12 fixed decimals)
 */

using MetricRow = std::pair<std::string, std::string>;

/**
 * Streaming writer for the per-index results table
 */
class ResultsCsvWriter {
public:
    // Opens the file and writes the header; throws std::runtime_error on failure
    explicit ResultsCsvWriter(const std::filesystem::path& path);

    void write(const ResultRecord& record);

    // Flushes and closes; throws std::runtime_error if any write failed
    void close();

private:
    std::filesystem::path path_;
    std::ofstream stream_;
    CsvWriter csv_;
};

void write_checkpoints_csv(const std::filesystem::path& path,
                           const std::vector<Checkpoint>& checkpoints);

// Ordered metric rows of each run variant
std::vector<MetricRow> operator_metric_rows(const OperatorConfig& config,
                                            const GrowthMetrics& metrics);
std::vector<MetricRow> stream_metric_rows(const StreamConfig& config,
                                          const FractureMetrics& metrics);

void write_metrics_csv(const std::filesystem::path& path, const std::vector<MetricRow>& rows);

} // namespace sbm

#endif // SBM_FORMATS_ARTIFACTS_HPP
