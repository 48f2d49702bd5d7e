#ifndef SBM_RUNS_RUN_DRIVER_HPP
#define SBM_RUNS_RUN_DRIVER_HPP

#include "../common.hpp"
#include "../config/run_config.hpp"
#include "../engine/alphabet.hpp"
#include "../engine/metrics.hpp"
#include <filesystem>
#include <vector>

namespace sbm {

/**
 * Complete runs: sweep -> results stream -> checkpoints -> metrics ->
 * profile -> manifest
 *
 * Results rows are written while the sweep advances. The artifacts are a
 * pure function of the configuration; running the same configuration twice
 * yields byte-identical files.
 */

struct RunArtifacts {
    std::filesystem::path out_dir;
    std::vector<std::filesystem::path> files;   // In manifest order
    std::filesystem::path manifest;
};

struct OperatorRun {
    RunArtifacts artifacts;
    AlphaSeries series;
    std::vector<Checkpoint> checkpoints;
    GrowthMetrics metrics;
};

struct StreamRun {
    RunArtifacts artifacts;
    AlphaSeries series;
    std::vector<Checkpoint> checkpoints;
    FractureMetrics metrics;
};

/**
 * Index-operator run into `out_dir` (created if missing, files overwritten).
 * Throws ConfigError before touching the filesystem if the configuration is invalid.
 * The old manifest is removed before the sweep starts, so a run that throws
 * part way never leaves a directory that looks complete.
 */
OperatorRun run_operator(const OperatorConfig& config, const std::filesystem::path& out_dir);

// Same run over `source` in place of the indices [2, N]
OperatorRun run_operator(const OperatorConfig& config, const SignatureSource& source,
                         const std::filesystem::path& out_dir);

/**
 * State-stream run into a fresh directory chosen by ensure_unique_outdir(out_dir).
 * Throws ConfigError before touching the filesystem if the configuration is invalid.
 */
StreamRun run_stream(const StreamConfig& config, const std::filesystem::path& out_dir);

} // namespace sbm

#endif // SBM_RUNS_RUN_DRIVER_HPP
