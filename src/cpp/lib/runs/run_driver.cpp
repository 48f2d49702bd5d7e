#include "run_driver.hpp"
#include "../engine/index_operators.hpp"
#include "../engine/window_extractor.hpp"
#include "../formats/artifacts.hpp"
#include "../formats/manifest.hpp"
#include "../formats/profile_json.hpp"

namespace sbm {

namespace fs = std::filesystem;

namespace {
    struct ArtifactNames {
        const char* results;
        const char* checkpoints;
        const char* metrics;
        const char* profile;
        const char* manifest;
    };

    const ArtifactNames OPERATOR_NAMES = {
        SBM_RESULTS_CSV, SBM_ALPHABET_CSV, SBM_METRICS_CSV, SBM_PROFILE_JSON, SBM_MANIFEST
    };
    const ArtifactNames STREAM_NAMES = {
        SBM_AI_RESULTS_CSV, SBM_AI_ALPHABET_CSV, SBM_AI_METRICS_CSV, SBM_AI_PROFILE_JSON, SBM_AI_MANIFEST
    };

    RunArtifacts artifact_paths(const fs::path& dir, const ArtifactNames& names) {
        RunArtifacts a;
        a.out_dir = dir;
        a.files = {dir / names.results, dir / names.checkpoints, dir / names.metrics, dir / names.profile};
        a.manifest = dir / names.manifest;
        return a;
    }

    // Sweep the source, streaming every record into the results table
    AlphaSeries sweep_to_csv(const SignatureSource& source, const fs::path& results_path) {
        AlphabetTracker tracker;
        ResultsCsvWriter writer(results_path);
        run_sweep(source, tracker, [&writer](const ResultRecord& record) { writer.write(record); });
        writer.close();
        return tracker.series();
    }
}

OperatorRun run_operator(const OperatorConfig& config, const fs::path& out_dir) {
    config.validate();
    OperatorSignatureSource source(config);
    return run_operator(config, source, out_dir);
}

OperatorRun run_operator(const OperatorConfig& config, const SignatureSource& source, const fs::path& out_dir) {
    config.validate();
    fs::create_directories(out_dir);

    OperatorRun run;
    run.artifacts = artifact_paths(out_dir, OPERATOR_NAMES);
    const auto& files = run.artifacts.files;

    // A run that fails below must not leave the previous manifest behind
    fs::remove(run.artifacts.manifest);

    run.series = sweep_to_csv(source, files[0]);
    run.checkpoints = select_checkpoints(run.series, operator_checkpoint_candidates(config.N));
    write_checkpoints_csv(files[1], run.checkpoints);

    run.metrics = compute_growth_metrics(run.series, config.N);
    write_metrics_csv(files[2], operator_metric_rows(config, run.metrics));
    write_profile_json(files[3], operator_profile(config, run.metrics));

    write_manifest(files, run.artifacts.manifest);
    return run;
}

StreamRun run_stream(const StreamConfig& config, const fs::path& out_dir) {
    config.validate();
    StreamSignatureSource source(config);

    const fs::path dir = ensure_unique_outdir(out_dir);
    fs::create_directories(dir);

    StreamRun run;
    run.artifacts = artifact_paths(dir, STREAM_NAMES);
    const auto& files = run.artifacts.files;

    run.series = sweep_to_csv(source, files[0]);
    run.checkpoints = select_checkpoints(run.series,
                                         stream_checkpoint_candidates(config.N, config.shift_n));
    write_checkpoints_csv(files[1], run.checkpoints);

    run.metrics = compute_fracture_metrics(run.series, config);
    write_metrics_csv(files[2], stream_metric_rows(config, run.metrics));
    write_profile_json(files[3], stream_profile(config, run.metrics));

    write_manifest(files, run.artifacts.manifest);
    return run;
}

} // namespace sbm
