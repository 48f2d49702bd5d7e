#ifndef SBM_FORMATS_GROWTH_CURVE_HPP
#define SBM_FORMATS_GROWTH_CURVE_HPP

#include "../common.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace sbm {

/**
 * Growth curves rebuilt from results tables
 *
 * alpha(n) is recomputed by counting distinct (non-empty) signature strings
 * seen up to each row, so any results CSV with an index column and a
 * signature column can be read.
 */

struct CurveSeries {
    std::string label;
    std::vector<int64_t> ns;
    std::vector<int64_t> values;
};

struct ResultsCurve {
    std::string source;
    std::string index_column;
    std::string signature_column;
    size_t rows = 0;
    int64_t alpha_final = 0;
    CurveSeries alpha;
};

// Throws std::runtime_error if the header is missing or the columns cannot be located
ResultsCurve read_results_curve(std::istream& is, const std::string& source_name);
ResultsCurve read_results_curve(const std::filesystem::path& path);

// First point plus every point where alpha changes
CurveSeries emergence_points(const CurveSeries& series);

// Nonzero first differences, starting after the first point
CurveSeries delta_series(const CurveSeries& series);

// Leading points with n <= xcap (the whole series without a cap)
CurveSeries cap_by_n(const CurveSeries& series, std::optional<int64_t> xcap);

struct CurveDiff {
    CurveSeries diff;       // primary - replay at every n present in both
    int64_t max_abs_diff = 0;
};

CurveDiff diff_series(const CurveSeries& primary, const CurveSeries& replay,
                      std::optional<int64_t> xcap);

// All files named sbm_results.csv (case-insensitive) under root, sorted
std::vector<std::filesystem::path> find_results_files(const std::filesystem::path& root);

// Bundle directory name, or "<parent>/<bundle>" for long labels
std::string label_from_path(const std::filesystem::path& results_path, bool short_labels);

bool is_primary_replay_pair(const std::string& label_a, const std::string& label_b);

// series,n,value rows (CRLF)
void write_curve_csv(std::ostream& os, const std::vector<CurveSeries>& series);

} // namespace sbm

#endif // SBM_FORMATS_GROWTH_CURVE_HPP
