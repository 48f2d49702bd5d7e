#include "growth_curve.hpp"
#include "csv.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <map>
#include <set>
#include <stdexcept>

namespace sbm {

namespace fs = std::filesystem;

namespace {
    const std::vector<std::string> INDEX_NAMES = {
        "n", "t", "i", "step", "index", "sample_n", "row", "pos"
    };
    const std::vector<std::string> SIGNATURE_NAMES = {
        "signature", "sig", "code", "state", "symbol", "sigma", "token"
    };

    std::string trim(const std::string& s) {
        size_t begin = s.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            return "";
        }
        size_t end = s.find_last_not_of(" \t\r\n");
        return s.substr(begin, end - begin + 1);
    }

    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    bool is_one_of(const std::string& s, const std::vector<std::string>& names) {
        return std::find(names.begin(), names.end(), s) != names.end();
    }

    // Integer value of a numeric field ("12", "12.0", "1e3"), truncated toward zero
    std::optional<int64_t> parse_index(const std::string& field) {
        if (field.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        double value = std::strtod(field.c_str(), &end);
        if (end == field.c_str() || *end != '\0' || !std::isfinite(value)) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }

    int locate_column(const std::vector<std::string>& fields,
                      const std::vector<std::string>& exact,
                      bool (*fallback)(const std::string&)) {
        for (size_t i = 0; i < fields.size(); ++i) {
            if (is_one_of(lower(fields[i]), exact)) {
                return static_cast<int>(i);
            }
        }
        for (size_t i = 0; i < fields.size(); ++i) {
            if (fallback(lower(fields[i]))) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    bool index_like(const std::string& lk) {
        return lk == "n" || contains(lk, "step") || contains(lk, "index") || contains(lk, "sample");
    }

    bool signature_like(const std::string& lk) {
        return contains(lk, "signature") || lk.rfind("sig", 0) == 0 || contains(lk, "sigma");
    }
}

ResultsCurve read_results_curve(std::istream& is, const std::string& source_name) {
    ResultsCurve curve;
    curve.source = source_name;

    std::string line;
    if (!std::getline(is, line) || trim(line).empty()) {
        throw std::runtime_error("Empty header in: " + source_name);
    }

    std::vector<std::string> fields = parse_csv_line(line);
    for (auto& f : fields) {
        f = trim(f);
    }

    const int idx_col = locate_column(fields, INDEX_NAMES, index_like);
    const int sig_col = locate_column(fields, SIGNATURE_NAMES, signature_like);
    if (idx_col < 0 || sig_col < 0) {
        std::string header;
        for (size_t i = 0; i < fields.size(); ++i) {
            header += (i > 0 ? ", " : "") + fields[i];
        }
        throw std::runtime_error("Could not locate index/signature columns in " + source_name +
                                 ". Header: [" + header + "]");
    }
    curve.index_column = fields[static_cast<size_t>(idx_col)];
    curve.signature_column = fields[static_cast<size_t>(sig_col)];

    std::set<std::string> seen;
    while (std::getline(is, line)) {
        if (trim(line).empty()) {
            continue;
        }
        ++curve.rows;
        std::vector<std::string> row = parse_csv_line(line);
        const std::string idx_raw = static_cast<size_t>(idx_col) < row.size() ? trim(row[static_cast<size_t>(idx_col)]) : "";
        const std::string sig_raw = static_cast<size_t>(sig_col) < row.size() ? trim(row[static_cast<size_t>(sig_col)]) : "";

        std::optional<int64_t> n = parse_index(idx_raw);
        if (!sig_raw.empty()) {
            seen.insert(sig_raw);
        }
        curve.alpha.ns.push_back(n ? *n : static_cast<int64_t>(curve.rows));
        curve.alpha.values.push_back(static_cast<int64_t>(seen.size()));
    }

    curve.alpha_final = curve.alpha.values.empty() ? 0 : curve.alpha.values.back();
    return curve;
}

ResultsCurve read_results_curve(const fs::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }
    return read_results_curve(ifs, path.string());
}

CurveSeries emergence_points(const CurveSeries& series) {
    CurveSeries out;
    out.label = series.label;
    if (series.ns.empty()) {
        return out;
    }
    out.ns.push_back(series.ns[0]);
    out.values.push_back(series.values[0]);
    int64_t last = series.values[0];
    for (size_t i = 1; i < series.ns.size(); ++i) {
        if (series.values[i] != last) {
            out.ns.push_back(series.ns[i]);
            out.values.push_back(series.values[i]);
            last = series.values[i];
        }
    }
    return out;
}

CurveSeries delta_series(const CurveSeries& series) {
    CurveSeries out;
    out.label = series.label;
    if (series.ns.empty()) {
        return out;
    }
    int64_t last = series.values[0];
    for (size_t i = 1; i < series.ns.size(); ++i) {
        int64_t d = series.values[i] - last;
        if (d != 0) {
            out.ns.push_back(series.ns[i]);
            out.values.push_back(d);
        }
        last = series.values[i];
    }
    return out;
}

CurveSeries cap_by_n(const CurveSeries& series, std::optional<int64_t> xcap) {
    if (!xcap) {
        return series;
    }
    CurveSeries out;
    out.label = series.label;
    for (size_t i = 0; i < series.ns.size(); ++i) {
        if (series.ns[i] > *xcap) {
            break;
        }
        out.ns.push_back(series.ns[i]);
        out.values.push_back(series.values[i]);
    }
    return out;
}

CurveDiff diff_series(const CurveSeries& primary, const CurveSeries& replay,
                      std::optional<int64_t> xcap) {
    std::map<int64_t, int64_t> by_n;
    for (size_t i = 0; i < primary.ns.size(); ++i) {
        by_n[primary.ns[i]] = primary.values[i];
    }

    CurveDiff result;
    result.diff.label = "diff";
    for (size_t i = 0; i < replay.ns.size(); ++i) {
        const int64_t n = replay.ns[i];
        if (xcap && n > *xcap) {
            break;
        }
        auto it = by_n.find(n);
        if (it == by_n.end()) {
            continue;
        }
        const int64_t d = it->second - replay.values[i];
        result.diff.ns.push_back(n);
        result.diff.values.push_back(d);
        result.max_abs_diff = std::max(result.max_abs_diff, d < 0 ? -d : d);
    }
    return result;
}

std::vector<fs::path> find_results_files(const fs::path& root) {
    std::vector<fs::path> files;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file() && lower(entry.path().filename().string()) == "sbm_results.csv") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::string label_from_path(const fs::path& results_path, bool short_labels) {
    const fs::path normal = results_path.lexically_normal();
    const std::string bundle = normal.parent_path().filename().string();
    if (short_labels) {
        return bundle;
    }
    const fs::path grandparent = normal.parent_path().parent_path();
    if (grandparent.empty() || grandparent.filename().empty()) {
        return bundle;
    }
    return grandparent.filename().string() + "/" + bundle;
}

bool is_primary_replay_pair(const std::string& label_a, const std::string& label_b) {
    const std::string la = lower(label_a);
    const std::string lb = lower(label_b);
    return (contains(la, "primary") && contains(lb, "replay")) ||
           (contains(la, "replay") && contains(lb, "primary"));
}

void write_curve_csv(std::ostream& os, const std::vector<CurveSeries>& series) {
    CsvWriter csv(os);
    csv.write_row({"series", "n", "value"});
    for (const auto& s : series) {
        for (size_t i = 0; i < s.ns.size(); ++i) {
            csv.write_row({s.label, std::to_string(s.ns[i]), std::to_string(s.values[i])});
        }
    }
}

} // namespace sbm
