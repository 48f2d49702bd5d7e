#ifndef SBM_FORMATS_PROFILE_JSON_HPP
#define SBM_FORMATS_PROFILE_JSON_HPP

#include "../common.hpp"
#include "../config/run_config.hpp"
#include "../engine/metrics.hpp"
#include <boost/json.hpp>
#include <filesystem>
#include <iostream>

namespace sbm {

/**
 * Profile documents
 *
 * Floating point fields are stored already rounded to 12 decimals;
 * key order is insertion order.
 */
boost::json::object operator_profile(const OperatorConfig& config, const GrowthMetrics& metrics);
boost::json::object stream_profile(const StreamConfig& config, const FractureMetrics& metrics);

/**
 * Two-space indented JSON, one member per line, shortest round-trip doubles
 */
void pretty_print(std::ostream& os, const boost::json::value& jv, size_t indent = 0);

// Pretty-printed document plus trailing newline
void write_profile_json(const std::filesystem::path& path, const boost::json::object& profile);

} // namespace sbm

#endif // SBM_FORMATS_PROFILE_JSON_HPP
