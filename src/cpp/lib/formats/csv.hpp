#ifndef SBM_FORMATS_CSV_HPP
#define SBM_FORMATS_CSV_HPP

#include "../common.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace sbm {

/**
 * Minimal RFC-4180 CSV support
 *
 * Fields containing ',', '"', CR or LF are quoted with inner quotes doubled.
 * Rows end with CRLF.
 */
constexpr const char* CSV_LINE_END = "\r\n";

std::string csv_escape(const std::string& field);

class CsvWriter {
public:
    explicit CsvWriter(std::ostream& os) : os_(os) {}

    void write_row(const std::vector<std::string>& fields);

private:
    std::ostream& os_;
};

/**
 * Split one CSV record (no embedded line breaks) into fields.
 * A trailing CR is ignored. Throws std::runtime_error on an unterminated quote.
 */
std::vector<std::string> parse_csv_line(const std::string& line);

} // namespace sbm

#endif // SBM_FORMATS_CSV_HPP
