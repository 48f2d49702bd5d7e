#include "csv.hpp"
#include <stdexcept>

namespace sbm {

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') {
            out += '"';
        }
        out += c;
    }
    out += '"';
    return out;
}

void CsvWriter::write_row(const std::vector<std::string>& fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            os_ << ',';
        }
        os_ << csv_escape(fields[i]);
    }
    os_ << CSV_LINE_END;
}

std::vector<std::string> parse_csv_line(const std::string& line) {
    std::string input = line;
    if (!input.empty() && input.back() == '\r') {
        input.pop_back();
    }

    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (size_t pos = 0; pos < input.size(); ++pos) {
        char c = input[pos];
        if (in_quotes) {
            if (c == '"') {
                if (pos + 1 < input.size() && input[pos + 1] == '"') {
                    current += '"';
                    ++pos;
                } else {
                    in_quotes = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }

    if (in_quotes) {
        throw std::runtime_error("Unterminated quoted field in CSV record: " + line);
    }
    fields.push_back(current);
    return fields;
}

} // namespace sbm
