/* Text input for rank_objectives: one solution per line, objective values
separated by commas or whitespace. Blank lines are skipped and '#' starts a
comment. "nan" (any case) reads as a quiet NaN. */
#ifndef OBJECTIVE_READER_H
#define OBJECTIVE_READER_H

#include <cstddef>
#include <exception>
#include <istream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "frontrank/utils/moo/errors.h"

namespace frontrank {

inline bool parse_value(const std::string& token, double& out) {
    if (token == "nan" || token == "NaN" || token == "NAN") {
        out = std::numeric_limits<double>::quiet_NaN();
        return true;
    }
    try {
        std::size_t used = 0;
        out = std::stod(token, &used);
        return used == token.size();
    } catch (const std::exception&) {
        return false;
    }
}

inline bool parse_int(const std::string& text, int& out) {
    try {
        std::size_t used = 0;
        int v = std::stoi(text, &used);
        if (used != text.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// spdlog maps unknown names to off; only "off" itself may mean off
inline bool parse_log_level(const std::string& name, spdlog::level::level_enum& out) {
    spdlog::level::level_enum lvl = spdlog::level::from_str(name);
    if (lvl == spdlog::level::off && name != "off") return false;
    out = lvl;
    return true;
}

inline std::vector<std::vector<double>> read_objectives(std::istream& in) {
    std::vector<std::vector<double>> rows;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        for (char& c : line) {
            if (c == ',') c = ' ';
        }
        std::istringstream tokens(line);
        std::vector<double> row;
        std::string token;
        while (tokens >> token) {
            double v = 0.0;
            if (!parse_value(token, v)) {
                FRONTRANK_THROW(error_code::invalid_input,
                                "line " + std::to_string(line_no) + ": not a number: '" + token + "'");
            }
            row.push_back(v);
        }
        if (!row.empty()) rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace frontrank

#endif // OBJECTIVE_READER_H
