#pragma once
#include "frame_decode.hpp"

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace satr {

// Quote a cell if it contains the delimiter, a quote or a line break.
std::string csv_escape(const std::string& cell, char delimiter);

// Header from the first row's keys, then one line per row.
// No rows -> nothing written. Returns the number of rows written.
size_t write_csv(const std::vector<Row>& rows, std::ostream& os, char delimiter = ',');

// Streaming mode: header from the schema columns, then frames are decoded and
// written one at a time. Returns the number of rows written.
size_t write_csv_stream(const Schema& schema, std::istream& is, std::ostream& os,
                        const CalibrationPlugin& plugin, char delimiter = ',');

} // namespace satr
