#include "csv_export.hpp"

namespace satr {

std::string csv_escape(const std::string& cell, char delimiter) {
    if (cell.find_first_of(std::string(1, delimiter) + "\"\r\n") == std::string::npos) {
        return cell;
    }
    std::string out = "\"";
    for (char c : cell) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

static void write_line(const std::vector<std::string>& cells, std::ostream& os, char delimiter) {
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i) os << delimiter;
        os << csv_escape(cells[i], delimiter);
    }
    os << "\n";
}

static void write_row(const Row& row, const std::vector<std::string>& header,
                      std::ostream& os, char delimiter) {
    std::vector<std::string> cells;
    cells.reserve(header.size());
    for (const auto& col : header) {
        const Value* v = row.find(col);
        cells.push_back(v ? format_value(*v) : std::string());
    }
    write_line(cells, os, delimiter);
}

size_t write_csv(const std::vector<Row>& rows, std::ostream& os, char delimiter) {
    if (rows.empty()) return 0;

    const std::vector<std::string> header = rows.front().keys();
    write_line(header, os, delimiter);
    for (const auto& r : rows) write_row(r, header, os, delimiter);
    return rows.size();
}

size_t write_csv_stream(const Schema& schema, std::istream& is, std::ostream& os,
                        const CalibrationPlugin& plugin, char delimiter) {
    const FrameDecoder decoder(schema, plugin);
    const std::vector<std::string> header = schema_columns(schema);
    write_line(header, os, delimiter);

    FrameReader reader(is, schema.frame_size);
    Bytes frame;
    uint64_t index = 0;
    while (reader.next(frame)) {
        write_row(decoder.decode(frame, index), header, os, delimiter);
        ++index;
    }
    return static_cast<size_t>(index);
}

} // namespace satr
