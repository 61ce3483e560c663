#include "frame_decode.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace satr {

// ------------------ Row ------------------
void Row::set(const std::string& key, Value v) {
    for (auto& c : cells_) {
        if (c.first == key) {
            c.second = std::move(v);
            return;
        }
    }
    cells_.emplace_back(key, std::move(v));
}

const Value* Row::find(const std::string& key) const {
    for (const auto& c : cells_) {
        if (c.first == key) return &c.second;
    }
    return nullptr;
}

const Value& Row::at(const std::string& key) const {
    const Value* v = find(key);
    if (!v) throw std::out_of_range("row has no column '" + key + "'");
    return *v;
}

std::vector<std::string> Row::keys() const {
    std::vector<std::string> k;
    k.reserve(cells_.size());
    for (const auto& c : cells_) k.push_back(c.first);
    return k;
}

// ------------------ FrameDecoder ------------------
FrameDecoder::FrameDecoder(const Schema& schema, const CalibrationPlugin& plugin)
    : schema_(schema), plugin_(plugin) {
    for (const auto& sub : schema_.subsystems) {
        for (const auto& f : sub.fields) {
            FieldPlan fp{&sub, &f, column_key(sub, f), FieldType::U8, 0, 0, std::nullopt};
            try {
                fp.type = parse_field_type(f.type);
            } catch (const TypeError&) {
                throw TypeError("Unknown field type '" + f.type + "' for field '" + fp.key + "'.");
            }
            try {
                fp.size = size_of(fp.type, f.byte_length);
            } catch (const TypeError&) {
                throw TypeError("bytes type requires a positive 'bytes' attribute (field '" + fp.key + "')");
            }
            fp.offset = static_cast<size_t>(sub.offset) + f.offset;
            if (f.calibration_expression) {
                try {
                    fp.expr = CalibExpr::parse(*f.calibration_expression);
                } catch (const ExpressionError& e) {
                    throw ExpressionError(e.expression(), e.cause() + " (field '" + fp.key + "')");
                }
            }
            plan_.push_back(std::move(fp));
        }
    }
}

Value FrameDecoder::calibrate(const FieldPlan& fp, Value raw, uint64_t frame_index) const {
    const Field& f = *fp.field;
    if (fp.expr) {
        if (!is_numeric(raw)) {
            throw ExpressionError(fp.expr->text(), "bytes value cannot be converted to float (field '" +
                                  fp.key + "', frame " + std::to_string(frame_index) + ")");
        }
        try {
            return fp.expr->evaluate(to_double(raw));
        } catch (const ExpressionError& e) {
            throw ExpressionError(e.expression(), e.cause() + " (field '" + fp.key + "', frame " +
                                  std::to_string(frame_index) + ", raw=" + format_value(raw) + ")");
        }
    }
    if (f.calibration_function) {
        const std::string& fn = *f.calibration_function;
        if (!plugin_.has(fn)) {
            throw PluginError(fn, "Calibration function '" + fn + "' not found in plugin (field '" +
                              fp.key + "').");
        }
        return plugin_.call(fn, raw);
    }
    return raw;
}

Row FrameDecoder::decode(const uint8_t* frame, size_t len, uint64_t frame_index) const {
    if (len != schema_.frame_size) {
        throw FrameSizeError("[READ ERROR] Frame " + std::to_string(frame_index) + " has " +
                             std::to_string(len) + " bytes, expected " +
                             std::to_string(schema_.frame_size) + ".");
    }

    Row row;
    if (schema_.include_frame_index) row.set("frame_index", frame_index);

    for (const auto& fp : plan_) {
        if (fp.offset + fp.size > schema_.frame_size) {
            throw BoundsError(fp.subsystem->name, fp.field->name, fp.offset, fp.size, schema_.frame_size);
        }
        Value raw = decode_value(frame + fp.offset, fp.size, fp.type, schema_.default_endian);
        Value calibrated = calibrate(fp, std::move(raw), frame_index);

        if (fp.field->round_digits) {
            if (double* d = std::get_if<double>(&calibrated)) {
                *d = round_half_away(*d, *fp.field->round_digits);
            }
        }
        row.set(fp.key, std::move(calibrated));
    }
    return row;
}

std::vector<Row> FrameDecoder::decode_all(const uint8_t* data, size_t len) const {
    const size_t fs = schema_.frame_size;
    if (fs == 0) throw FrameSizeError("[FILE ERROR] Schema frame size is 0.");
    if (len % fs != 0) {
        throw FrameSizeError("[FILE ERROR] File size " + std::to_string(len) +
                             " is not a multiple of frame size " + std::to_string(fs) + ".");
    }
    const size_t count = len / fs;
    std::vector<Row> rows;
    rows.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        rows.push_back(decode(data + i * fs, fs, i));
    }
    return rows;
}

Row decode_frame(const uint8_t* frame, size_t len, const Schema& schema,
                 const CalibrationPlugin& plugin, uint64_t frame_index) {
    return FrameDecoder(schema, plugin).decode(frame, len, frame_index);
}

std::vector<Row> read_frames(const Bytes& data, const Schema& schema, const CalibrationPlugin& plugin) {
    return FrameDecoder(schema, plugin).decode_all(data);
}

// ------------------ FrameReader ------------------
bool FrameReader::next(Bytes& frame) {
    frame.resize(frame_size_);
    is_.read(reinterpret_cast<char*>(frame.data()), frame_size_);
    const std::streamsize got = is_.gcount();
    if (got == 0) return false;
    if (static_cast<size_t>(got) != frame_size_) {
        throw FrameSizeError("[READ ERROR] Partial frame encountered at end of file (" +
                             std::to_string(got) + " of " + std::to_string(frame_size_) + " bytes).");
    }
    ++count_;
    return true;
}

// ------------------ sorting ------------------
static bool is_integer(const Value& v) {
    return std::holds_alternative<int64_t>(v) || std::holds_alternative<uint64_t>(v);
}

// <0, 0, >0 like strcmp
static int compare_values(const Value& a, const Value& b) {
    if (is_integer(a) && is_integer(b)) {
        const bool an = std::holds_alternative<int64_t>(a) && std::get<int64_t>(a) < 0;
        const bool bn = std::holds_alternative<int64_t>(b) && std::get<int64_t>(b) < 0;
        if (an != bn) return an ? -1 : 1;
        if (an) {
            const int64_t x = std::get<int64_t>(a), y = std::get<int64_t>(b);
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        const uint64_t x = std::holds_alternative<int64_t>(a) ? static_cast<uint64_t>(std::get<int64_t>(a))
                                                              : std::get<uint64_t>(a);
        const uint64_t y = std::holds_alternative<int64_t>(b) ? static_cast<uint64_t>(std::get<int64_t>(b))
                                                              : std::get<uint64_t>(b);
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (is_numeric(a) && is_numeric(b)) {
        const double x = to_double(a), y = to_double(b);
        // NaN sorts after every number.
        if (std::isnan(x) || std::isnan(y)) return std::isnan(x) - std::isnan(y);
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.index() == b.index()) {
        if (const auto* s = std::get_if<std::string>(&a)) return s->compare(std::get<std::string>(b));
        const Bytes& x = std::get<Bytes>(a);
        const Bytes& y = std::get<Bytes>(b);
        if (std::lexicographical_compare(x.begin(), x.end(), y.begin(), y.end())) return -1;
        return x == y ? 0 : 1;
    }
    throw TypeError("sort values cannot be compared: '" + format_value(a) + "' and '" +
                    format_value(b) + "'");
}

void sort_rows(std::vector<Row>& rows, const std::string& key) {
    for (const auto& r : rows) {
        if (!r.contains(key)) {
            throw SchemaError("sort_by '" + key + "' is not a decoded column");
        }
    }
    std::stable_sort(rows.begin(), rows.end(), [&key](const Row& a, const Row& b) {
        return compare_values(*a.find(key), *b.find(key)) < 0;
    });
}

} // namespace satr
