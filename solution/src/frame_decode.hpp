#pragma once
#include "calib_expr.hpp"
#include "plugin.hpp"
#include "schema.hpp"
#include "type_codec.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace satr {

// Ordered column -> value mapping. Setting an existing key replaces the value
// and keeps the key at its first position.
class Row {
public:
    using Cell = std::pair<std::string, Value>;

    void set(const std::string& key, Value v);
    const Value* find(const std::string& key) const;
    const Value& at(const std::string& key) const;   // throws std::out_of_range
    bool contains(const std::string& key) const { return find(key) != nullptr; }

    size_t size() const { return cells_.size(); }
    bool empty() const { return cells_.empty(); }
    std::vector<std::string> keys() const;

    std::vector<Cell>::const_iterator begin() const { return cells_.begin(); }
    std::vector<Cell>::const_iterator end() const { return cells_.end(); }

    bool operator==(const Row& o) const { return cells_ == o.cells_; }
    bool operator!=(const Row& o) const { return !(*this == o); }

private:
    std::vector<Cell> cells_;
};

// Decodes frames of one schema. Type tags and calibration expressions are
// resolved once here, so TypeError / ExpressionError for a bad schema surface
// from the constructor. Decoding itself never mutates the decoder, so one
// instance may be shared across threads.
class FrameDecoder {
public:
    FrameDecoder(const Schema& schema, const CalibrationPlugin& plugin);

    // len must equal schema.frame_size (FrameSizeError otherwise).
    Row decode(const uint8_t* frame, size_t len, uint64_t frame_index) const;
    Row decode(const Bytes& frame, uint64_t frame_index) const {
        return decode(frame.data(), frame.size(), frame_index);
    }

    // Whole buffer; len must be a multiple of frame_size. Rows in frame order.
    std::vector<Row> decode_all(const uint8_t* data, size_t len) const;
    std::vector<Row> decode_all(const Bytes& data) const {
        return decode_all(data.data(), data.size());
    }

    const Schema& schema() const { return schema_; }

private:
    struct FieldPlan {
        const Subsystem* subsystem;
        const Field* field;
        std::string key;
        FieldType type;
        size_t offset;               // absolute, from frame start
        size_t size;
        std::optional<CalibExpr> expr;
    };

    Value calibrate(const FieldPlan& fp, Value raw, uint64_t frame_index) const;

    const Schema& schema_;
    const CalibrationPlugin& plugin_;
    std::vector<FieldPlan> plan_;
};

// One-shot form of FrameDecoder::decode.
Row decode_frame(const uint8_t* frame, size_t len, const Schema& schema,
                 const CalibrationPlugin& plugin, uint64_t frame_index);

// One-shot form of FrameDecoder::decode_all.
std::vector<Row> read_frames(const Bytes& data, const Schema& schema, const CalibrationPlugin& plugin);

// Pulls frame_size chunks from a stream. A short trailing chunk is a
// FrameSizeError.
class FrameReader {
public:
    FrameReader(std::istream& is, uint32_t frame_size) : is_(is), frame_size_(frame_size) {}

    // Fills frame with the next frame; false at a clean end of stream.
    bool next(Bytes& frame);
    uint64_t frames_read() const { return count_; }

private:
    std::istream& is_;
    uint32_t frame_size_;
    uint64_t count_ = 0;
};

// Stable sort on one column. Missing column -> SchemaError; values that
// cannot be ordered against each other (number vs text) -> TypeError. NaN sorts last.
void sort_rows(std::vector<Row>& rows, const std::string& key);

} // namespace satr
