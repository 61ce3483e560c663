#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace satr {

// ---------- Data model ----------
enum class Endian { Little, Big };

struct Field {
    std::string name;
    std::string type;                  // "u16", "f32", "bytes", ...
    uint32_t offset = 0;               // relative to subsystem start
    std::optional<int64_t> byte_length; // only for "bytes"
    std::optional<std::string> calibration_expression;
    std::optional<std::string> calibration_function;
    std::optional<std::string> units;
    std::optional<int> round_digits;
};

struct Subsystem {
    std::string name;
    uint32_t offset = 0;               // relative to frame start
    std::vector<Field> fields;
};

// Identity is (name, offset); the field list is content.
inline bool operator==(const Subsystem& a, const Subsystem& b) {
    return a.name == b.name && a.offset == b.offset;
}
inline bool operator!=(const Subsystem& a, const Subsystem& b) { return !(a == b); }

struct Schema {
    uint32_t frame_size = 0;
    Endian default_endian = Endian::Little;
    bool include_frame_index = false;
    bool read_in_memory = false;
    std::optional<std::string> sort_by;
    std::vector<Subsystem> subsystems;
};

// "<subsystem>.<field>"
std::string column_key(const Subsystem& sub, const Field& field);

// Output columns in row order: frame_index (if enabled), then every field
// key. A key reused across subsystems appears once, at its first position.
std::vector<std::string> schema_columns(const Schema& schema);

// ---------- XML loading ----------
bool load_schema_file(const std::string& path, Schema& out, std::string* err = nullptr);
bool load_schema_string(const std::string& xml, Schema& out, std::string* err = nullptr);

// One line per field on os, for --verbose runs.
void dump_schema(const Schema& schema, std::ostream& os);

} // namespace satr
