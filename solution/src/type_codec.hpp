#pragma once
#include "schema.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace satr {

using Bytes = std::vector<uint8_t>;

// A decoded or calibrated cell. Text only comes out of plugin functions.
using Value = std::variant<int64_t, uint64_t, double, Bytes, std::string>;

enum class FieldType { U8, I8, U16, I16, U32, I32, U64, I64, F32, F64, RawBytes };

// "u16" -> FieldType::U16 etc. Throws TypeError for an unknown tag.
FieldType parse_field_type(const std::string& tag);
const char* field_type_name(FieldType t);

// Width in bytes. RawBytes takes byte_length, which must be present and > 0.
size_t size_of(FieldType t, std::optional<int64_t> byte_length = std::nullopt);
size_t size_of(const std::string& tag, std::optional<int64_t> byte_length = std::nullopt);

// Decode exactly size_of(t) bytes (or len bytes for RawBytes) at data.
// Signed integers come back as int64_t, unsigned as uint64_t, floats as double.
Value decode_value(const uint8_t* data, size_t len, FieldType t, Endian endian);

// Inverse of decode_value. Integers are truncated to the type's width.
Bytes encode_value(const Value& v, FieldType t, Endian endian);

bool is_float(const Value& v);
bool is_numeric(const Value& v);
// Numeric value as double; throws TypeError for bytes and text.
double to_double(const Value& v);

// Human-readable cell text: floats use the fewest of 15, 16 or 17 significant
// digits that read back exactly, bytes are 0x.. uppercase hex.
std::string format_value(const Value& v);
std::ostream& operator<<(std::ostream& os, const Value& v);

} // namespace satr
