#include "type_codec.hpp"
#include "errors.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace satr {

// ------------------ helpers ------------------
static inline uint64_t mask_nbits(unsigned n) {
    if (n == 64) return ~0ULL;
    return (1ULL << n) - 1ULL;
}

// Assemble len (<= 8) bytes into an unsigned integer.
static uint64_t load_uint(const uint8_t* data, size_t len, Endian endian) {
    uint64_t result = 0;
    if (endian == Endian::Big) {
        for (size_t i = 0; i < len; ++i) result = (result << 8) | data[i];
    } else {
        for (size_t i = len; i > 0; --i) result = (result << 8) | data[i - 1];
    }
    return result;
}

static void store_uint(uint64_t v, size_t len, Endian endian, Bytes& out) {
    out.resize(len);
    for (size_t i = 0; i < len; ++i) {
        const uint8_t b = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
        if (endian == Endian::Big) {
            out[len - 1 - i] = b;
        } else {
            out[i] = b;
        }
    }
}

static int64_t sign_extend(uint64_t raw, unsigned bits) {
    if (bits < 64 && (raw & (1ULL << (bits - 1)))) {
        raw |= ~mask_nbits(bits);
    }
    return static_cast<int64_t>(raw);
}

// Fewest significant digits (15, 16 or 17) that read back as the same double.
static std::string shortest_double(double x) {
    char buf[32];
    for (int prec = 15; prec <= 17; ++prec) {
        std::snprintf(buf, sizeof(buf), "%.*g", prec, x);
        if (std::strtod(buf, nullptr) == x) break;
    }
    return buf;
}

static bool is_signed_int(FieldType t) {
    return t == FieldType::I8 || t == FieldType::I16 || t == FieldType::I32 || t == FieldType::I64;
}

// ------------------ type tags ------------------
FieldType parse_field_type(const std::string& tag) {
    if (tag == "u8") return FieldType::U8;
    if (tag == "i8") return FieldType::I8;
    if (tag == "u16") return FieldType::U16;
    if (tag == "i16") return FieldType::I16;
    if (tag == "u32") return FieldType::U32;
    if (tag == "i32") return FieldType::I32;
    if (tag == "u64") return FieldType::U64;
    if (tag == "i64") return FieldType::I64;
    if (tag == "f32" || tag == "float32") return FieldType::F32;
    if (tag == "f64" || tag == "float64") return FieldType::F64;
    if (tag == "bytes") return FieldType::RawBytes;
    throw TypeError("Unknown field type '" + tag + "'.");
}

const char* field_type_name(FieldType t) {
    switch (t) {
        case FieldType::U8: return "u8";
        case FieldType::I8: return "i8";
        case FieldType::U16: return "u16";
        case FieldType::I16: return "i16";
        case FieldType::U32: return "u32";
        case FieldType::I32: return "i32";
        case FieldType::U64: return "u64";
        case FieldType::I64: return "i64";
        case FieldType::F32: return "f32";
        case FieldType::F64: return "f64";
        case FieldType::RawBytes: return "bytes";
    }
    return "?";
}

size_t size_of(FieldType t, std::optional<int64_t> byte_length) {
    switch (t) {
        case FieldType::U8:
        case FieldType::I8: return 1;
        case FieldType::U16:
        case FieldType::I16: return 2;
        case FieldType::U32:
        case FieldType::I32:
        case FieldType::F32: return 4;
        case FieldType::U64:
        case FieldType::I64:
        case FieldType::F64: return 8;
        case FieldType::RawBytes:
            if (!byte_length || *byte_length <= 0) {
                throw TypeError("bytes type requires a positive 'bytes' attribute");
            }
            return static_cast<size_t>(*byte_length);
    }
    throw TypeError("Unhandled field type.");
}

size_t size_of(const std::string& tag, std::optional<int64_t> byte_length) {
    return size_of(parse_field_type(tag), byte_length);
}

// ------------------ decode / encode ------------------
Value decode_value(const uint8_t* data, size_t len, FieldType t, Endian endian) {
    if (t == FieldType::RawBytes) {
        return Bytes(data, data + len);
    }
    const size_t width = size_of(t);
    if (len != width) {
        throw TypeError(std::string("type '") + field_type_name(t) + "' needs " +
                        std::to_string(width) + " bytes, got " + std::to_string(len));
    }
    const uint64_t raw = load_uint(data, width, endian);

    if (t == FieldType::F32) {
        const uint32_t bits = static_cast<uint32_t>(raw);
        float f = 0.0f;
        std::memcpy(&f, &bits, sizeof(f));
        return static_cast<double>(f);
    }
    if (t == FieldType::F64) {
        double d = 0.0;
        std::memcpy(&d, &raw, sizeof(d));
        return d;
    }
    if (is_signed_int(t)) {
        return sign_extend(raw, static_cast<unsigned>(width * 8));
    }
    return raw;
}

Bytes encode_value(const Value& v, FieldType t, Endian endian) {
    Bytes out;
    if (t == FieldType::RawBytes) {
        const Bytes* b = std::get_if<Bytes>(&v);
        if (!b) throw TypeError("bytes type can only encode a byte sequence");
        return *b;
    }
    const size_t width = size_of(t);

    if (t == FieldType::F32) {
        const float f = static_cast<float>(to_double(v));
        uint32_t bits = 0;
        std::memcpy(&bits, &f, sizeof(bits));
        store_uint(bits, width, endian, out);
        return out;
    }
    if (t == FieldType::F64) {
        const double d = to_double(v);
        uint64_t bits = 0;
        std::memcpy(&bits, &d, sizeof(bits));
        store_uint(bits, width, endian, out);
        return out;
    }

    uint64_t bits = 0;
    if (const auto* i = std::get_if<int64_t>(&v)) {
        bits = static_cast<uint64_t>(*i);
    } else if (const auto* u = std::get_if<uint64_t>(&v)) {
        bits = *u;
    } else if (const auto* d = std::get_if<double>(&v)) {
        bits = static_cast<uint64_t>(static_cast<int64_t>(*d));
    } else {
        throw TypeError(std::string("cannot encode a non-numeric value as '") + field_type_name(t) + "'");
    }
    store_uint(bits & mask_nbits(static_cast<unsigned>(width * 8)), width, endian, out);
    return out;
}

// ------------------ value helpers ------------------
bool is_float(const Value& v) {
    return std::holds_alternative<double>(v);
}

bool is_numeric(const Value& v) {
    return std::holds_alternative<int64_t>(v) || std::holds_alternative<uint64_t>(v) ||
           std::holds_alternative<double>(v);
}

double to_double(const Value& v) {
    if (const auto* i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
    if (const auto* u = std::get_if<uint64_t>(&v)) return static_cast<double>(*u);
    if (const auto* d = std::get_if<double>(&v)) return *d;
    throw TypeError("value is not numeric");
}

std::string format_value(const Value& v) {
    std::ostringstream os;
    os << v;
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const Value& v) {
    std::visit([&os](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, double>) {
            os << shortest_double(x);
        } else if constexpr (std::is_same_v<T, Bytes>) {
            const auto flags = os.flags();
            const char fill = os.fill();
            os << "0x" << std::hex << std::uppercase << std::setfill('0');
            for (uint8_t b : x) os << std::setw(2) << static_cast<unsigned>(b);
            os.flags(flags);
            os.fill(fill);
        } else {
            os << x;
        }
    }, v);
    return os;
}

} // namespace satr
