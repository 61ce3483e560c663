#include <catch2/catch.hpp>

#include "solution/src/errors.hpp"
#include "solution/src/frame_decode.hpp"

#include <cmath>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>

using namespace satr;
using Catch::Detail::Approx;

static const char* kVBatExpr = "raw*0.01873128+(-38.682956)";

static Field make_field(const std::string& name, const std::string& type, uint32_t offset) {
    Field f;
    f.name = name;
    f.type = type;
    f.offset = offset;
    return f;
}

// PCS subsystem at 1604 with vBatAverage (u16 @ 750, big endian, round 3).
static Schema pcs_schema(bool include_frame_index = false) {
    Field f = make_field("vBatAverage", "u16", 750);
    f.calibration_expression = std::string(kVBatExpr);
    f.units = std::string("V");
    f.round_digits = 3;

    Subsystem pcs;
    pcs.name = "PCS";
    pcs.offset = 1604;
    pcs.fields.push_back(f);

    Schema s;
    s.frame_size = 4000;
    s.default_endian = Endian::Big;
    s.include_frame_index = include_frame_index;
    s.read_in_memory = true;
    s.subsystems.push_back(pcs);
    return s;
}

static void put(Bytes& buf, size_t pos, const Value& v, FieldType t, Endian e) {
    const Bytes enc = encode_value(v, t, e);
    std::memcpy(buf.data() + pos, enc.data(), enc.size());
}

TEST_CASE("decode_all: two PCS frames in frame order") {
    const Schema schema = pcs_schema();
    const CalibrationPlugin plugin;

    Bytes data(8000, 0);
    put(data, 1604 + 750, uint64_t{1000}, FieldType::U16, Endian::Big);
    put(data, 4000 + 1604 + 750, uint64_t{3026}, FieldType::U16, Endian::Big);
    REQUIRE(data[2354] == 0x03);
    REQUIRE(data[2355] == 0xE8);

    const std::vector<Row> rows = read_frames(data, schema, plugin);
    REQUIRE(rows.size() == 2);

    REQUIRE(rows[0].size() == 1);
    REQUIRE(rows[0].contains("PCS.vBatAverage"));
    const Value& v0 = rows[0].at("PCS.vBatAverage");
    REQUIRE(std::holds_alternative<double>(v0));
    CHECK(std::get<double>(v0) == Approx(-19.952));

    const Value& v1 = rows[1].at("PCS.vBatAverage");
    REQUIRE(std::holds_alternative<double>(v1));
    CHECK(std::get<double>(v1) == Approx(17.998));
}

TEST_CASE("decode: include_frame_index prepends the caller's index") {
    const Schema schema = pcs_schema(true);
    const CalibrationPlugin plugin;
    const FrameDecoder dec(schema, plugin);

    const std::vector<Row> rows = dec.decode_all(Bytes(3 * 4000, 0));
    REQUIRE(rows.size() == 3);
    for (size_t i = 0; i < rows.size(); ++i) {
        const auto keys = rows[i].keys();
        REQUIRE(keys.size() == 2);
        CHECK(keys[0] == "frame_index");
        CHECK(keys[1] == "PCS.vBatAverage");
        CHECK(std::get<uint64_t>(rows[i].at("frame_index")) == i);
    }

    const Row r = dec.decode(Bytes(4000, 0), 41);
    CHECK(std::get<uint64_t>(r.at("frame_index")) == 41);
}

TEST_CASE("decode: same input gives the same row") {
    Schema schema = pcs_schema(true);
    Field raw = make_field("counter", "i32", 0);
    schema.subsystems[0].fields.push_back(raw);
    const CalibrationPlugin plugin;
    const FrameDecoder dec(schema, plugin);

    Bytes frame(4000, 0);
    for (size_t i = 0; i < frame.size(); ++i) frame[i] = static_cast<uint8_t>(i * 31 + 7);

    const Row a = dec.decode(frame, 5);
    const Row b = dec.decode(frame, 5);
    CHECK(a == b);
    CHECK(a == decode_frame(frame.data(), frame.size(), schema, plugin, 5));
}

TEST_CASE("decode: field past the end of the frame is a BoundsError") {
    Subsystem sub;
    sub.name = "CDH";
    sub.offset = 0;
    sub.fields.push_back(make_field("OBT", "u32", 3998));

    Schema schema;
    schema.frame_size = 4000;
    schema.subsystems.push_back(sub);
    const CalibrationPlugin plugin;
    const FrameDecoder dec(schema, plugin);

    const Bytes frame(4000, 0);
    try {
        dec.decode(frame, 0);
        FAIL("expected BoundsError");
    } catch (const BoundsError& e) {
        CHECK(e.field() == "OBT");
        CHECK(e.subsystem() == "CDH");
        CHECK(e.offset() == 3998);
        CHECK(e.size() == 4);
        CHECK(e.frame_size() == 4000);
        CHECK(std::string(e.what()).find("CDH.OBT") != std::string::npos);
    }
}

TEST_CASE("decode: subsystem offset counts toward the bounds check") {
    Subsystem sub;
    sub.name = "S";
    sub.offset = 10;
    sub.fields.push_back(make_field("x", "u16", 0));

    Schema schema;
    schema.frame_size = 12;
    schema.subsystems.push_back(sub);
    const CalibrationPlugin plugin;

    CHECK_NOTHROW(FrameDecoder(schema, plugin).decode(Bytes(12, 0), 0));
    schema.subsystems[0].fields[0].offset = 1;
    CHECK_THROWS_AS(FrameDecoder(schema, plugin).decode(Bytes(12, 0), 0), BoundsError);
}

TEST_CASE("decode: missing plugin function is a PluginError naming it") {
    Field f = make_field("OBT", "u32", 92);
    f.calibration_function = std::string("obt_seconds_to_datetime");
    Subsystem cdh;
    cdh.name = "CDH";
    cdh.offset = 8;
    cdh.fields.push_back(f);

    Schema schema;
    schema.frame_size = 4000;
    schema.default_endian = Endian::Big;
    schema.subsystems.push_back(cdh);

    const CalibrationPlugin empty;
    try {
        decode_frame(Bytes(4000, 0).data(), 4000, schema, empty, 0);
        FAIL("expected PluginError");
    } catch (const PluginError& e) {
        CHECK(e.function() == "obt_seconds_to_datetime");
        CHECK(std::string(e.what()).find("obt_seconds_to_datetime") != std::string::npos);
    }

    Bytes frame(4000, 0);
    put(frame, 8 + 92, uint64_t{86400}, FieldType::U32, Endian::Big);
    const CalibrationPlugin cgss = cgss_calibrations();
    const Row r = decode_frame(frame.data(), frame.size(), schema, cgss, 0);
    CHECK(std::get<std::string>(r.at("CDH.OBT")) == "1980-01-07 00:00:00+00:00");
}

TEST_CASE("decode: plugin receives the raw value untouched") {
    Field f = make_field("temp", "i16", 0);
    f.calibration_function = std::string("half");
    f.round_digits = 1;
    Subsystem s;
    s.name = "THM";
    s.fields.push_back(f);

    Schema schema;
    schema.frame_size = 2;
    schema.default_endian = Endian::Little;
    schema.subsystems.push_back(s);

    CalibrationPlugin plugin;
    plugin.add("half", [](const Value& raw) -> Value {
        REQUIRE(std::holds_alternative<int64_t>(raw));
        return std::get<int64_t>(raw) / 2.0 + 0.04;
    });

    Bytes frame(2, 0);
    put(frame, 0, int64_t{-101}, FieldType::I16, Endian::Little);
    const Row r = FrameDecoder(schema, plugin).decode(frame, 0);
    CHECK(std::get<double>(r.at("THM.temp")) == Approx(-50.5));
}

TEST_CASE("decode: uncalibrated fields pass through with their decoded type") {
    Subsystem s;
    s.name = "RAW";
    s.fields.push_back(make_field("a", "u8", 0));
    s.fields.push_back(make_field("b", "i8", 1));
    s.fields.push_back(make_field("c", "f32", 2));
    Field blob = make_field("d", "bytes", 6);
    blob.byte_length = 3;
    blob.round_digits = 2;   // ignored, not a float
    s.fields.push_back(blob);

    Schema schema;
    schema.frame_size = 9;
    schema.default_endian = Endian::Little;
    schema.subsystems.push_back(s);

    Bytes frame = {0xFF, 0xFE, 0, 0, 0, 0, 0xDE, 0xAD, 0x01};
    put(frame, 2, 1.5, FieldType::F32, Endian::Little);

    const Row r = decode_frame(frame.data(), frame.size(), schema, CalibrationPlugin{}, 0);
    CHECK(std::get<uint64_t>(r.at("RAW.a")) == 255);
    CHECK(std::get<int64_t>(r.at("RAW.b")) == -2);
    CHECK(std::get<double>(r.at("RAW.c")) == 1.5);
    CHECK(std::get<Bytes>(r.at("RAW.d")) == Bytes({0xDE, 0xAD, 0x01}));
}

TEST_CASE("decode: round_digits applies to float results") {
    Field f = make_field("v", "u8", 0);
    f.calibration_expression = std::string("raw + 0.73123456");
    f.round_digits = 3;
    Subsystem s;
    s.name = "S";
    s.fields.push_back(f);
    Schema schema;
    schema.frame_size = 1;
    schema.subsystems.push_back(s);

    const Bytes frame = {18};
    const Row r = decode_frame(frame.data(), frame.size(), schema, CalibrationPlugin{}, 0);
    CHECK(std::get<double>(r.at("S.v")) == 18.731);
}

TEST_CASE("decode: reused column key keeps the last value at the first position") {
    Subsystem a;
    a.name = "X";
    a.offset = 0;
    a.fields.push_back(make_field("v", "u8", 0));
    Subsystem other;
    other.name = "Y";
    other.offset = 1;
    other.fields.push_back(make_field("w", "u8", 0));
    Subsystem b;
    b.name = "X";
    b.offset = 2;
    b.fields.push_back(make_field("v", "u8", 0));

    Schema schema;
    schema.frame_size = 3;
    schema.subsystems = {a, other, b};
    CHECK(a != b);

    const Bytes frame = {1, 2, 3};
    const Row r = decode_frame(frame.data(), frame.size(), schema, CalibrationPlugin{}, 0);
    REQUIRE(r.keys() == std::vector<std::string>({"X.v", "Y.w"}));
    CHECK(std::get<uint64_t>(r.at("X.v")) == 3);
}

TEST_CASE("decode: wrong frame length is a FrameSizeError") {
    const Schema schema = pcs_schema();
    const CalibrationPlugin plugin;
    const FrameDecoder dec(schema, plugin);
    CHECK_THROWS_AS(dec.decode(Bytes(3999, 0), 0), FrameSizeError);
    CHECK_THROWS_AS(dec.decode(Bytes(4001, 0), 0), FrameSizeError);
    CHECK_THROWS_AS(dec.decode_all(Bytes(4000 * 2 + 1, 0)), FrameSizeError);
    CHECK(dec.decode_all(Bytes()).empty());
}

TEST_CASE("FrameDecoder: bad schema content fails at construction") {
    Schema schema = pcs_schema();
    const CalibrationPlugin plugin;

    schema.subsystems[0].fields[0].type = "u12";
    CHECK_THROWS_AS(FrameDecoder(schema, plugin), TypeError);

    schema.subsystems[0].fields[0].type = "bytes";
    CHECK_THROWS_AS(FrameDecoder(schema, plugin), TypeError);

    schema.subsystems[0].fields[0].type = "u16";
    schema.subsystems[0].fields[0].calibration_expression = std::string("__import__('os')");
    CHECK_THROWS_AS(FrameDecoder(schema, plugin), ExpressionError);
}

TEST_CASE("decode: runtime expression failure names the field and frame") {
    Field f = make_field("v", "i8", 0);
    f.calibration_expression = std::string("sqrt(raw)");
    Subsystem s;
    s.name = "S";
    s.fields.push_back(f);
    Schema schema;
    schema.frame_size = 1;
    schema.subsystems.push_back(s);

    const Bytes frame = {0xF0};   // -16
    try {
        decode_frame(frame.data(), frame.size(), schema, CalibrationPlugin{}, 7);
        FAIL("expected ExpressionError");
    } catch (const ExpressionError& e) {
        CHECK(e.expression() == "sqrt(raw)");
        const std::string msg = e.what();
        CHECK(msg.find("math domain error") != std::string::npos);
        CHECK(msg.find("S.v") != std::string::npos);
        CHECK(msg.find("frame 7") != std::string::npos);
    }
}

TEST_CASE("FrameReader: whole frames then a partial one") {
    std::string buf(10, '\0');
    std::istringstream is(buf);
    FrameReader reader(is, 4);
    Bytes frame;
    REQUIRE(reader.next(frame));
    REQUIRE(reader.next(frame));
    CHECK(reader.frames_read() == 2);
    CHECK_THROWS_AS(reader.next(frame), FrameSizeError);

    std::istringstream exact(std::string(8, '\0'));
    FrameReader r2(exact, 4);
    CHECK(r2.next(frame));
    CHECK(r2.next(frame));
    CHECK_FALSE(r2.next(frame));
}

TEST_CASE("sort_rows: stable numeric sort on one column") {
    std::vector<Row> rows(4);
    const uint64_t obt[] = {30, 10, 20, 10};
    for (size_t i = 0; i < rows.size(); ++i) {
        rows[i].set("frame_index", static_cast<uint64_t>(i));
        rows[i].set("CDH.OBT", obt[i]);
    }
    sort_rows(rows, "CDH.OBT");
    CHECK(std::get<uint64_t>(rows[0].at("frame_index")) == 1);
    CHECK(std::get<uint64_t>(rows[1].at("frame_index")) == 3);
    CHECK(std::get<uint64_t>(rows[2].at("frame_index")) == 2);
    CHECK(std::get<uint64_t>(rows[3].at("frame_index")) == 0);

    CHECK_THROWS_AS(sort_rows(rows, "CDH.nope"), SchemaError);

    rows[0].set("CDH.OBT", std::string("text"));
    CHECK_THROWS_AS(sort_rows(rows, "CDH.OBT"), TypeError);
}

TEST_CASE("sort_rows: NaN values sort last") {
    const double values[] = {2.0, std::nan(""), 1.0, std::nan(""), -5.0, 3.0};
    std::vector<Row> rows(6);
    for (size_t i = 0; i < rows.size(); ++i) {
        rows[i].set("frame_index", static_cast<uint64_t>(i));
        rows[i].set("PCS.v", values[i]);
    }
    sort_rows(rows, "PCS.v");
    CHECK(std::get<double>(rows[0].at("PCS.v")) == -5.0);
    CHECK(std::get<double>(rows[1].at("PCS.v")) == 1.0);
    CHECK(std::get<double>(rows[2].at("PCS.v")) == 2.0);
    CHECK(std::get<double>(rows[3].at("PCS.v")) == 3.0);
    CHECK(std::get<uint64_t>(rows[4].at("frame_index")) == 1);
    CHECK(std::get<uint64_t>(rows[5].at("frame_index")) == 3);
}
