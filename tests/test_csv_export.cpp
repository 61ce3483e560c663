#include <catch2/catch.hpp>

#include "solution/src/csv_export.hpp"
#include "solution/src/errors.hpp"

#include <sstream>
#include <string>

using namespace satr;

static Schema small_schema() {
    Schema s;
    s.frame_size = 4;
    s.default_endian = Endian::Big;
    s.include_frame_index = true;

    Subsystem sub;
    sub.name = "S";
    sub.offset = 0;

    Field v;
    v.name = "v";
    v.type = "u16";
    v.offset = 0;
    v.calibration_expression = "raw / 10";
    v.round_digits = 1;
    sub.fields.push_back(v);

    Field b;
    b.name = "b";
    b.type = "u8";
    b.offset = 2;
    sub.fields.push_back(b);

    Field x;
    x.name = "x";
    x.type = "bytes";
    x.offset = 3;
    x.byte_length = 1;
    sub.fields.push_back(x);

    s.subsystems.push_back(sub);
    return s;
}

static std::string as_text(const Bytes& b) {
    return std::string(reinterpret_cast<const char*>(b.data()), b.size());
}

TEST_CASE("csv_escape: quotes only when needed") {
    CHECK(csv_escape("plain", ',') == "plain");
    CHECK(csv_escape("a,b", ',') == "\"a,b\"");
    CHECK(csv_escape("a,b", ';') == "a,b");
    CHECK(csv_escape("a;b", ';') == "\"a;b\"");
    CHECK(csv_escape("say \"hi\"", ',') == "\"say \"\"hi\"\"\"");
    CHECK(csv_escape("two\nlines", ',') == "\"two\nlines\"");
}

TEST_CASE("write_csv: header from the first row") {
    Row r1;
    r1.set("A.x", uint64_t{1});
    r1.set("A.y", 2.5);
    Row r2;
    r2.set("A.x", int64_t{-3});
    r2.set("A.z", std::string("ignored"));

    std::ostringstream os;
    CHECK(write_csv({r1, r2}, os) == 2);
    CHECK(os.str() == "A.x,A.y\n1,2.5\n-3,\n");
}

TEST_CASE("write_csv: no rows, no output") {
    std::ostringstream os;
    CHECK(write_csv({}, os) == 0);
    CHECK(os.str().empty());
}

TEST_CASE("write_csv_stream: decodes frame by frame") {
    const Schema s = small_schema();
    const Bytes data = {0x00, 0x7B, 0x05, 0xAB,
                        0x01, 0x00, 0xFF, 0x00};
    std::istringstream is(as_text(data));
    std::ostringstream os;

    CHECK(write_csv_stream(s, is, os, CalibrationPlugin{}) == 2);
    CHECK(os.str() ==
          "frame_index,S.v,S.b,S.x\n"
          "0,12.3,5,0xAB\n"
          "1,25.6,255,0x00\n");
}

TEST_CASE("write_csv_stream: matches in-memory output") {
    const Schema s = small_schema();
    const Bytes data = {0x12, 0x34, 0x56, 0x78,
                        0x9A, 0xBC, 0xDE, 0xF0,
                        0x00, 0x00, 0x00, 0x00};

    std::ostringstream in_memory;
    write_csv(read_frames(data, s, CalibrationPlugin{}), in_memory, ';');

    std::istringstream is(as_text(data));
    std::ostringstream streamed;
    write_csv_stream(s, is, streamed, CalibrationPlugin{}, ';');

    CHECK(streamed.str() == in_memory.str());
}

TEST_CASE("write_csv_stream: empty input writes the header only") {
    const Schema s = small_schema();
    std::istringstream is("");
    std::ostringstream os;
    CHECK(write_csv_stream(s, is, os, CalibrationPlugin{}) == 0);
    CHECK(os.str() == "frame_index,S.v,S.b,S.x\n");
}

TEST_CASE("write_csv_stream: trailing partial frame") {
    const Schema s = small_schema();
    std::istringstream is(as_text(Bytes{0, 1, 2, 3, 4, 5}));
    std::ostringstream os;
    CHECK_THROWS_AS(write_csv_stream(s, is, os, CalibrationPlugin{}), FrameSizeError);
}

TEST_CASE("write_csv_stream: plugin text is quoted for the delimiter") {
    Schema s = small_schema();
    s.subsystems[0].fields[1].calibration_function = "flag";

    CalibrationPlugin p;
    p.add("flag", [](const Value& raw) -> Value {
        return std::get<uint64_t>(raw) ? std::string("on;set") : std::string("off");
    });

    std::istringstream is(as_text(Bytes{0, 0, 1, 0, 0, 0, 0, 0}));
    std::ostringstream os;
    write_csv_stream(s, is, os, p, ';');
    CHECK(os.str() ==
          "frame_index;S.v;S.b;S.x\n"
          "0;0;\"on;set\";0x00\n"
          "1;0;off;0x00\n");
}
