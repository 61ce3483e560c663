#pragma once
#include "type_codec.hpp"

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace satr {

// Table of named calibration functions, filled by the caller before decoding.
// Nothing is ever loaded at runtime; an empty table simply has no functions.
class CalibrationPlugin {
public:
    using Function = std::function<Value(const Value& raw)>;

    CalibrationPlugin() = default;
    explicit CalibrationPlugin(std::string name) : name_(std::move(name)) {}

    // Registers (or replaces) a function.
    void add(const std::string& fn_name, Function fn);

    bool has(const std::string& fn_name) const;

    // Throws PluginError if fn_name is absent or not callable.
    Value call(const std::string& fn_name, const Value& raw) const;

    const std::string& name() const { return name_; }
    std::vector<std::string> function_names() const;

private:
    std::string name_;
    std::map<std::string, Function> functions_;
};

// OBT: seconds since 1980-01-06T00:00:00Z. Returns "YYYY-MM-DD HH:MM:SS[.ffffff]+00:00".
std::string obt_seconds_to_datetime(double seconds);

// Functions for the CGSS mission dumps (obt_seconds_to_datetime).
CalibrationPlugin cgss_calibrations();

// Built-in tables by name ("cgss"). Returns false for an unknown name.
bool find_builtin_plugin(const std::string& name, CalibrationPlugin& out);

} // namespace satr
