#include "plugin.hpp"
#include "errors.hpp"

#include <cmath>
#include <cstdio>

namespace satr {

void CalibrationPlugin::add(const std::string& fn_name, Function fn) {
    functions_[fn_name] = std::move(fn);
}

bool CalibrationPlugin::has(const std::string& fn_name) const {
    return functions_.count(fn_name) != 0;
}

Value CalibrationPlugin::call(const std::string& fn_name, const Value& raw) const {
    auto it = functions_.find(fn_name);
    if (it == functions_.end() || !it->second) {
        throw PluginError(fn_name, "Plugin has no callable '" + fn_name + "' calibration function.");
    }
    return it->second(raw);
}

std::vector<std::string> CalibrationPlugin::function_names() const {
    std::vector<std::string> names;
    names.reserve(functions_.size());
    for (const auto& kv : functions_) names.push_back(kv.first);
    return names;
}

// ------------------ OBT conversion ------------------
// Days since 1970-01-01 -> civil date (proleptic Gregorian).
static void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
}

std::string obt_seconds_to_datetime(double seconds) {
    // 1980-01-06T00:00:00Z in Unix seconds
    constexpr int64_t kObtEpochUnix = 315964800;

    if (!std::isfinite(seconds) || std::fabs(seconds) > 1e12) {
        throw PluginError("obt_seconds_to_datetime", "OBT value out of range");
    }
    int64_t micros = static_cast<int64_t>(std::llround(seconds * 1e6));
    int64_t whole = micros / 1000000;
    int64_t frac = micros % 1000000;
    if (frac < 0) {
        frac += 1000000;
        whole -= 1;
    }
    const int64_t unix_s = kObtEpochUnix + whole;
    int64_t days = unix_s / 86400;
    int64_t secs = unix_s % 86400;
    if (secs < 0) {
        secs += 86400;
        days -= 1;
    }

    int64_t y = 0;
    unsigned mo = 0, d = 0;
    civil_from_days(days, y, mo, d);

    char buf[64];
    if (frac == 0) {
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02lld:%02lld:%02lld+00:00",
                      static_cast<long long>(y), mo, d,
                      static_cast<long long>(secs / 3600), static_cast<long long>((secs / 60) % 60),
                      static_cast<long long>(secs % 60));
    } else {
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02lld:%02lld:%02lld.%06lld+00:00",
                      static_cast<long long>(y), mo, d,
                      static_cast<long long>(secs / 3600), static_cast<long long>((secs / 60) % 60),
                      static_cast<long long>(secs % 60), static_cast<long long>(frac));
    }
    return buf;
}

CalibrationPlugin cgss_calibrations() {
    CalibrationPlugin p("cgss");
    p.add("obt_seconds_to_datetime", [](const Value& raw) -> Value {
        if (!is_numeric(raw)) {
            throw PluginError("obt_seconds_to_datetime", "obt_seconds_to_datetime expects a numeric raw value");
        }
        return obt_seconds_to_datetime(to_double(raw));
    });
    return p;
}

bool find_builtin_plugin(const std::string& name, CalibrationPlugin& out) {
    if (name == "cgss") {
        out = cgss_calibrations();
        return true;
    }
    return false;
}

} // namespace satr
