#include "src/csv_export.hpp"
#include "src/errors.hpp"
#include "src/frame_decode.hpp"
#include "src/obt_search.hpp"
#include "src/plugin.hpp"
#include "src/schema.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static satr::Bytes read_file(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    if (!is) throw satr::Error("[INPUT ERROR] Could not open " + path);
    return satr::Bytes(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

static int run_obt_search(const std::string& input, const satr::Schema& schema,
                          uint32_t min_obt, uint32_t max_obt, uint32_t max_step) {
    const satr::Bytes data = read_file(input);
    const auto offsets = satr::find_obt_candidates(data, schema.frame_size, min_obt, max_obt, max_step);
    std::cout << offsets.size() << " OBT candidate offset(s)";
    for (size_t off : offsets) std::cout << ' ' << off;
    std::cout << "\n";
    return 0;
}

int main(int argc, char** argv) {
    CLI::App app{"Simple generic satellite frame reader using an XML schema."};

    std::string schema_path, input_path, output_path, plugin_name, delimiter = ",";
    bool verbose = false;
    bool find_obt = false;
    uint32_t obt_min = 1116547200;   // 2015-05-25
    uint32_t obt_max = 1117843200;   // 2015-06-09
    uint32_t obt_step = 8;

    app.add_option("--schema", schema_path, "Path to XML schema file.")->required();
    app.add_option("--input", input_path, "Path to binary frame input file.")->required();
    app.add_option("--output", output_path, "Path to write CSV output file.");
    app.add_option("--plugin", plugin_name, "Built-in calibration function table (cgss).");
    app.add_option("--csv-delimiter", delimiter, "CSV delimiter character.");
    app.add_flag("-v,--verbose", verbose, "Dump the parsed schema to stderr.");
    app.add_flag("--find-obt", find_obt, "Search frame 0 for OBT counter offsets instead of decoding.");
    app.add_option("--obt-min", obt_min, "Lowest plausible OBT value (seconds).");
    app.add_option("--obt-max", obt_max, "Highest plausible OBT value (seconds).");
    app.add_option("--obt-step", obt_step, "Allowed OBT drift per frame (seconds).");

    CLI11_PARSE(app, argc, argv);

    satr::Schema schema;
    std::string err;
    if (!satr::load_schema_file(schema_path, schema, &err)) {
        std::cerr << "Schema load failed: " << schema_path << " -> " << err << "\n";
        return 1;
    }
    if (verbose) satr::dump_schema(schema, std::cerr);

    std::error_code ec;
    if (!fs::is_regular_file(input_path, ec)) {
        std::cerr << "[INPUT ERROR] Input not found: " << input_path << "\n";
        return 1;
    }
    if (delimiter.size() != 1) {
        std::cerr << "[INPUT ERROR] --csv-delimiter must be a single character\n";
        return 1;
    }

    satr::CalibrationPlugin plugin;
    if (!plugin_name.empty() && !satr::find_builtin_plugin(plugin_name, plugin)) {
        std::cerr << "[PLUGIN ERROR] Cannot load calibration plugin '" << plugin_name << "'\n";
        return 1;
    }

    // Validate size multiple without loading the whole file
    const auto file_size = fs::file_size(input_path, ec);
    if (ec) {
        std::cerr << "[INPUT ERROR] Could not stat " << input_path << ": " << ec.message() << "\n";
        return 1;
    }
    if (file_size % schema.frame_size != 0) {
        std::cerr << "[FILE ERROR] File size " << file_size
                  << " is not a multiple of frame size " << schema.frame_size << ".\n";
        return 1;
    }

    try {
        if (find_obt) return run_obt_search(input_path, schema, obt_min, obt_max, obt_step);

        if (output_path.empty()) {
            std::cerr << "[INPUT ERROR] --output is required\n";
            return 1;
        }
        std::ofstream out(output_path, std::ios::trunc);
        if (!out) {
            std::cerr << "Could not create " << output_path << "\n";
            return 1;
        }

        size_t written = 0;
        if (schema.read_in_memory) {
            const satr::Bytes data = read_file(input_path);
            std::vector<satr::Row> rows = satr::read_frames(data, schema, plugin);
            if (schema.sort_by) {
                std::cout << "sorting by schema field: " << *schema.sort_by << "\n";
                satr::sort_rows(rows, *schema.sort_by);
            }
            written = satr::write_csv(rows, out, delimiter[0]);
        } else {
            std::ifstream in(input_path, std::ios::binary);
            if (!in) {
                std::cerr << "[INPUT ERROR] Could not open " << input_path << "\n";
                return 1;
            }
            written = satr::write_csv_stream(schema, in, out, plugin, delimiter[0]);
        }

        std::cout << "Wrote " << written << " rows to " << output_path << "\n";
    } catch (const satr::Error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
