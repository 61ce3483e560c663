#include "schema.hpp"
#include "errors.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <memory>
#include <unordered_set>

namespace satr {

std::string column_key(const Subsystem& sub, const Field& field) {
    return sub.name + "." + field.name;
}

std::vector<std::string> schema_columns(const Schema& schema) {
    std::vector<std::string> cols;
    std::unordered_set<std::string> seen;
    if (schema.include_frame_index) {
        cols.push_back("frame_index");
        seen.insert("frame_index");
    }
    for (const auto& sub : schema.subsystems) {
        for (const auto& f : sub.fields) {
            std::string key = column_key(sub, f);
            if (seen.insert(key).second) cols.push_back(std::move(key));
        }
    }
    return cols;
}

// ------------------ helpers ------------------
namespace {

struct DocDeleter {
    void operator()(xmlDoc* d) const { xmlFreeDoc(d); }
};
using DocPtr = std::unique_ptr<xmlDoc, DocDeleter>;

inline std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

inline std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_element(const xmlNode* n, const char* name) {
    return n->type == XML_ELEMENT_NODE &&
           xmlStrcmp(n->name, reinterpret_cast<const xmlChar*>(name)) == 0;
}

// First direct child element with the given tag, or nullptr.
const xmlNode* find_child(const xmlNode* parent, const char* name) {
    for (const xmlNode* c = parent->children; c; c = c->next) {
        if (is_element(c, name)) return c;
    }
    return nullptr;
}

std::vector<const xmlNode*> find_children(const xmlNode* parent, const char* name) {
    std::vector<const xmlNode*> out;
    for (const xmlNode* c = parent->children; c; c = c->next) {
        if (is_element(c, name)) out.push_back(c);
    }
    return out;
}

std::optional<std::string> attr(const xmlNode* n, const char* name) {
    xmlChar* v = xmlGetProp(n, reinterpret_cast<const xmlChar*>(name));
    if (!v) return std::nullopt;
    std::string s(reinterpret_cast<const char*>(v));
    xmlFree(v);
    return s;
}

std::string required_attr(const xmlNode* n, const char* name, const std::string& where) {
    auto v = attr(n, name);
    if (!v) throw SchemaError(where + " is missing required attribute '" + name + "'");
    return *v;
}

int64_t parse_int(const std::string& text, const std::string& what) {
    const std::string t = trim(text);
    size_t used = 0;
    int64_t v = 0;
    try {
        v = std::stoll(t, &used, 10);
    } catch (const std::exception&) {
        throw SchemaError(what + " must be an integer, got '" + text + "'");
    }
    if (used != t.size()) throw SchemaError(what + " must be an integer, got '" + text + "'");
    return v;
}

uint32_t parse_offset(const std::string& text, const std::string& what) {
    const int64_t v = parse_int(text, what);
    if (v < 0 || v > std::numeric_limits<uint32_t>::max()) {
        throw SchemaError(what + " must be a non-negative byte offset, got '" + text + "'");
    }
    return static_cast<uint32_t>(v);
}

bool parse_flag(const std::optional<std::string>& v, const std::string& what) {
    static const char* kTrue[] = {"true", "yes", "1"};
    static const char* kFalse[] = {"false", "no", "0"};
    const std::string msg = what + " must be defined and be true, false, yes, no, 1 or 0";
    if (!v) throw SchemaError(msg);
    const std::string s = lower(*v);
    for (const char* t : kTrue) if (s == t) return true;
    for (const char* f : kFalse) if (s == f) return false;
    throw SchemaError(msg);
}

Field parse_field(const xmlNode* fe, const std::string& sub_name) {
    const std::string where = "<subsystem " + sub_name + "> -> <field>";
    Field f;
    f.name = required_attr(fe, "name", where);
    const std::string fwhere = "field " + sub_name + "." + f.name;
    f.type = required_attr(fe, "type", fwhere);
    f.offset = parse_offset(required_attr(fe, "offset", fwhere), fwhere + " offset");

    if (auto b = attr(fe, "bytes")) f.byte_length = parse_int(*b, fwhere + " bytes");

    if (const xmlNode* cal = find_child(fe, "calibration")) {
        auto expr = attr(cal, "expr");
        auto func = attr(cal, "func");
        if (expr && !expr->empty()) f.calibration_expression = *expr;
        if (func && !func->empty()) f.calibration_function = *func;
        if (f.calibration_expression && f.calibration_function) {
            throw SchemaError(fwhere + ": use either calibration expr or func, not both");
        }
        f.units = attr(cal, "units");
        auto rnd = attr(cal, "round");
        if (rnd && !rnd->empty()) {
            const int64_t digits = parse_int(*rnd, fwhere + " round");
            if (digits < 0 || digits > std::numeric_limits<int>::max()) {
                throw SchemaError(fwhere + " round must be a non-negative integer");
            }
            f.round_digits = static_cast<int>(digits);
        }
    }
    return f;
}

Schema parse_document(xmlDoc* doc) {
    const xmlNode* root = xmlDocGetRootElement(doc);
    if (!root || !is_element(root, "schema")) {
        throw SchemaError("Root element must be <schema>");
    }

    const xmlNode* settings = find_child(root, "schema_settings");
    if (!settings) throw SchemaError("<schema_settings> element is required");

    Schema s;
    s.read_in_memory = parse_flag(attr(settings, "read_in_memory"),
                                  "<schema_settings read_in_memory>");

    s.sort_by = attr(settings, "sort_by");
    if (s.sort_by && !s.read_in_memory) {
        throw SchemaError("<schema_settings sort_by> can only be used if read_in_memory is true");
    }

    const int64_t frame_size = parse_int(attr(settings, "frame_size").value_or("0"),
                                         "<schema_settings frame_size>");
    if (frame_size <= 0 || frame_size > std::numeric_limits<uint32_t>::max()) {
        throw SchemaError("<schema_settings frame_size> must be positive and not 0");
    }
    s.frame_size = static_cast<uint32_t>(frame_size);

    const std::string endian = lower(attr(settings, "endian").value_or("little"));
    if (endian == "little") {
        s.default_endian = Endian::Little;
    } else if (endian == "big") {
        s.default_endian = Endian::Big;
    } else {
        throw SchemaError("<schema_settings endian> must be 'little' or 'big'");
    }

    s.include_frame_index = parse_flag(attr(settings, "include_frame_index"),
                                       "<schema_settings include_frame_index>");

    const xmlNode* subsystems = find_child(root, "subsystems");
    if (!subsystems) throw SchemaError("<subsystems> element is required");

    for (const xmlNode* se : find_children(subsystems, "subsystem")) {
        Subsystem sub;
        sub.name = required_attr(se, "name", "<subsystem>");
        sub.offset = parse_offset(required_attr(se, "offset", "<subsystem " + sub.name + ">"),
                                  "<subsystem " + sub.name + "> offset");

        const xmlNode* fields = find_child(se, "fields");
        if (!fields) throw SchemaError("<subsystem> -> <fields> element is required");

        for (const xmlNode* fe : find_children(fields, "field")) {
            sub.fields.push_back(parse_field(fe, sub.name));
        }
        s.subsystems.push_back(std::move(sub));
    }
    return s;
}

bool finish(DocPtr doc, const std::string& source, Schema& out, std::string* err) {
    if (!doc) {
        if (err) *err = "[XML ERROR] Failed to parse " + source;
        return false;
    }
    try {
        out = parse_document(doc.get());
    } catch (const Error& e) {
        if (err) *err = e.what();
        return false;
    }
    if (err) *err = "";
    return true;
}

} // namespace

// ------------------ loader ------------------
bool load_schema_file(const std::string& path, Schema& out, std::string* err) {
    DocPtr doc(xmlReadFile(path.c_str(), nullptr, XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    return finish(std::move(doc), path, out, err);
}

bool load_schema_string(const std::string& xml, Schema& out, std::string* err) {
    DocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "schema.xml", nullptr,
                             XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    return finish(std::move(doc), "schema text", out, err);
}

void dump_schema(const Schema& schema, std::ostream& os) {
    os << "Schema: frame_size=" << schema.frame_size
       << " endian=" << (schema.default_endian == Endian::Big ? "big" : "little")
       << " in_memory=" << schema.read_in_memory
       << " frame_index=" << schema.include_frame_index;
    if (schema.sort_by) os << " sort_by=" << *schema.sort_by;
    os << "\n";
    for (const auto& sub : schema.subsystems) {
        for (const auto& f : sub.fields) {
            os << "Parsed field: " << column_key(sub, f)
               << " type=" << f.type
               << " offset=" << sub.offset << "+" << f.offset;
            if (f.byte_length) os << " bytes=" << *f.byte_length;
            if (f.calibration_expression) os << " expr=\"" << *f.calibration_expression << "\"";
            if (f.calibration_function) os << " func=" << *f.calibration_function;
            if (f.units) os << " units=" << *f.units;
            if (f.round_digits) os << " round=" << *f.round_digits;
            os << "\n";
        }
    }
}

} // namespace satr
