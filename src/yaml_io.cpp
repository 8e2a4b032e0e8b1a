#include "libctdi/yaml_io.hpp"
#include "libctdi/exceptions.hpp"
#include "libctdi/logging.hpp"

#include <charconv>
#include <string>
#include <utility>
#include <vector>

namespace libctdi {

namespace {

// ------------------------------------------------------------------
// Reading
// ------------------------------------------------------------------

class document_reader {
public:
    explicit document_reader(std::string name) : name_(std::move(name)) {}

    scan_result read(const YAML::Node& root) const {
        scan_result scan;
        if (!root || root.IsNull()) return scan;
        expect_map(root, "scan document");

        for (auto node : sequence(root, "components")) {
            scan.components.push_back(read_component(node));
        }
        for (auto node : sequence(root, "modules")) {
            scan.modules.push_back(read_module(node));
        }
        scan.warnings = strings(root, "warnings");
        return scan;
    }

private:
    std::string name_;

    source_position at(const YAML::Node& node) const {
        auto mark = node.Mark();
        // Marks are zero-based; null marks come back as -1.
        return source_position{name_, mark.line + 1, mark.column + 1};
    }

    [[noreturn]] void fail(const YAML::Node& node, const std::string& what,
                           const std::string& reason) const {
        throw invalid_declaration(what, reason, at(node));
    }

    void expect_map(const YAML::Node& node, const std::string& what) const {
        if (!node.IsMap()) fail(node, what, "expected a mapping");
    }

    std::vector<YAML::Node> sequence(const YAML::Node& parent, const char* key) const {
        std::vector<YAML::Node> out;
        auto node = parent[key];
        if (!node || node.IsNull()) return out;
        if (!node.IsSequence()) fail(node, key, "expected a sequence");
        for (auto item : node) out.push_back(item);
        return out;
    }

    std::string required_string(const YAML::Node& parent, const char* key,
                                const std::string& what) const {
        auto node = parent[key];
        if (!node || !node.IsScalar()) {
            fail(parent, what, std::string("missing string field \"") + key + "\"");
        }
        return node.Scalar();
    }

    std::optional<std::string> optional_string(const YAML::Node& parent,
                                               const char* key) const {
        auto node = parent[key];
        if (!node || node.IsNull()) return std::nullopt;
        if (!node.IsScalar()) fail(node, key, "expected a string");
        return node.Scalar();
    }

    bool flag(const YAML::Node& parent, const char* key) const {
        auto node = parent[key];
        if (!node || node.IsNull()) return false;
        bool value = false;
        if (!YAML::convert<bool>::decode(node, value)) {
            fail(node, key, "expected true or false");
        }
        return value;
    }

    std::vector<std::string> strings(const YAML::Node& parent, const char* key) const {
        std::vector<std::string> out;
        for (auto item : sequence(parent, key)) {
            if (!item.IsScalar()) fail(item, key, "expected a list of strings");
            out.push_back(item.Scalar());
        }
        return out;
    }

    scope_kind scope(const YAML::Node& parent) const {
        auto text = optional_string(parent, "scope");
        if (!text) return scope_kind::singleton;
        auto parsed = parse_scope(*text);
        if (!parsed) {
            fail(parent["scope"], "scope",
                 "unknown scope \"" + *text + "\" (expected singleton or prototype)");
        }
        return *parsed;
    }

    int integer(const YAML::Node& node, const char* what) const {
        int value = 0;
        if (!YAML::convert<int>::decode(node, value)) fail(node, what, "expected an integer");
        return value;
    }

    source_position location(const YAML::Node& parent) const {
        auto node = parent["location"];
        if (!node || node.IsNull()) return at(parent);

        if (node.IsScalar()) {
            // "file:line:column", split from the right so that file names
            // may contain colons.
            const std::string& text = node.Scalar();
            auto col_sep = text.rfind(':');
            auto line_sep = col_sep == std::string::npos ? std::string::npos
                                                         : text.rfind(':', col_sep - 1);
            source_position pos;
            if (line_sep == std::string::npos || col_sep == 0) {
                pos.file = text;
                return pos;
            }
            auto parse = [&](std::size_t from, std::size_t to, int& out) {
                auto [ptr, ec] = std::from_chars(text.data() + from, text.data() + to, out);
                return ec == std::errc{} && ptr == text.data() + to;
            };
            if (!parse(line_sep + 1, col_sep, pos.line)
                    || !parse(col_sep + 1, text.size(), pos.column)) {
                fail(node, "location", "expected \"file:line:column\"");
            }
            pos.file = text.substr(0, line_sep);
            return pos;
        }

        expect_map(node, "location");
        source_position pos;
        pos.file = required_string(node, "file", "location");
        if (node["line"]) pos.line = integer(node["line"], "line");
        if (node["column"]) pos.column = integer(node["column"], "column");
        return pos;
    }

    type_ref read_type(const YAML::Node& node) const {
        if (node.IsScalar()) {
            return type_ref{node.Scalar(), std::nullopt, {}};
        }
        expect_map(node, "type reference");
        type_ref ref;
        ref.name = required_string(node, "name", "type reference");
        ref.origin = optional_string(node, "origin");
        for (auto arg : sequence(node, "args")) {
            ref.arguments.push_back(read_type(arg));
        }
        return ref;
    }

    std::optional<type_ref> optional_type(const YAML::Node& parent, const char* key) const {
        auto node = parent[key];
        if (!node || node.IsNull()) return std::nullopt;
        return read_type(node);
    }

    std::vector<type_ref> types(const YAML::Node& parent, const char* key) const {
        std::vector<type_ref> out;
        for (auto item : sequence(parent, key)) out.push_back(read_type(item));
        return out;
    }

    metadata_value read_metadata_value(const YAML::Node& node) const {
        if (node.IsSequence()) {
            std::vector<std::string> list;
            for (auto item : node) {
                if (!item.IsScalar()) fail(item, "metadata", "lists may only hold strings");
                list.push_back(item.Scalar());
            }
            return list;
        }
        if (!node.IsScalar()) fail(node, "metadata", "expected a scalar or a list of strings");

        // Quoted scalars are always strings.
        if (node.Tag() != "!") {
            bool b = false;
            if (YAML::convert<bool>::decode(node, b)) return b;
            double d = 0;
            if (YAML::convert<double>::decode(node, d)) return d;
        }
        return node.Scalar();
    }

    metadata_map metadata(const YAML::Node& parent) const {
        metadata_map out;
        auto node = parent["metadata"];
        if (!node || node.IsNull()) return out;
        expect_map(node, "metadata");
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (!it->first.IsScalar()) fail(it->first, "metadata", "keys must be strings");
            out[it->first.Scalar()] = read_metadata_value(it->second);
        }
        return out;
    }

    parameter_declaration read_param(const YAML::Node& node) const {
        expect_map(node, "parameter");
        parameter_declaration p;
        p.name = required_string(node, "name", "parameter");
        p.type = optional_type(node, "type");
        p.collection = flag(node, "collection");
        p.optional = flag(node, "optional");
        p.location = location(node);
        return p;
    }

    std::vector<parameter_declaration> params(const YAML::Node& parent, const char* key) const {
        std::vector<parameter_declaration> out;
        for (auto item : sequence(parent, key)) out.push_back(read_param(item));
        return out;
    }

    field_declaration read_field(const YAML::Node& node) const {
        expect_map(node, "field");
        field_declaration f;
        f.name = required_string(node, "name", "field");
        f.type = optional_type(node, "type");
        f.qualifier = optional_string(node, "qualifier");
        f.optional = flag(node, "optional");
        f.location = location(node);
        return f;
    }

    component_declaration read_component(const YAML::Node& node) const {
        expect_map(node, "component");
        component_declaration c;
        c.name = required_string(node, "name", "component");
        c.origin = optional_string(node, "origin").value_or(std::string{});
        c.scope = scope(node);
        c.eager = flag(node, "eager");
        c.is_abstract = flag(node, "abstract");
        c.qualifier = optional_string(node, "qualifier");
        c.constructor_params = params(node, "constructor");
        for (auto f : sequence(node, "fields")) c.fields.push_back(read_field(f));
        c.base_types = types(node, "bases");
        c.post_construct_methods = strings(node, "postConstruct");
        c.pre_destroy_methods = strings(node, "preDestroy");
        c.metadata = metadata(node);
        c.location = location(node);
        return c;
    }

    provides_declaration read_provides(const YAML::Node& node) const {
        expect_map(node, "factory method");
        provides_declaration p;
        p.method_name = required_string(node, "method", "factory method");
        p.return_type = optional_type(node, "returns");
        p.params = params(node, "params");
        p.scope = scope(node);
        p.eager = flag(node, "eager");
        p.qualifier = optional_string(node, "qualifier");
        p.location = location(node);
        return p;
    }

    module_declaration read_module(const YAML::Node& node) const {
        expect_map(node, "module");
        module_declaration m;
        m.name = required_string(node, "name", "module");
        m.origin = optional_string(node, "origin").value_or(std::string{});
        m.is_abstract = flag(node, "abstract");
        m.imports = types(node, "imports");
        for (auto p : sequence(node, "provides")) m.provides.push_back(read_provides(p));
        m.location = location(node);
        return m;
    }
};

// ------------------------------------------------------------------
// Writing
// ------------------------------------------------------------------

void write_token(YAML::Emitter& out, const token& t) {
    out << YAML::BeginMap;
    out << YAML::Key << "key" << YAML::Value << t.key();
    out << YAML::Key << "kind" << YAML::Value
        << (t.is_nominal() ? "class" : "token");
    out << YAML::Key << "name" << YAML::Value << t.name;
    if (!t.origin.empty()) {
        out << YAML::Key << "origin" << YAML::Value << t.origin;
    }
    if (!t.type_annotation.empty()) {
        out << YAML::Key << "typeAnnotation" << YAML::Value << t.type_annotation;
    }
    if (!t.type_imports.empty()) {
        out << YAML::Key << "typeImports" << YAML::Value << YAML::BeginMap;
        for (auto& [name, origin] : t.type_imports) {
            out << YAML::Key << name << YAML::Value << origin;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
}

void write_dependencies(YAML::Emitter& out, const char* key,
                        const std::vector<dependency>& deps, bool fields) {
    out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (auto& dep : deps) {
        out << YAML::BeginMap;
        if (fields) out << YAML::Key << "field" << YAML::Value << dep.name;
        out << YAML::Key << "token" << YAML::Value;
        write_token(out, dep.target);
        out << YAML::Key << "optional" << YAML::Value << dep.optional;
        out << YAML::Key << "collection" << YAML::Value << dep.collection;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
}

struct metadata_writer {
    YAML::Emitter& out;

    void operator()(const std::string& s) const { out << YAML::DoubleQuoted << s; }
    void operator()(bool b) const { out << b; }
    void operator()(double d) const { out << d; }
    void operator()(const std::vector<std::string>& list) const {
        out << YAML::Flow << YAML::BeginSeq;
        for (auto& s : list) out << s;
        out << YAML::EndSeq;
    }
};

void write_component(YAML::Emitter& out, const component_descriptor& c) {
    out << YAML::BeginMap;
    out << YAML::Key << "token" << YAML::Value;
    write_token(out, c.id);
    out << YAML::Key << "scope" << YAML::Value << std::string(to_string(c.scope));
    out << YAML::Key << "eager" << YAML::Value << c.eager;
    if (c.qualifier.has_value()) {
        out << YAML::Key << "name" << YAML::Value << *c.qualifier;
    }
    out << YAML::Key << "factory" << YAML::Value << std::string(to_string(c.factory));
    if (c.provenance.has_value()) {
        out << YAML::Key << "provides" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "module" << YAML::Value;
        write_token(out, c.provenance->module);
        out << YAML::Key << "method" << YAML::Value << c.provenance->method_name;
        out << YAML::EndMap;
    }
    write_dependencies(out, "dependencies", c.dependencies, false);
    write_dependencies(out, "fieldDependencies", c.field_dependencies, true);
    if (!c.base_types.empty()) {
        out << YAML::Key << "baseTypes" << YAML::Value << YAML::BeginSeq;
        for (auto& b : c.base_types) write_token(out, b);
        out << YAML::EndSeq;
    }
    out << YAML::Key << "metadata" << YAML::Value << YAML::BeginMap;
    for (auto& [key, value] : c.metadata) {
        out << YAML::Key << key << YAML::Value;
        std::visit(metadata_writer{out}, value);
    }
    out << YAML::EndMap;
    out << YAML::Key << "location" << YAML::Value << to_string(c.location);
    out << YAML::EndMap;
}

} // anonymous namespace

// ------------------------------------------------------------------
// Public entry points
// ------------------------------------------------------------------

scan_result parse_scan_result(const YAML::Node& document, const std::string& document_name) {
    try {
        return document_reader(document_name).read(document);
    } catch (const YAML::Exception& e) {
        // Conversions the reader did not anticipate still point into the
        // document.
        throw invalid_declaration("scan document", e.msg,
                                  source_position{document_name, e.mark.line + 1,
                                                  e.mark.column + 1});
    }
}

scan_result load_scan_result(const std::string& path) {
    log::install_default_filter();
    LIBCTDI_LOG_DEBUG << "loading scan document " << path;
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw compile_error("Cannot open scan document " + path);
    } catch (const YAML::ParserException& e) {
        throw invalid_declaration("scan document", e.msg,
                                  source_position{path, e.mark.line + 1, e.mark.column + 1});
    }
    return parse_scan_result(root, path);
}

scan_result load_scan_result_from_string(std::string_view text,
                                         const std::string& document_name) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::ParserException& e) {
        throw invalid_declaration("scan document", e.msg,
                                  source_position{document_name, e.mark.line + 1,
                                                  e.mark.column + 1});
    }
    return parse_scan_result(root, document_name);
}

void write_plan(YAML::Emitter& out, const compile_result& result) {
    out << YAML::BeginMap;
    out << YAML::Key << "components" << YAML::Value << YAML::BeginSeq;
    for (auto& c : result.components) write_component(out, c);
    out << YAML::EndSeq;
    out << YAML::Key << "warnings" << YAML::Value << YAML::BeginSeq;
    for (auto& w : result.warnings) out << w;
    out << YAML::EndSeq;
    out << YAML::EndMap;
}

std::string plan_to_yaml(const compile_result& result) {
    YAML::Emitter out;
    write_plan(out, result);
    return std::string(out.c_str());
}

} // namespace libctdi
