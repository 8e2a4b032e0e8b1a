#include "libctdi/config.hpp"
#include "libctdi/exceptions.hpp"

#include <string>

namespace libctdi {

namespace {

source_position mark_of(const YAML::Node& node, const std::string& document_name) {
    auto mark = node.Mark();
    return source_position{document_name, mark.line + 1, mark.column + 1};
}

void read_switch(const YAML::Node& section, const char* key, bool& target,
                 const std::string& document_name) {
    auto node = section[key];
    if (!node || node.IsNull()) return;
    if (!YAML::convert<bool>::decode(node, target)) {
        throw invalid_declaration(std::string("setting \"compile.") + key + "\"",
                                  "expected true or false",
                                  mark_of(node, document_name));
    }
}

} // namespace

tool_config parse_tool_config(const YAML::Node& root, const std::string& document_name) {
    tool_config config;
    if (!root || root.IsNull()) return config;

    if (auto log_node = root["log"]; log_node && log_node.IsMap()) {
        if (auto level_node = log_node["level"]; level_node && level_node.IsScalar()) {
            auto lvl = log::level_from_string(level_node.Scalar());
            if (!lvl) {
                throw invalid_declaration("setting \"log.level\"",
                                          "unknown level \"" + level_node.Scalar() + "\"",
                                          mark_of(level_node, document_name));
            }
            config.log.minimum = *lvl;
        }
        if (auto pattern = log_node["pattern"]; pattern && pattern.IsScalar()) {
            config.log.pattern = pattern.Scalar();
        }
    }

    if (auto compile = root["compile"]; compile && compile.IsMap()) {
        auto& opts = config.compile;
        read_switch(compile, "validate_providers", opts.validate_providers, document_name);
        read_switch(compile, "subtype_resolution", opts.subtype_resolution, document_name);
        read_switch(compile, "primitive_name_matching", opts.primitive_name_matching, document_name);
        read_switch(compile, "strict_imports", opts.strict_imports, document_name);
        read_switch(compile, "warnings_as_errors", opts.warnings_as_errors, document_name);
    }
    return config;
}

tool_config load_tool_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw compile_error("Cannot open config file " + path);
    } catch (const YAML::ParserException& e) {
        throw invalid_declaration("config file", e.msg,
                                  source_position{path, e.mark.line + 1, e.mark.column + 1});
    }
    return parse_tool_config(root, path);
}

} // namespace libctdi
