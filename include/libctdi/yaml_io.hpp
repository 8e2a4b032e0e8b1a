#pragma once

/// @file yaml_io.hpp
/// Scanner documents in, wiring plans out.
///
/// A scan document is a map with optional `components`, `modules` and
/// `warnings` sequences.  Type references are either a plain string
/// (name only) or a map `{name, origin, args}`.  Source positions are a
/// "file:line:column" string or a map `{file, line, column}`.  Malformed
/// documents raise invalid_declaration pointing into the document.

#include "export.hpp"
#include "declaration.hpp"
#include "descriptor.hpp"

#include <yaml-cpp/yaml.h>

#include <string>
#include <string_view>

namespace libctdi {

LIBCTDI_EXPORT scan_result parse_scan_result(const YAML::Node& document,
                                             const std::string& document_name = "<input>");

/// Read and parse a scan document from disk.
LIBCTDI_EXPORT scan_result load_scan_result(const std::string& path);

LIBCTDI_EXPORT scan_result load_scan_result_from_string(std::string_view text,
                                                        const std::string& document_name = "<string>");

/// Emit `components` (in plan order) and `warnings`.
LIBCTDI_EXPORT void write_plan(YAML::Emitter& out, const compile_result& result);

LIBCTDI_EXPORT std::string plan_to_yaml(const compile_result& result);

} // namespace libctdi
