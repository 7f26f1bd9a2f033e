// ngdef/syntax/queries.hpp - Structural queries used by the definition resolver
#pragma once

#include <string_view>

namespace ngdef::syntax
{

// JavaScript: `vm.<name>` member accesses inside a template expression.
inline constexpr std::string_view k_vm_member_query = R"scm(
(member_expression
  object: (identifier) @object
  property: (property_identifier) @property
  (#eq? @object "vm"))
)scm";

// TypeScript: class field declarations (`save = ...;`, `public save: T;`).
inline constexpr std::string_view k_public_field_query = R"scm(
(public_field_definition
  name: (property_identifier) @name) @definition
)scm";

// Capture names
inline constexpr std::string_view k_capture_property = "property";
inline constexpr std::string_view k_capture_name = "name";
inline constexpr std::string_view k_capture_definition = "definition";

}  // namespace ngdef::syntax
