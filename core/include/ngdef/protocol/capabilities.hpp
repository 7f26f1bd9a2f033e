// ngdef/protocol/capabilities.hpp - Static initialize response
#pragma once

#include <nlohmann/json.hpp>

namespace ngdef
{

inline constexpr const char * k_server_name = "ngdef-ls";
inline constexpr const char * k_server_version = "0.1.0";

/// `{capabilities:{definitionProvider:true}, serverInfo:{name, version}}`
[[nodiscard]] nlohmann::json initialize_result();

/**
 * Check the structural shape of `initialize` params.
 *
 * Requires `capabilities` to be an object. Its members are optional and
 * not consulted.
 */
[[nodiscard]] bool is_valid_initialize_params(const nlohmann::json & params);

}  // namespace ngdef
