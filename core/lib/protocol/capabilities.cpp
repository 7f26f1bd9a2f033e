// ngdef/protocol/capabilities.cpp
#include "ngdef/protocol/capabilities.hpp"

namespace ngdef
{

using json = nlohmann::json;

json initialize_result()
{
  json caps;
  caps["definitionProvider"] = true;

  return json{
    {"capabilities", caps},
    {"serverInfo", json{{"name", k_server_name}, {"version", k_server_version}}},
  };
}

bool is_valid_initialize_params(const json & params)
{
  if (!params.is_object()) {
    return false;
  }
  // Members of ClientCapabilities are all optional and never consulted.
  const auto caps = params.find("capabilities");
  return caps != params.end() && caps->is_object();
}

}  // namespace ngdef
