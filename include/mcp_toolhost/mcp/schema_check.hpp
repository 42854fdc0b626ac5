#pragma once

#include <mcp_toolhost/core/result.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace mcp_toolhost {

// Check tools/call arguments against a tool's inputSchema.
//
// Shallow: required-property presence and the primitive "type"
// of each declared property. Nested schemas, formats, enums and ranges are
// left to the handler. Unknown type names pass.
Result<void, std::string> CheckArguments(const nlohmann::json& schema,
                                         const nlohmann::json& arguments);

} // namespace mcp_toolhost
