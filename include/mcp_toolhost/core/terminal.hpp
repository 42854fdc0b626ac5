#pragma once

namespace mcp_toolhost {

/// True when stderr, where the console log sink writes, is a terminal.
bool IsStderrTty();

/// Decide whether console logs are colored. --no-color beats --color, an
/// explicit flag beats NO_COLOR, and otherwise stderr must be a terminal.
bool ResolveLogColor(bool force_color, bool force_no_color);

} // namespace mcp_toolhost
