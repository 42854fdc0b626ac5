#include <mcp_toolhost/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace mcp_toolhost {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) == 1;
}

bool ResolveLogColor(bool force_color, bool force_no_color) {
    if (force_no_color) {
        return false;
    }
    if (force_color) {
        return true;
    }
    // https://no-color.org/: any value, even empty, disables color.
    if (std::getenv("NO_COLOR") != nullptr) {
        return false;
    }
    return IsStderrTty();
}

} // namespace mcp_toolhost
