#include <mcpfs/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace mcpfs {

bool IsTerminal(int fd) {
    return isatty(fd) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool ResolveColor(int fd, bool force_color, bool force_no_color) {
    if (force_no_color || NoColorEnvSet()) {
        return false;
    }
    return force_color || IsTerminal(fd);
}

} // namespace mcpfs
