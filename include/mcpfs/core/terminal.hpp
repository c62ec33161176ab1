#pragma once

namespace mcpfs {

/// Returns true if the given file descriptor is connected to a terminal.
bool IsTerminal(int fd);

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Decide whether output on `fd` should be colored.
/// --no-color and NO_COLOR win over --color; otherwise color iff `fd` is a TTY.
bool ResolveColor(int fd, bool force_color, bool force_no_color);

} // namespace mcpfs
