#pragma once

namespace cowgnition {

/// Returns true if the given file descriptor is connected to a terminal.
bool IsTerminal(int fd);

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if stdin is a terminal. The stdio transport warns when it
/// is, since an MCP client normally pipes messages in.
bool IsStdinTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Decide whether log output to stderr should be colored.
bool ResolveLogColor(bool force_color, bool force_no_color);

} // namespace cowgnition
