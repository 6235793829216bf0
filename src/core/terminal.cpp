#include <cowgnition/core/terminal.hpp>

#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#define COWGNITION_ISATTY _isatty
#define COWGNITION_FILENO _fileno
#else
#include <unistd.h>
#define COWGNITION_ISATTY isatty
#define COWGNITION_FILENO fileno
#endif

namespace cowgnition {

bool IsTerminal(int fd) {
    return fd >= 0 && COWGNITION_ISATTY(fd) != 0;
}

bool IsStderrTty() {
    return IsTerminal(COWGNITION_FILENO(stderr));
}

bool IsStdinTty() {
    return IsTerminal(COWGNITION_FILENO(stdin));
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool ResolveLogColor(bool force_color, bool force_no_color) {
    if (force_no_color || NoColorEnvSet()) {
        return false;
    }
    return force_color || IsStderrTty();
}

} // namespace cowgnition
