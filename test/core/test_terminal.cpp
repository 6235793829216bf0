#include <catch2/catch_test_macros.hpp>

#include <cowgnition/core/terminal.hpp>

#include <cstdlib>

using namespace cowgnition;

namespace {

void SetNoColor(bool set) {
#ifdef _WIN32
    _putenv_s("NO_COLOR", set ? "1" : "");
#else
    if (set) {
        setenv("NO_COLOR", "1", 1);
    } else {
        unsetenv("NO_COLOR");
    }
#endif
}

} // anonymous namespace

TEST_CASE("IsTerminal: invalid descriptor is not a terminal", "[core][terminal]") {
    CHECK_FALSE(IsTerminal(-1));
}

TEST_CASE("ResolveLogColor: --no-color always wins", "[core][terminal]") {
    CHECK_FALSE(ResolveLogColor(true, true));
    CHECK_FALSE(ResolveLogColor(false, true));
}

TEST_CASE("ResolveLogColor: NO_COLOR disables forced color", "[core][terminal]") {
    SetNoColor(true);
    CHECK(NoColorEnvSet());
    CHECK_FALSE(ResolveLogColor(true, false));
    SetNoColor(false);
    CHECK_FALSE(NoColorEnvSet());
}

TEST_CASE("ResolveLogColor: --color forces color without NO_COLOR", "[core][terminal]") {
    SetNoColor(false);
    CHECK(ResolveLogColor(true, false));
}

TEST_CASE("ResolveLogColor: auto mode follows stderr", "[core][terminal]") {
    SetNoColor(false);
    CHECK(ResolveLogColor(false, false) == IsStderrTty());
}
