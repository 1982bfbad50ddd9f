// tests/test_main.cpp
//
// IMPORTANT:
//   This must be the ONLY translation unit in the test executable that defines
//   DOCTEST_CONFIG_IMPLEMENT (or DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN).
//   All other test .cpp files should just include doctest WITHOUT those macros.
//
// We use DOCTEST_CONFIG_IMPLEMENT (instead of ...WITH_MAIN) so we can customize
// defaults and still support doctest command-line flags.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

#include <cstdlib> // std::getenv
#include <cstring> // std::strcmp

#include <spdlog/spdlog.h>

namespace {

bool env_truthy(const char* v) {
    // Any non-empty value except "0" counts as true.
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

bool running_in_ci() {
    return env_truthy(std::getenv("CI")) ||
           env_truthy(std::getenv("GITHUB_ACTIONS"));
}

} // namespace

int main(int argc, char** argv) {
    doctest::Context context;

    // ----- defaults (can be overridden by CLI flags) -----
    context.setOption("order-by", "name");  // deterministic ordering
    context.setOption("duration", true);    // show timings (helps spot slow tests)

    if (running_in_ci()) {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    // Config tests hit the fallback paths on purpose; keep their warnings out of the report.
    // HEXMAP_TEST_LOG=1 restores them.
    if (!env_truthy(std::getenv("HEXMAP_TEST_LOG")))
        spdlog::set_level(spdlog::level::err);

    context.applyCommandLine(argc, argv);

    const int res = context.run();

    // --help / --version etc.
    if (context.shouldExit())
        return res;

    return res;
}
