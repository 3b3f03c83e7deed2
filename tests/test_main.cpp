// tests/test_main.cpp
//
// The only translation unit in tribe_tests that defines DOCTEST_CONFIG_IMPLEMENT.
// All other test .cpp files include doctest without implementation macros.
//
// DOCTEST_CONFIG_IMPLEMENT (instead of ...WITH_MAIN) so defaults can be set
// here and still be overridden from the command line.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#undef DOCTEST_CONFIG_IMPLEMENT

#include <spdlog/spdlog.h>

#include <cstdlib> // std::getenv
#include <cstring> // std::strcmp

namespace {

bool env_truthy(const char* v) {
    // Any non-empty value except "0".
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

bool running_in_ci() {
    return env_truthy(std::getenv("CI")) ||
           env_truthy(std::getenv("GITHUB_ACTIONS")) ||
           env_truthy(std::getenv("TF_BUILD"));
}

} // namespace

int main(int argc, char** argv) {
    // Engine code logs repairs and advisor fallbacks at warn level; keep test
    // output to real problems unless TRIBE_TEST_LOG is set.
    spdlog::set_level(env_truthy(std::getenv("TRIBE_TEST_LOG")) ? spdlog::level::debug
                                                                : spdlog::level::err);

    doctest::Context context;

    context.setOption("order-by", "name");        // deterministic ordering
    context.setOption("duration", true);          // show timings
    context.setOption("no-path-filenames", true);

    if (running_in_ci()) {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    context.applyCommandLine(argc, argv);

    const int res = context.run();

    // --help / --version etc.
    if (context.shouldExit())
        return res;

    return res;
}
