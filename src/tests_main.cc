#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest.h>

#include "util/log.hpp"

int
main(int argc, char** argv) {
    // Engine diagnostics would drown the test report.
    fuzzpatch::log_set_level(fuzzpatch::LogLevel::kQuiet);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
