#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "spdlog/spdlog.h"

// Shared by objcx_unittests and objcx_runtime_unittests.
int main(int argc, char* argv[]) {
    // Tests that expect failures use a suppressed ErrorReporter, but the runtime bindings still log directly.
    spdlog::set_level(spdlog::level::critical);
    doctest::Context context;
    context.applyCommandLine(argc, argv);
    int res = context.run();
    return res;
}
