#include <catch2/catch_session.hpp>

#include "gw/core/Logger.hpp"

int main(int argc, char* argv[]) {
    // Core and content log every scene change; keep test output readable.
    gw::core::Logger::SetMinimumLevel(gw::core::LogLevel::Warning);
    gw::core::Logger::SetDebugEnabled(false);

    Catch::Session session;
    const int returnCode = session.applyCommandLine(argc, argv);
    if (returnCode != 0) {
        return returnCode;
    }
    return session.run();
}
