// redirect_to_stdout.cpp
//
// Demonstrates replacing an application's log providers with a provider
// that writes every record to the test runner's output (stdout here).
//
// Compile: g++ -std=c++11 -I include examples/redirect_to_stdout.cpp -o redirect_to_stdout -pthread

#include "redirect_log.hpp"
#include <stdexcept>

int main() {
    relog::StdoutOutput output;

    relog::LoggingBuilder builder;
    relog::withTestLogging(builder, output);
    auto factory = builder.build();

    auto logger = factory->createLogger("App.Startup");
    logger->info("Listening on {url}", "http://localhost:5000");
    logger->log(relog::LogLevel::WARN, 12, "Config key {key} missing, using default", "Cache:Size");

    try {
        throw std::runtime_error("database unreachable");
    } catch (const std::exception &ex) {
        logger->log(relog::LogLevel::ERROR, 500, ex, "Health check failed");
    }

    // Never written: NONE is not an enabled level.
    logger->log(relog::LogLevel::NONE, 0, "silent");
    return 0;
}
