// scoped_output.cpp
//
// Demonstrates scope rendering. When the host asks for scopes, every record
// lists the active scopes, outermost first, on its own line:
//
//   info: App.Service[7]
//         => request:42 => step=validate
//         Validating order 1001
//
// Compile: g++ -std=c++11 -I include examples/scoped_output.cpp -o scoped_output -pthread

#include "redirect_log.hpp"
#include <memory>

int main() {
    relog::StdoutOutput output;

    relog::LoggingBuilder builder;
    auto options = std::make_shared<relog::SimpleConsoleFormatterOptions>();
    options->includeScopes = true;
    builder.services().simpleConsoleOptions = options;

    relog::withTestLogging(builder, output);
    auto factory = builder.build();
    auto logger = factory->createLogger("App.Service");

    {
        auto request = logger->beginScope("request:42");
        logger->log(relog::LogLevel::INFO, 7, "Handling request");

        {
            auto step = logger->beginScope({{"step", "validate"}});
            logger->log(relog::LogLevel::INFO, 7, "Validating order {id}", 1001);
        }

        logger->log(relog::LogLevel::INFO, 7, "Request complete");
    }

    logger->info("No scopes here");
    return 0;
}
