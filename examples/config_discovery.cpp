// config_discovery.cpp
//
// Demonstrates how scope rendering is discovered from configuration when no
// formatter options are registered. Logging:Console:IncludeScopes is read
// first, then Logging:IncludeScopes. Environment variables such as
// RELOG_Logging__IncludeScopes=true override the JSON file.
//
// Compile: g++ -std=c++11 -I include examples/config_discovery.cpp -o config_discovery -pthread

#include "redirect_log.hpp"
#include <iostream>
#include <memory>

int main(int argc, char **argv) {
    auto root = std::make_shared<relog::ConfigurationRoot>();
    if (argc > 1) {
        root->add(std::make_shared<relog::JsonConfiguration>(relog::JsonConfiguration::fromFile(argv[1])));
    } else {
        root->add(std::make_shared<relog::JsonConfiguration>(relog::JsonConfiguration::fromString(
            R"({"Logging": {"Console": {"IncludeScopes": true}, "IncludeScopes": false}})")));
    }
    root->add(std::make_shared<relog::EnvironmentConfiguration>("RELOG_"));

    relog::LoggingBuilder builder;
    builder.services().configuration = root;

    relog::StdoutOutput output;
    auto provider = relog::withTestLogging(builder, output);
    std::cout << "scopes " << (provider->includesScopes() ? "enabled" : "disabled") << '\n';

    auto factory = builder.build();
    auto logger = factory->createLogger("Config.Demo");
    auto scope = logger->beginScope("job:nightly");
    logger->info("Scope line shown only when enabled");
    return 0;
}
