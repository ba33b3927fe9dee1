#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "util/paths.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        ds::paths::setLogPathForTesting();
        ds::config::ConfigRegistry::init(ds::config::Config{});
        ds::log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize docshare test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
