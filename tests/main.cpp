#include <gtest/gtest.h>
#include <colourgen/brewer_table.hpp>
#include <colourgen/debug_log.hpp>
#include <colourgen/errors.hpp>
#include <iostream>

namespace {

void debug_to_stderr(const char* message) {
    std::cerr << message << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Keep gtest's stdout report readable when debug output is compiled in
    colourgen::debug::set_debug_callback(debug_to_stderr);

    std::cout << "=== colourgen Test Suite ===" << std::endl;
    try {
        std::cout << "Palette table: " << colourgen::BrewerTable::instance().size() << " entries" << std::endl;
    } catch (const colourgen::ConfigurationError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    std::cout << "Running bottom-up component tests..." << std::endl;

    return RUN_ALL_TESTS();
}
