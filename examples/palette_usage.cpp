/**
 * Palette Usage Example
 *
 * Demonstrates the descriptor kinds accepted by make_palette:
 * - Named ramps and palette table keys
 * - Explicit colour lists
 * - Order transforms and the fallback default
 */

#include <colourgen/resolver.hpp>
#include <iostream>

namespace {

void print_palette(const std::string& title, const colourgen::Palette& palette) {
    std::cout << title << " [" << colourgen::strategy_kind_name(palette.source()) << "]:";
    for (const auto& hex : palette.hex_strings()) {
        std::cout << " " << hex;
    }
    std::cout << "\n";
    if (palette.fallback()) {
        std::cout << "  fell back: " << palette.fallback()->to_string() << "\n";
    }
}

} // namespace

int main() {
    using colourgen::make_palette;
    using colourgen::PaletteOptions;

    std::cout << "=== Palette Usage Example ===\n\n";

    // Example 1: Default ramps
    std::cout << "=== Example 1: Defaults ===\n";
    print_palette("orange-blue", make_palette());
    PaletteOptions earth;
    earth.orange_blue_default = false;
    print_palette("earth-emerald", make_palette({}, earth));
    std::cout << "\n";

    // Example 2: Named ramps and table keys
    std::cout << "=== Example 2: Named Sources ===\n";
    PaletteOptions five;
    five.n = 5;
    print_palette("rainbow", make_palette("rainbow", five));
    print_palette("viridis", make_palette("viridis", five));
    print_palette("spectral", make_palette("spectral", five));
    std::cout << "\n";

    // Example 3: Interpolating an explicit list
    std::cout << "=== Example 3: Colour List ===\n";
    print_palette("red-white-blue", make_palette({"red", "#FFFFFF", "#0000FF"}, five));
    std::cout << "\n";

    // Example 4: Order transforms
    std::cout << "=== Example 4: Reverse and Shuffle ===\n";
    PaletteOptions reversed = five;
    reversed.reverse = true;
    print_palette("Blues reversed", make_palette("Blues", reversed));
    PaletteOptions shuffled = five;
    shuffled.shuffle = true;
    print_palette("Blues shuffled", make_palette("Blues", shuffled));
    std::cout << "\n";

    // Example 5: Unresolvable source
    std::cout << "=== Example 5: Fallback ===\n";
    print_palette("missing file", make_palette("no/such/image.png", five));

    return 0;
}
