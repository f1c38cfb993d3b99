#include <colourgen/brewer_table.hpp>
#include <colourgen/debug_log.hpp>
#include <colourgen/named_ramps.hpp>
#include <colourgen/resolver.hpp>
#include <algorithm>
#include <cctype>
#include <climits>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace colourgen;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] [colour...]\n"
              << "\n"
              << "  colour            ramp name, palette table key, palette id, image path/URL,\n"
              << "                    or two or more colours to interpolate\n"
              << "\n"
              << "Options:\n"
              << "  -n N              number of colours (default 7)\n"
              << "  --reverse         reverse the order\n"
              << "  --shuffle         deterministic shuffle (takes precedence over --reverse)\n"
              << "  --earth           earth->emerald default instead of orange->blue\n"
              << "  --svg FILE        write an SVG swatch preview\n"
              << "  --host HOST       palette service host\n"
              << "  --port PORT       palette service port\n"
              << "  --timeout MS      fetch timeout in milliseconds\n"
              << "  --no-perceptual   disable viridis/magma/plasma/inferno/cividis\n"
              << "  --list            list palette table keys and ramp names\n"
              << "  --verbose         report the strategy used and any fallback\n"
              << "  -h, --help        show this message\n";
}

void print_names() {
    const BrewerTable& table = BrewerTable::instance();
    for (BrewerFamily family : {BrewerFamily::Sequential, BrewerFamily::Diverging, BrewerFamily::Qualitative}) {
        std::cout << brewer_family_name(family) << ":";
        for (const auto& name : table.names_in_family(family)) {
            std::cout << " " << name;
        }
        std::cout << "\n";
    }
    const NamedRampRegistry& registry = NamedRampRegistry::instance();
    for (RampFamily family : {RampFamily::Base, RampFamily::Perceptual}) {
        std::cout << ramp_family_name(family) << " ramps:";
        for (const auto& name : registry.names(family)) {
            std::cout << " " << name;
        }
        std::cout << "\n";
    }
}

bool all_digits(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

ColourInput to_input(const std::vector<std::string>& args) {
    if (args.empty()) {
        return ColourInput();
    }
    if (args.size() > 1) {
        return ColourInput(args);
    }
    if (all_digits(args.front())) {
        try {
            return ColourInput(static_cast<int64_t>(std::stoll(args.front())));
        } catch (const std::out_of_range&) {
            // Too large for an id; treat as text
        }
    }
    return ColourInput(args.front());
}

// Non-negative decimal only; std::stoul would accept "-5"
unsigned long parse_count(const std::string& text, const char* flag) {
    if (!all_digits(text)) {
        throw std::invalid_argument(std::string(flag) + " expects a non-negative integer, got '" + text + "'");
    }
    return std::stoul(text);
}

void stderr_debug_sink(const char* message) {
    std::cerr << message << "\n";
}

// Keeps stdout limited to the colour list
void discard_debug_sink(const char*) {}

} // namespace

int main(int argc, char* argv[]) {
    ResolverConfig config;
    PaletteOptions options;
    std::string svg_file;
    bool list = false;
    bool verbose = false;
    std::vector<std::string> colours;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "-n" && i + 1 < argc) {
                options.n = parse_count(argv[++i], "-n");
            } else if (arg == "--reverse") {
                options.reverse = true;
            } else if (arg == "--shuffle") {
                options.shuffle = true;
            } else if (arg == "--earth") {
                options.orange_blue_default = false;
            } else if (arg == "--svg" && i + 1 < argc) {
                svg_file = argv[++i];
                options.render_preview = true;
            } else if (arg == "--host" && i + 1 < argc) {
                config.service_host = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                unsigned long port = parse_count(argv[++i], "--port");
                if (port == 0 || port > 65535) {
                    throw std::invalid_argument("--port out of range");
                }
                config.service_port = static_cast<uint16_t>(port);
            } else if (arg == "--timeout" && i + 1 < argc) {
                unsigned long timeout = parse_count(argv[++i], "--timeout");
                config.fetch_timeout = std::chrono::milliseconds(
                    std::min<unsigned long>(timeout, static_cast<unsigned long>(INT_MAX)));
            } else if (arg == "--no-perceptual") {
                config.enable_perceptual_ramps = false;
            } else if (arg == "--list") {
                list = true;
            } else if (arg == "--verbose") {
                verbose = true;
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Unknown or incomplete option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            } else {
                colours.push_back(arg);
            }
        }
        if (options.n == 0) {
            throw std::invalid_argument("-n must be at least 1");
        }
    } catch (const std::logic_error& e) {
        // std::invalid_argument and std::out_of_range from the number parsers
        std::cerr << "Invalid argument: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    debug::ScopedDebugCallback debug_sink(verbose ? stderr_debug_sink : discard_debug_sink);

    try {
        if (list) {
            print_names();
            return 0;
        }

        PaletteResolver resolver(config);
        Palette palette = resolver.make_palette(to_input(colours), options);

        for (const auto& hex : palette.hex_strings()) {
            std::cout << hex << "\n";
        }

        if (verbose) {
            std::cerr << "strategy: " << strategy_kind_name(palette.source()) << "\n";
            if (palette.fallback()) {
                std::cerr << "fallback: " << palette.fallback()->to_string() << "\n";
            }
        }

        if (!svg_file.empty() && palette.preview()) {
            std::ofstream out(svg_file);
            if (!out) {
                std::cerr << "Failed to write: " << svg_file << "\n";
                return 1;
            }
            out << palette.preview()->content;
        }
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }
    return 0;
}
