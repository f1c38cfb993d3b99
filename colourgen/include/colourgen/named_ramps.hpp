#ifndef COLOURGEN_NAMED_RAMPS_HPP
#define COLOURGEN_NAMED_RAMPS_HPP

#include <colourgen/color.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace colourgen {

/**
 * Families of built-in scientific ramps. Families are consulted in
 * declaration order; Perceptual is optional and can be switched off.
 */
enum class RampFamily {
    Base,        // grDevices: rainbow, heat.colors, terrain.colors, ...
    Perceptual   // viridis, magma, plasma, inferno, cividis
};

inline const char* ramp_family_name(RampFamily family) {
    switch (family) {
        case RampFamily::Base: return "base";
        case RampFamily::Perceptual: return "perceptual";
        default: return "unknown";
    }
}

struct NamedRamp {
    const char* name;
    RampFamily family;
    ColorFunction function;
};

/**
 * Fixed enumeration of named continuous ramps. Names are case-sensitive.
 */
class NamedRampRegistry {
private:
    std::vector<NamedRamp> ramps_;

    NamedRampRegistry();

public:
    static const NamedRampRegistry& instance();

    const NamedRamp* find(std::string_view name) const;

    // Family of a recognised name, regardless of whether the family is enabled
    std::optional<RampFamily> family_of(std::string_view name) const {
        const NamedRamp* ramp = find(name);
        if (!ramp) {
            return std::nullopt;
        }
        return ramp->family;
    }

    std::vector<std::string> names(RampFamily family) const;
    const std::vector<NamedRamp>& ramps() const { return ramps_; }
};

// Individual ramps, exposed for direct use and testing
Color rainbow_ramp(double t);
Color heat_ramp(double t);
Color terrain_ramp(double t);
Color topo_ramp(double t);
Color cm_ramp(double t);
Color gray_ramp(double t);

} // namespace colourgen

#endif // COLOURGEN_NAMED_RAMPS_HPP
