#ifndef COLOURGEN_RESOLVER_HPP
#define COLOURGEN_RESOLVER_HPP

#include <colourgen/brewer_table.hpp>
#include <colourgen/config.hpp>
#include <colourgen/descriptor.hpp>
#include <colourgen/http_client.hpp>
#include <colourgen/image_decoder.hpp>
#include <colourgen/named_ramps.hpp>
#include <colourgen/palette.hpp>
#include <colourgen/preview.hpp>
#include <colourgen/strategies.hpp>
#include <memory>
#include <optional>
#include <vector>

namespace colourgen {

/**
 * Outcome of resolving one descriptor to a colour function.
 */
struct Resolution {
    ColorFunction function;
    StrategyKind source = StrategyKind::Default;
    std::optional<Failure> failure;  // Set when the matched strategy failed
};

/**
 * Runs the fixed-priority strategy chain:
 *   1. colour list            -> VectorStrategy
 *   2. base ramp name         -> NamedRampStrategy (Base)
 *   3. perceptual ramp name   -> NamedRampStrategy (Perceptual)
 *   4. palette table key      -> CategoricalTableStrategy
 *   5. remote id              -> RemoteIdStrategy
 *   6. image location         -> ImageStrategy
 *   7. anything else          -> DefaultStrategy
 * The first strategy that accepts the descriptor is the only one tried. If
 * it fails the default function is used; there is no backtracking.
 */
class PaletteResolver {
private:
    ResolverConfig config_;
    const BrewerTable& table_;
    const NamedRampRegistry& registry_;
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<const ImageDecoder> decoder_;
    std::shared_ptr<const PreviewRenderer> renderer_;
    std::vector<std::unique_ptr<ColorStrategy>> strategies_;

public:
    /**
     * Null collaborators are replaced by the built-in implementations:
     * CurlHttpTransport, LibImageDecoder and SvgSwatchRenderer.
     * Throws ConfigurationError if the palette table cannot be loaded.
     */
    explicit PaletteResolver(ResolverConfig config = {},
                             std::shared_ptr<HttpTransport> transport = nullptr,
                             std::shared_ptr<const ImageDecoder> decoder = nullptr,
                             std::shared_ptr<const PreviewRenderer> renderer = nullptr);

    PaletteResolver(const PaletteResolver&) = delete;
    PaletteResolver& operator=(const PaletteResolver&) = delete;

    ColorDescriptor classify(const ColourInput& input) const;

    // Never fails; falls back to the default function
    Resolution resolve(const ColorDescriptor& descriptor, bool orange_blue) const;

    /**
     * Classify, resolve and sample. Throws std::invalid_argument when
     * options.n is 0; no descriptor value causes an error.
     */
    Palette make_palette(const ColourInput& colour = {}, const PaletteOptions& options = {}) const;

    const ResolverConfig& config() const { return config_; }
};

/**
 * Process-wide resolver with the default configuration, created on first use.
 */
const PaletteResolver& default_resolver();

// make_palette on the default resolver
Palette make_palette(const ColourInput& colour = {}, const PaletteOptions& options = {});

} // namespace colourgen

#endif // COLOURGEN_RESOLVER_HPP
