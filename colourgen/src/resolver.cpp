#include <colourgen/resolver.hpp>
#include <colourgen/debug_log.hpp>
#include <colourgen/sampler.hpp>
#include <stdexcept>

namespace colourgen {

PaletteResolver::PaletteResolver(ResolverConfig config,
                                 std::shared_ptr<HttpTransport> transport,
                                 std::shared_ptr<const ImageDecoder> decoder,
                                 std::shared_ptr<const PreviewRenderer> renderer)
    : config_(std::move(config)),
      table_(BrewerTable::instance()),
      registry_(NamedRampRegistry::instance()),
      transport_(transport ? std::move(transport) : std::make_shared<CurlHttpTransport>()),
      decoder_(decoder ? std::move(decoder) : std::make_shared<LibImageDecoder>(config_.image_max_pixels)),
      renderer_(renderer ? std::move(renderer) : std::make_shared<SvgSwatchRenderer>()) {
    strategies_.push_back(std::make_unique<VectorStrategy>());
    strategies_.push_back(std::make_unique<NamedRampStrategy>(registry_, RampFamily::Base));
    strategies_.push_back(std::make_unique<NamedRampStrategy>(
        registry_, RampFamily::Perceptual, config_.enable_perceptual_ramps));
    strategies_.push_back(std::make_unique<CategoricalTableStrategy>(table_));
    strategies_.push_back(std::make_unique<RemoteIdStrategy>(transport_, config_));
    strategies_.push_back(std::make_unique<ImageStrategy>(transport_, decoder_, config_));
}

ColorDescriptor PaletteResolver::classify(const ColourInput& input) const {
    ColorDescriptor descriptor = colourgen::classify(input, table_, registry_);
    COLOURGEN_DEBUG_LOG("Classified input as %s", descriptor_kind_name(descriptor));
    return descriptor;
}

Resolution PaletteResolver::resolve(const ColorDescriptor& descriptor, bool orange_blue) const {
    Resolution resolution;
    std::optional<ColorFunction> function;

    for (const auto& strategy : strategies_) {
        if (!strategy->accepts(descriptor)) {
            continue;
        }
        Result<ColorFunction> result = strategy->try_resolve(descriptor, orange_blue);
        function = result.or_else([&](const Failure& failure) {
            COLOURGEN_DEBUG_LOG("%s strategy failed (%s), using default",
                                strategy_kind_name(strategy->kind()), failure.to_string().c_str());
            resolution.failure = failure;
            return DefaultStrategy::function(orange_blue);
        });
        resolution.source = result.ok() ? strategy->kind() : StrategyKind::Default;
        break;
    }

    if (!function) {
        function = DefaultStrategy::function(orange_blue);
        resolution.source = StrategyKind::Default;
    }
    resolution.function = std::move(*function);
    return resolution;
}

Palette PaletteResolver::make_palette(const ColourInput& colour, const PaletteOptions& options) const {
    // Checked before any fetch
    if (options.n == 0) {
        throw std::invalid_argument("Palette size must be at least 1");
    }

    Resolution resolution = resolve(classify(colour), options.orange_blue_default);
    std::vector<Color> colors = sample(resolution.function, options.n, options.reverse, options.shuffle);

    std::optional<Preview> preview;
    if (options.render_preview) {
        preview = renderer_->render(colors);
    }

    COLOURGEN_DEBUG_LOG("Palette of %zu colours from %s strategy",
                        colors.size(), strategy_kind_name(resolution.source));
    return Palette(std::move(colors), options, resolution.source,
                   std::move(resolution.failure), std::move(preview));
}

const PaletteResolver& default_resolver() {
    static const PaletteResolver resolver;
    return resolver;
}

Palette make_palette(const ColourInput& colour, const PaletteOptions& options) {
    return default_resolver().make_palette(colour, options);
}

} // namespace colourgen
