#ifndef COLOURGEN_PALETTE_HPP
#define COLOURGEN_PALETTE_HPP

#include <colourgen/color.hpp>
#include <colourgen/config.hpp>
#include <colourgen/errors.hpp>
#include <colourgen/preview.hpp>
#include <colourgen/strategies.hpp>
#include <optional>
#include <string>
#include <vector>

namespace colourgen {

/**
 * The result of make_palette: exactly options().n colours, the options that
 * produced them, the strategy whose function was sampled and, when the
 * requested source could not be used, the failure that caused the fallback.
 */
class Palette {
private:
    std::vector<Color> colors_;
    PaletteOptions options_;
    StrategyKind source_;
    std::optional<Failure> fallback_;
    std::optional<Preview> preview_;

public:
    Palette(std::vector<Color> colors,
            PaletteOptions options,
            StrategyKind source,
            std::optional<Failure> fallback = std::nullopt,
            std::optional<Preview> preview = std::nullopt)
        : colors_(std::move(colors)),
          options_(options),
          source_(source),
          fallback_(std::move(fallback)),
          preview_(std::move(preview)) {}

    const std::vector<Color>& colors() const { return colors_; }
    std::size_t size() const { return colors_.size(); }
    const Color& operator[](std::size_t i) const { return colors_[i]; }
    auto begin() const { return colors_.begin(); }
    auto end() const { return colors_.end(); }

    const PaletteOptions& options() const { return options_; }
    StrategyKind source() const { return source_; }

    bool used_fallback() const { return fallback_.has_value(); }
    const std::optional<Failure>& fallback() const { return fallback_; }

    const std::optional<Preview>& preview() const { return preview_; }

    std::vector<std::string> hex_strings() const { return to_hex_strings(colors_); }
};

} // namespace colourgen

#endif // COLOURGEN_PALETTE_HPP
