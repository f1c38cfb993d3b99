#ifndef COLOURGEN_PREVIEW_HPP
#define COLOURGEN_PREVIEW_HPP

#include <colourgen/color.hpp>
#include <string>
#include <vector>

namespace colourgen {

/**
 * A rendered preview of a colour sequence.
 */
struct Preview {
    std::string mime_type;
    std::string content;
};

class PreviewRenderer {
public:
    virtual ~PreviewRenderer() = default;
    virtual Preview render(const std::vector<Color>& colors) const = 0;
};

/**
 * SVG bar swatch: neutral grey background, one unit-wide bar per colour with
 * no border or spacing, hex label rotated vertically beneath each bar.
 */
class SvgSwatchRenderer : public PreviewRenderer {
public:
    struct Layout {
        double bar_width = 40.0;
        double bar_height = 120.0;
        double label_height = 70.0;
        double font_size = 12.0;
    };

private:
    Layout layout_;

public:
    SvgSwatchRenderer() = default;
    explicit SvgSwatchRenderer(Layout layout) : layout_(layout) {}

    Preview render(const std::vector<Color>& colors) const override;

    static constexpr const char* BACKGROUND = "#BFBFBF";
};

} // namespace colourgen

#endif // COLOURGEN_PREVIEW_HPP
