#include <colourgen/preview.hpp>
#include <iomanip>
#include <sstream>

namespace colourgen {

Preview SvgSwatchRenderer::render(const std::vector<Color>& colors) const {
    const double width = layout_.bar_width * static_cast<double>(colors.size());
    const double height = layout_.bar_height + layout_.label_height;

    std::ostringstream svg;
    svg << std::fixed << std::setprecision(1);
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << width
        << "\" height=\"" << height << "\" viewBox=\"0 0 " << width << " " << height << "\">\n";
    svg << "  <rect x=\"0\" y=\"0\" width=\"" << width << "\" height=\"" << height
        << "\" fill=\"" << BACKGROUND << "\"/>\n";

    for (std::size_t i = 0; i < colors.size(); ++i) {
        const std::string hex = colors[i].hex();
        const double x = layout_.bar_width * static_cast<double>(i);
        svg << "  <rect class=\"bar\" x=\"" << x << "\" y=\"0\" width=\"" << layout_.bar_width
            << "\" height=\"" << layout_.bar_height << "\" fill=\"" << hex
            << "\" stroke=\"none\"/>\n";

        // Anchored at the bar centre just below it, reading bottom to top
        const double lx = x + layout_.bar_width / 2.0 + layout_.font_size / 3.0;
        const double ly = layout_.bar_height + layout_.label_height - 4.0;
        svg << "  <text class=\"label\" x=\"" << lx << "\" y=\"" << ly
            << "\" font-family=\"monospace\" font-size=\"" << layout_.font_size
            << "\" transform=\"rotate(-90 " << lx << " " << ly << ")\">" << hex << "</text>\n";
    }

    svg << "</svg>\n";
    return Preview{"image/svg+xml", svg.str()};
}

} // namespace colourgen
